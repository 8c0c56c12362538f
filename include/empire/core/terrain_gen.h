#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "empire/core/grid.h"

namespace empire {

// Island terrain synthesis.
//
// Pipeline: uniform noise -> 4 cellular-automaton passes on the noise field ->
// quantile threshold so roughly `land_fraction` of tiles become land -> 2
// cleanup passes on the tiles -> connectivity repair. The repair step carves
// Manhattan corridors from every secondary landmass to the largest one, so
// the result always has exactly one 4-connected land component (or none, on
// an all-ocean map).
//
// Deterministic for a given seed. With no seed the generator draws from the
// platform entropy source. land_fraction is clamped to [0, 1].
// Throws std::invalid_argument if width or height is < 1.
TileMap generate_terrain(int width, int height, std::optional<std::uint64_t> seed,
                         double land_fraction = 0.55);

// 4-connected land components in row-major discovery order. Each component
// lists its tiles in BFS order, so element 0 is the first tile found.
std::vector<std::vector<TileCoord>> land_components(const TileMap& map);

int count_land_components(const TileMap& map);

// Connect every land component to the largest one. Exposed for tests and
// for maps loaded from elsewhere; generate_terrain() already calls it.
// Returns the number of tiles converted to land.
int connect_land_components(TileMap& map);

} // namespace empire
