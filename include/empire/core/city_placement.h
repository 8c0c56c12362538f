#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "empire/core/entities.h"
#include "empire/core/grid.h"

namespace empire {

// Scatter up to `count` neutral cities over the land tiles of `map`.
//
// Land tiles are shuffled with the seeded generator and accepted greedily
// while their Manhattan distance to every accepted city is >= min_separation.
// Stops at `count` cities or when candidates run out. No seed means entropy.
std::vector<City> place_cities(const TileMap& map, int count, int min_separation,
                               std::optional<std::uint64_t> seed, int support_cap = 2);

} // namespace empire
