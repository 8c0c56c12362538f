#pragma once

#include <optional>
#include <string>
#include <vector>

#include "empire/core/game_state.h"
#include "empire/core/unit_catalog.h"

namespace empire {

// A rectangle of the map. Negative or oversize values are clipped.
struct Viewport {
  int x{0};
  int y{0};
  int width{0};
  int height{0};
};

// Whole-map viewport.
Viewport full_viewport(const TileMap& map);

// Text snapshot of a viewport, one string per row.
//
// Terrain is '.' (ocean) or '+' (land). Cities are 'O' (P1), 'X' (P2) or 'o'
// (neutral, or ownership not currently visible). Units use their catalog
// glyph, uppercase for P1 and lowercase for P2, and are drawn over cities.
//
// With an observer, unexplored tiles are blank, explored tiles out of sight
// show terrain and an 'o' for any city, and only visible tiles show units and
// city owners. Without an observer everything is drawn.
std::vector<std::string> render_snapshot(const GameState& s, const UnitCatalog& catalog, const Viewport& view,
                                         std::optional<PlayerId> observer = std::nullopt);

} // namespace empire
