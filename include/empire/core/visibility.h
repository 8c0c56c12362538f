#pragma once

#include "empire/core/game_state.h"
#include "empire/core/unit_catalog.h"

namespace empire {

// Per-player fog of war.
//
// Each player has an `explored` grid (ever seen; only ever set) and a
// `visible` grid (in sight right now). Every function here preserves
// visible ⊆ explored. Unknown player ids are ignored.

// Allocate all-false grids for every player in `s.players`.
void init_fog(GameState& s);

// Zero one player's visible grid. Explored is untouched.
void clear_visible(GameState& s, PlayerId player);

// Mark every in-bounds tile with dx^2 + dy^2 <= radius^2 as visible and
// explored. The center may lie outside the map.
void mark_visible_circle(GameState& s, PlayerId player, int cx, int cy, int radius);

// clear_visible() followed by a circle of `city_sight_radius` around every
// city the player owns and a circle of the unit type's sight around every
// alive unit the player owns.
void recompute_visibility(GameState& s, const UnitCatalog& catalog, int city_sight_radius, PlayerId player);

bool is_explored(const GameState& s, PlayerId player, int x, int y);
bool is_visible(const GameState& s, PlayerId player, int x, int y);

} // namespace empire
