#pragma once

#include <string>
#include <vector>

#include "empire/core/game_state.h"
#include "empire/core/unit_catalog.h"

namespace empire {

// Validate the structural invariants of a GameState.
//
// Intended for loaded saves (hand edits, truncated files) and for generated
// scenarios in tests. If `catalog` is provided, unit positions are also
// checked against each type's terrain rule.
//
// Returns human-readable error strings in a stable order.
// Empty => state is considered valid.
std::vector<std::string> validate_game_state(const GameState& s, const UnitCatalog* catalog = nullptr);

} // namespace empire
