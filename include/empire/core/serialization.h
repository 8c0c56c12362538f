#pragma once

#include <string>

#include "empire/core/game_state.h"
#include "empire/util/json.h"

namespace empire {

// Save format version written by this build.
constexpr int kCurrentSaveVersion = 1;

// Serialize the game state into an in-memory JSON document.
json::Value serialize_game_to_json_value(const GameState& state);

// Serialize the game state into a JSON text document (pretty-printed, keys
// sorted, so equal states produce identical text).
std::string serialize_game_to_json(const GameState& state);

// Parse a saved game from JSON text.
//
// Throws std::runtime_error on malformed JSON, missing or mistyped fields, or
// a state that fails validate_game_state(). Visible grids are not stored and
// come back all false; Simulation::load_game() rebuilds them.
GameState deserialize_game_from_json(const std::string& json_text);

} // namespace empire
