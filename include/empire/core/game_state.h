#pragma once

#include <cstdint>
#include <vector>

#include "empire/core/entities.h"
#include "empire/core/grid.h"

namespace empire {

// A single save-game state.
struct GameState {
  int save_version{1};

  TileMap map;

  // Order is significant: it is the placement order and is preserved by
  // save/load.
  std::vector<City> cities;
  std::vector<Unit> units;

  // Indexed by PlayerId.
  std::vector<Player> players;
  std::vector<PlayerFog> fog;

  int turn_number{1};
  PlayerId current_player{0};

  Id next_unit_id{1};

  // splitmix64 state for combat rolls. Persisted so a loaded game rolls the
  // same dice as the game that was saved.
  std::uint64_t rng_state{0};

  VictoryState victory;

  // Rolling log, oldest first.
  std::vector<BattleReport> battle_log;
};

Id allocate_unit_id(GameState& s);

bool is_valid_player(const GameState& s, PlayerId p);

// Lookups skip dead units.
Unit* find_unit(GameState& s, Id id);
const Unit* find_unit(const GameState& s, Id id);
Unit* unit_at(GameState& s, int x, int y);
const Unit* unit_at(const GameState& s, int x, int y);

City* city_at(GameState& s, int x, int y);
const City* city_at(const GameState& s, int x, int y);

// Counted from City::owner on every call; there is no cached ownership set.
int city_count(const GameState& s, PlayerId p);

int alive_unit_count(const GameState& s, PlayerId p);

} // namespace empire
