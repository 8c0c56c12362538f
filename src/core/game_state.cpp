#include "empire/core/game_state.h"

namespace empire {

Id allocate_unit_id(GameState& s) {
  if (s.next_unit_id == kInvalidId) s.next_unit_id = 1;
  return s.next_unit_id++;
}

bool is_valid_player(const GameState& s, PlayerId p) {
  return p >= 0 && p < static_cast<PlayerId>(s.players.size());
}

Unit* find_unit(GameState& s, Id id) {
  for (auto& u : s.units) {
    if (u.id == id && u.alive()) return &u;
  }
  return nullptr;
}

const Unit* find_unit(const GameState& s, Id id) {
  for (const auto& u : s.units) {
    if (u.id == id && u.alive()) return &u;
  }
  return nullptr;
}

Unit* unit_at(GameState& s, int x, int y) {
  for (auto& u : s.units) {
    if (u.alive() && u.x == x && u.y == y) return &u;
  }
  return nullptr;
}

const Unit* unit_at(const GameState& s, int x, int y) {
  for (const auto& u : s.units) {
    if (u.alive() && u.x == x && u.y == y) return &u;
  }
  return nullptr;
}

City* city_at(GameState& s, int x, int y) {
  for (auto& c : s.cities) {
    if (c.x == x && c.y == y) return &c;
  }
  return nullptr;
}

const City* city_at(const GameState& s, int x, int y) {
  for (const auto& c : s.cities) {
    if (c.x == x && c.y == y) return &c;
  }
  return nullptr;
}

int city_count(const GameState& s, PlayerId p) {
  int n = 0;
  for (const auto& c : s.cities) n += (c.owner == p) ? 1 : 0;
  return n;
}

int alive_unit_count(const GameState& s, PlayerId p) {
  int n = 0;
  for (const auto& u : s.units) n += (u.alive() && u.owner == p) ? 1 : 0;
  return n;
}

} // namespace empire
