#pragma once

// Shared fixtures for the test runner.
//
// Individual tests use their own local EMP_ASSERT macro; this header only
// builds small hand-made game states so tests do not depend on generated
// terrain.

#include "empire/core/game_state.h"
#include "empire/core/production.h"
#include "empire/core/unit_catalog.h"
#include "empire/core/visibility.h"

namespace empire::test {

// A w x h map of one terrain with players P1 and P2, fog allocated, P1 to move.
inline GameState make_state(int w, int h, Terrain fill = Terrain::Land) {
  GameState s;
  s.map = TileMap(w, h, fill);
  s.players.resize(2);
  s.players[0].id = 0;
  s.players[0].name = "P1";
  s.players[1].id = 1;
  s.players[1].name = "P2";
  s.rng_state = 12345;
  init_fog(s);
  return s;
}

// Paint the inclusive rectangle [x0,x1] x [y0,y1].
inline void paint(GameState& s, int x0, int y0, int x1, int y1, Terrain t) {
  for (int y = y0; y <= y1; ++y) {
    for (int x = x0; x <= x1; ++x) {
      if (s.map.in_bounds(x, y)) s.map.set(x, y, t);
    }
  }
}

inline City& add_city(GameState& s, int x, int y, PlayerId owner) {
  City c;
  c.x = x;
  c.y = y;
  c.owner = owner;
  s.cities.push_back(c);
  return s.cities.back();
}

// Returns the id; references into s.units do not survive later spawns.
inline Id add_unit(GameState& s, const UnitCatalog& catalog, UnitType type, PlayerId owner, int x, int y) {
  return spawn_unit(s, catalog, type, owner, TileCoord{x, y}).id;
}

} // namespace empire::test
