#include "empire/core/visibility.h"

#include <algorithm>

namespace empire {

namespace {

PlayerFog* fog_for(GameState& s, PlayerId player) {
  if (player < 0 || player >= static_cast<PlayerId>(s.fog.size())) return nullptr;
  PlayerFog& f = s.fog[static_cast<std::size_t>(player)];
  if (f.visible.size() != s.map.tiles.size() || f.explored.size() != s.map.tiles.size()) return nullptr;
  return &f;
}

const PlayerFog* fog_for(const GameState& s, PlayerId player) {
  if (player < 0 || player >= static_cast<PlayerId>(s.fog.size())) return nullptr;
  const PlayerFog& f = s.fog[static_cast<std::size_t>(player)];
  if (f.visible.size() != s.map.tiles.size() || f.explored.size() != s.map.tiles.size()) return nullptr;
  return &f;
}

} // namespace

void init_fog(GameState& s) {
  s.fog.assign(s.players.size(), PlayerFog{});
  for (auto& f : s.fog) {
    f.explored.assign(s.map.tiles.size(), 0);
    f.visible.assign(s.map.tiles.size(), 0);
  }
}

void clear_visible(GameState& s, PlayerId player) {
  if (PlayerFog* f = fog_for(s, player)) std::fill(f->visible.begin(), f->visible.end(), 0);
}

void mark_visible_circle(GameState& s, PlayerId player, int cx, int cy, int radius) {
  PlayerFog* f = fog_for(s, player);
  if (!f || radius < 0) return;

  const int r2 = radius * radius;
  const int y0 = std::max(0, cy - radius);
  const int y1 = std::min(s.map.height - 1, cy + radius);
  const int x0 = std::max(0, cx - radius);
  const int x1 = std::min(s.map.width - 1, cx + radius);
  for (int y = y0; y <= y1; ++y) {
    for (int x = x0; x <= x1; ++x) {
      if (distance_squared({x, y}, {cx, cy}) > r2) continue;
      const std::size_t i = s.map.index(x, y);
      f->visible[i] = 1;
      f->explored[i] = 1;
    }
  }
}

void recompute_visibility(GameState& s, const UnitCatalog& catalog, int city_sight_radius, PlayerId player) {
  if (!fog_for(s, player)) return;
  clear_visible(s, player);
  for (const City& c : s.cities) {
    if (c.owner == player) mark_visible_circle(s, player, c.x, c.y, city_sight_radius);
  }
  for (const Unit& u : s.units) {
    if (u.alive() && u.owner == player) mark_visible_circle(s, player, u.x, u.y, catalog.get(u.type).sight);
  }
}

bool is_explored(const GameState& s, PlayerId player, int x, int y) {
  const PlayerFog* f = fog_for(s, player);
  return f && s.map.in_bounds(x, y) && f->explored[s.map.index(x, y)] != 0;
}

bool is_visible(const GameState& s, PlayerId player, int x, int y) {
  const PlayerFog* f = fog_for(s, player);
  return f && s.map.in_bounds(x, y) && f->visible[s.map.index(x, y)] != 0;
}

} // namespace empire
