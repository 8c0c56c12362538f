#include "empire/core/render.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "empire/core/visibility.h"

namespace empire {

namespace {

char city_glyph(PlayerId owner) {
  if (owner == 0) return 'O';
  if (owner == 1) return 'X';
  return 'o';
}

char unit_glyph(const UnitCatalog& catalog, const Unit& u) {
  const unsigned char g = static_cast<unsigned char>(catalog.get(u.type).glyph);
  return static_cast<char>(u.owner == 0 ? std::toupper(g) : std::tolower(g));
}

} // namespace

Viewport full_viewport(const TileMap& map) { return Viewport{0, 0, map.width, map.height}; }

std::vector<std::string> render_snapshot(const GameState& s, const UnitCatalog& catalog, const Viewport& view,
                                         std::optional<PlayerId> observer) {
  const int x0 = std::max(0, view.x);
  const int y0 = std::max(0, view.y);
  const int x1 = std::min(s.map.width, view.x + std::max(0, view.width));
  const int y1 = std::min(s.map.height, view.y + std::max(0, view.height));

  std::vector<std::string> rows;
  if (x1 <= x0 || y1 <= y0) return rows;
  rows.reserve(static_cast<std::size_t>(y1 - y0));

  // Dead units never render; a lookup grid keeps this O(tiles + units).
  std::vector<const Unit*> units_by_tile(s.map.tiles.size(), nullptr);
  for (const Unit& u : s.units) {
    if (!u.alive() || !s.map.in_bounds(u.x, u.y)) continue;
    units_by_tile[s.map.index(u.x, u.y)] = &u;
  }
  std::vector<const City*> cities_by_tile(s.map.tiles.size(), nullptr);
  for (const City& c : s.cities) {
    if (s.map.in_bounds(c.x, c.y)) cities_by_tile[s.map.index(c.x, c.y)] = &c;
  }

  for (int y = y0; y < y1; ++y) {
    std::string row;
    row.reserve(static_cast<std::size_t>(x1 - x0));
    for (int x = x0; x < x1; ++x) {
      const std::size_t idx = s.map.index(x, y);
      bool visible = true;
      if (observer) {
        if (!is_explored(s, *observer, x, y)) {
          row.push_back(' ');
          continue;
        }
        visible = is_visible(s, *observer, x, y);
      }

      char ch = s.map.is_land(x, y) ? '+' : '.';
      if (const City* c = cities_by_tile[idx]) ch = visible ? city_glyph(c->owner) : 'o';
      if (visible) {
        if (const Unit* u = units_by_tile[idx]) ch = unit_glyph(catalog, *u);
      }
      row.push_back(ch);
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

} // namespace empire
