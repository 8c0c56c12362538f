#include "empire/core/production.h"

#include <string>

#include "empire/core/enum_strings.h"
#include "empire/util/log.h"

namespace empire {

namespace {

bool tile_free(const GameState& s, int x, int y) { return unit_at(s, x, y) == nullptr; }

std::string city_label(const City& c) {
  return "city (" + std::to_string(c.x) + "," + std::to_string(c.y) + ")";
}

} // namespace

bool set_production(City& city, const std::string& type_name, const UnitCatalog& catalog, std::string* error) {
  const auto type = catalog.find_by_name(type_name);
  if (!type) {
    if (error) *error = "Unknown unit type: '" + type_name + "'";
    return false;
  }
  set_production(city, *type, catalog);
  return true;
}

void set_production(City& city, UnitType type, const UnitCatalog& catalog) {
  city.production = type;
  city.production_cost = catalog.get(type).cost;
}

void cycle_production(City& city, const UnitCatalog& catalog) {
  const UnitType next = city.production ? catalog.next_after(*city.production) : catalog.defs.front().type;
  set_production(city, next, catalog);
}

void assign_default_production(City& city, const UnitCatalog& catalog) {
  set_production(city, UnitType::Army, catalog);
  city.production_progress = 0;
}

int supported_army_count(const GameState& s, const City& city) {
  int n = 0;
  for (const Unit& u : s.units) {
    if (u.alive() && u.type == UnitType::Army && u.home_city && *u.home_city == city.pos()) ++n;
  }
  return n;
}

Unit& spawn_unit(GameState& s, const UnitCatalog& catalog, UnitType type, PlayerId owner, TileCoord at,
                 std::optional<TileCoord> home_city) {
  const UnitTypeDef& def = catalog.get(type);
  Unit u;
  u.id = allocate_unit_id(s);
  u.type = type;
  u.owner = owner;
  u.x = at.x;
  u.y = at.y;
  u.hp = def.max_hp;
  u.max_hp = def.max_hp;
  u.moves_per_turn = def.moves;
  u.moves_left = def.moves;
  u.home_city = home_city;
  s.units.push_back(u);
  return s.units.back();
}

std::optional<TileCoord> find_spawn_tile(const GameState& s, const UnitCatalog& catalog, const City& city,
                                         UnitType type) {
  const UnitTypeDef& def = catalog.get(type);

  switch (def.spawn) {
    case SpawnRule::CityOrAdjacentLand: {
      if (def.uses_support_cap && supported_army_count(s, city) >= city.support_cap) return std::nullopt;
      if (s.map.is_land(city.x, city.y) && tile_free(s, city.x, city.y)) return city.pos();
      for (int k = 0; k < kNeighborCount; ++k) {
        const int nx = city.x + kNeighborDx[k];
        const int ny = city.y + kNeighborDy[k];
        if (s.map.is_land(nx, ny) && tile_free(s, nx, ny)) return TileCoord{nx, ny};
      }
      return std::nullopt;
    }
    case SpawnRule::CityTile:
      if (tile_free(s, city.x, city.y)) return city.pos();
      return std::nullopt;
    case SpawnRule::AdjacentOcean:
      for (int k = 0; k < kNeighborCount; ++k) {
        const int nx = city.x + kNeighborDx[k];
        const int ny = city.y + kNeighborDy[k];
        if (s.map.is_ocean(nx, ny) && tile_free(s, nx, ny)) return TileCoord{nx, ny};
      }
      return std::nullopt;
  }
  return std::nullopt;
}

ProductionReport advance_production(GameState& s, const UnitCatalog& catalog) {
  ProductionReport report;

  // Index loop: spawn_unit() appends to s.units, never to s.cities.
  for (std::size_t i = 0; i < s.cities.size(); ++i) {
    City& c = s.cities[i];
    if (c.is_neutral() || !c.production || c.production_cost <= 0) continue;

    c.production_progress += 1;
    if (c.production_progress < c.production_cost) continue;

    const UnitType type = *c.production;
    const auto tile = find_spawn_tile(s, catalog, c, type);
    if (!tile) {
      c.production_progress = c.production_cost;
      ++report.stalled;
      log::debug("Production stalled at " + city_label(c) + ": no room for " + unit_type_to_string(type));
      continue;
    }

    std::optional<TileCoord> home;
    if (catalog.get(type).uses_support_cap) home = c.pos();
    const Unit& u = spawn_unit(s, catalog, type, c.owner, *tile, home);
    c.production_progress = 0;
    report.spawned.push_back(u.id);
    log::debug(city_label(c) + " built " + unit_type_to_string(type) + " #" + std::to_string(u.id));
  }
  return report;
}

int apply_healing(GameState& s) {
  int healed = 0;
  for (Unit& u : s.units) {
    if (!u.alive() || u.hp >= u.max_hp) continue;
    const City* c = city_at(s, u.x, u.y);
    if (!c || c->owner != u.owner) continue;
    u.hp += 1;
    ++healed;
  }
  return healed;
}

} // namespace empire
