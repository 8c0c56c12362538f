#pragma once

#include <optional>
#include <string>
#include <vector>

#include "empire/core/game_state.h"
#include "empire/core/unit_catalog.h"

namespace empire {

// Set a city's production target by name. Unknown names return false and
// leave the city untouched. Otherwise the cost is reset from the catalog and
// the accumulated progress is kept.
bool set_production(City& city, const std::string& type_name, const UnitCatalog& catalog,
                    std::string* error = nullptr);
void set_production(City& city, UnitType type, const UnitCatalog& catalog);

// Advance to the next catalog entry (wrapping). A city with no target starts
// at the first entry.
void cycle_production(City& city, const UnitCatalog& catalog);

// The order a freshly captured or founded city gets: Army, progress 0.
void assign_default_production(City& city, const UnitCatalog& catalog);

// Alive armies whose home is this city.
int supported_army_count(const GameState& s, const City& city);

// Create a unit with full hp and moves. Does not check the tile.
Unit& spawn_unit(GameState& s, const UnitCatalog& catalog, UnitType type, PlayerId owner, TileCoord at,
                 std::optional<TileCoord> home_city = std::nullopt);

// Where `city` would place a unit of `type` right now, or nullopt when the
// spawn rule finds no free tile or the support cap is reached.
std::optional<TileCoord> find_spawn_tile(const GameState& s, const UnitCatalog& catalog, const City& city,
                                         UnitType type);

struct ProductionReport {
  std::vector<Id> spawned;
  // Cities that reached their cost but could not place the unit.
  int stalled{0};
};

// One production tick for every owned city with a target and a positive
// cost: progress += 1, and at progress >= cost try to spawn. A spawn resets
// progress to 0; a blocked spawn pins progress at cost for a retry next tick.
ProductionReport advance_production(GameState& s, const UnitCatalog& catalog);

// Every alive unit standing on a city owned by its player regains 1 hp, up
// to max. Returns the number of units healed.
int apply_healing(GameState& s);

} // namespace empire
