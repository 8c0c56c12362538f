#pragma once

#include <array>
#include <optional>
#include <string>

#include "empire/core/entities.h"
#include "empire/core/grid.h"

namespace empire {

// Where a unit type may stand.
enum class TerrainRule : std::uint8_t { LandOnly, OceanOnly, Any };

// Where a city places a freshly built unit.
enum class SpawnRule : std::uint8_t {
  // City tile, then the 8 neighbors; land only; subject to the support cap.
  CityOrAdjacentLand,
  // City tile only.
  CityTile,
  // First free ocean tile among the 8 neighbors; never the city tile.
  AdjacentOcean,
};

// Static per-type stats and behavior switches.
struct UnitTypeDef {
  UnitType type{UnitType::Army};
  std::string name;
  char glyph{'?'};

  int max_hp{1};
  int moves{1};
  int sight{1};
  int cost{1};

  TerrainRule terrain{TerrainRule::LandOnly};
  SpawnRule spawn{SpawnRule::CityTile};

  bool can_capture{false};
  bool uses_support_cap{false};

  // Fighters may jump a friendly unit; missiles jump anything.
  bool can_hop_friendly{false};

  // Missiles only (0 otherwise).
  int max_range{0};
  int blast_radius{0};
};

// The production catalog, in its fixed enumeration order.
struct UnitCatalog {
  std::array<UnitTypeDef, kNumUnitTypes> defs;

  const UnitTypeDef& get(UnitType t) const { return defs[static_cast<std::size_t>(unit_type_index(t))]; }
  UnitTypeDef& get(UnitType t) { return defs[static_cast<std::size_t>(unit_type_index(t))]; }

  // Case-insensitive lookup by name ("army", "Fighter", "nuclear_missile"...).
  std::optional<UnitType> find_by_name(const std::string& name) const;

  // Next entry in catalog order, wrapping around.
  UnitType next_after(UnitType t) const;
};

UnitCatalog default_unit_catalog();

// Apply overrides from a JSON document of the form
//   {"units": {"army": {"cost": 8, "moves": 1, ...}, ...}}
// on top of the defaults. Unknown unit names or non-positive stats throw
// std::runtime_error.
UnitCatalog load_unit_catalog_from_json(const std::string& json_text);
UnitCatalog load_unit_catalog_from_file(const std::string& path);

bool terrain_allows(TerrainRule rule, Terrain t);

} // namespace empire
