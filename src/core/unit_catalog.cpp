#include "empire/core/unit_catalog.h"

#include <stdexcept>

#include "empire/core/enum_strings.h"
#include "empire/util/file_io.h"
#include "empire/util/json.h"

namespace empire {

namespace {

const json::Value* find_key(const json::Object& o, const std::string& key) {
  auto it = o.find(key);
  if (it == o.end()) return nullptr;
  return &it->second;
}

int positive_int(const json::Value& v, const std::string& what) {
  const auto* n = v.as_number();
  if (!n) throw std::runtime_error("Unit catalog: '" + what + "' must be a number");
  const auto i = v.int_value();
  if (i <= 0) throw std::runtime_error("Unit catalog: '" + what + "' must be positive");
  return static_cast<int>(i);
}

} // namespace

std::optional<UnitType> UnitCatalog::find_by_name(const std::string& name) const {
  return unit_type_from_string(name);
}

UnitType UnitCatalog::next_after(UnitType t) const {
  const int next = (unit_type_index(t) + 1) % kNumUnitTypes;
  return defs[static_cast<std::size_t>(next)].type;
}

UnitCatalog default_unit_catalog() {
  UnitCatalog cat;

  auto& army = cat.get(UnitType::Army);
  army.type = UnitType::Army;
  army.name = "Army";
  army.glyph = 'A';
  army.max_hp = 10;
  army.moves = 1;
  army.sight = 2;
  army.cost = 6;
  army.terrain = TerrainRule::LandOnly;
  army.spawn = SpawnRule::CityOrAdjacentLand;
  army.can_capture = true;
  army.uses_support_cap = true;

  auto& fighter = cat.get(UnitType::Fighter);
  fighter.type = UnitType::Fighter;
  fighter.name = "Fighter";
  fighter.glyph = 'F';
  fighter.max_hp = 8;
  fighter.moves = 6;
  fighter.sight = 4;
  fighter.cost = 10;
  fighter.terrain = TerrainRule::Any;
  fighter.spawn = SpawnRule::CityTile;
  fighter.can_hop_friendly = true;

  auto& carrier = cat.get(UnitType::Carrier);
  carrier.type = UnitType::Carrier;
  carrier.name = "Carrier";
  carrier.glyph = 'C';
  carrier.max_hp = 20;
  carrier.moves = 3;
  carrier.sight = 3;
  carrier.cost = 20;
  carrier.terrain = TerrainRule::OceanOnly;
  carrier.spawn = SpawnRule::AdjacentOcean;

  auto& missile = cat.get(UnitType::NuclearMissile);
  missile.type = UnitType::NuclearMissile;
  missile.name = "Nuclear Missile";
  missile.glyph = 'N';
  missile.max_hp = 1;
  missile.moves = 8;
  missile.sight = 1;
  missile.cost = 30;
  missile.terrain = TerrainRule::Any;
  missile.spawn = SpawnRule::CityTile;
  missile.max_range = 8;
  missile.blast_radius = 2;

  return cat;
}

UnitCatalog load_unit_catalog_from_json(const std::string& json_text) {
  const auto root = json::parse(json_text);
  UnitCatalog cat = default_unit_catalog();

  const auto* units = find_key(root.object(), "units");
  if (!units) return cat;

  for (const auto& [name, v] : units->object()) {
    const auto type = unit_type_from_string(name);
    if (!type) throw std::runtime_error("Unit catalog: unknown unit type '" + name + "'");
    const auto& o = v.object();
    UnitTypeDef& def = cat.get(*type);

    if (const auto* p = find_key(o, "name")) def.name = p->string_value(def.name);
    if (const auto* p = find_key(o, "glyph")) {
      const std::string g = p->string_value();
      if (g.size() != 1) throw std::runtime_error("Unit catalog: glyph for '" + name + "' must be one character");
      def.glyph = g[0];
    }
    if (const auto* p = find_key(o, "max_hp")) def.max_hp = positive_int(*p, name + ".max_hp");
    if (const auto* p = find_key(o, "moves")) def.moves = positive_int(*p, name + ".moves");
    if (const auto* p = find_key(o, "sight")) def.sight = positive_int(*p, name + ".sight");
    if (const auto* p = find_key(o, "cost")) def.cost = positive_int(*p, name + ".cost");
    if (const auto* p = find_key(o, "max_range")) def.max_range = positive_int(*p, name + ".max_range");
    if (const auto* p = find_key(o, "blast_radius")) def.blast_radius = positive_int(*p, name + ".blast_radius");
  }
  return cat;
}

UnitCatalog load_unit_catalog_from_file(const std::string& path) {
  return load_unit_catalog_from_json(read_text_file(path));
}

bool terrain_allows(TerrainRule rule, Terrain t) {
  switch (rule) {
    case TerrainRule::LandOnly: return t == Terrain::Land;
    case TerrainRule::OceanOnly: return t == Terrain::Ocean;
    case TerrainRule::Any: return true;
  }
  return false;
}

} // namespace empire
