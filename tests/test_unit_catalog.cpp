#include <iostream>
#include <stdexcept>
#include <string>

#include "empire/core/enum_strings.h"
#include "empire/core/unit_catalog.h"

#define EMP_ASSERT(expr)                                                                            \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

namespace {

std::string load_error(const std::string& text) {
  try {
    (void)empire::load_unit_catalog_from_json(text);
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return {};
}

bool same_stats(const empire::UnitTypeDef& a, const empire::UnitTypeDef& b) {
  return a.type == b.type && a.name == b.name && a.glyph == b.glyph && a.max_hp == b.max_hp &&
         a.moves == b.moves && a.sight == b.sight && a.cost == b.cost && a.max_range == b.max_range &&
         a.blast_radius == b.blast_radius && a.terrain == b.terrain && a.spawn == b.spawn;
}

} // namespace

int test_unit_catalog() {
  using namespace empire;

  const UnitCatalog cat = default_unit_catalog();

  // Built-in stats.
  {
    const auto& army = cat.get(UnitType::Army);
    EMP_ASSERT(army.max_hp == 10 && army.moves == 1 && army.sight == 2 && army.cost == 6);
    EMP_ASSERT(army.can_capture && army.uses_support_cap);
    EMP_ASSERT(army.terrain == TerrainRule::LandOnly);
    EMP_ASSERT(army.spawn == SpawnRule::CityOrAdjacentLand);

    const auto& fighter = cat.get(UnitType::Fighter);
    EMP_ASSERT(fighter.max_hp == 8 && fighter.moves == 6 && fighter.sight == 4 && fighter.cost == 10);
    EMP_ASSERT(fighter.can_hop_friendly && !fighter.can_capture);
    EMP_ASSERT(fighter.terrain == TerrainRule::Any);

    const auto& carrier = cat.get(UnitType::Carrier);
    EMP_ASSERT(carrier.max_hp == 20 && carrier.moves == 3 && carrier.sight == 3 && carrier.cost == 20);
    EMP_ASSERT(carrier.terrain == TerrainRule::OceanOnly);
    EMP_ASSERT(carrier.spawn == SpawnRule::AdjacentOcean);

    const auto& missile = cat.get(UnitType::NuclearMissile);
    EMP_ASSERT(missile.max_hp == 1 && missile.moves == 8 && missile.sight == 1 && missile.cost == 30);
    EMP_ASSERT(missile.max_range == 8 && missile.blast_radius == 2);
    EMP_ASSERT(missile.name == "Nuclear Missile");
    EMP_ASSERT(missile.spawn == SpawnRule::CityTile);
  }

  // Name lookup is case-insensitive and accepts short forms.
  EMP_ASSERT(cat.find_by_name("ARMY") == UnitType::Army);
  EMP_ASSERT(cat.find_by_name("f") == UnitType::Fighter);
  EMP_ASSERT(cat.find_by_name("Carrier") == UnitType::Carrier);
  EMP_ASSERT(cat.find_by_name("nuke") == UnitType::NuclearMissile);
  EMP_ASSERT(cat.find_by_name("Nuclear Missile") == UnitType::NuclearMissile);
  EMP_ASSERT(!cat.find_by_name("battleship"));

  // Catalog order wraps around.
  EMP_ASSERT(cat.next_after(UnitType::Army) == UnitType::Fighter);
  EMP_ASSERT(cat.next_after(UnitType::Fighter) == UnitType::Carrier);
  EMP_ASSERT(cat.next_after(UnitType::Carrier) == UnitType::NuclearMissile);
  EMP_ASSERT(cat.next_after(UnitType::NuclearMissile) == UnitType::Army);

  // Terrain rules.
  EMP_ASSERT(terrain_allows(TerrainRule::LandOnly, Terrain::Land));
  EMP_ASSERT(!terrain_allows(TerrainRule::LandOnly, Terrain::Ocean));
  EMP_ASSERT(terrain_allows(TerrainRule::OceanOnly, Terrain::Ocean));
  EMP_ASSERT(!terrain_allows(TerrainRule::OceanOnly, Terrain::Land));
  EMP_ASSERT(terrain_allows(TerrainRule::Any, Terrain::Land));
  EMP_ASSERT(terrain_allows(TerrainRule::Any, Terrain::Ocean));

  // Enum strings used by the save format.
  for (int i = 0; i < kNumUnitTypes; ++i) {
    const UnitType t = cat.defs[static_cast<std::size_t>(i)].type;
    EMP_ASSERT(unit_type_from_string(unit_type_to_string(t)) == t);
  }
  EMP_ASSERT(battle_outcome_from_string(battle_outcome_to_string(BattleOutcome::AttackerWon)) ==
             BattleOutcome::AttackerWon);
  EMP_ASSERT(battle_outcome_from_string(battle_outcome_to_string(BattleOutcome::DefenderWon)) ==
             BattleOutcome::DefenderWon);

  // The shipped data file matches the built-in defaults.
  {
    const UnitCatalog from_file = load_unit_catalog_from_file("data/unit_catalog.json");
    for (int i = 0; i < kNumUnitTypes; ++i) {
      EMP_ASSERT(same_stats(from_file.defs[static_cast<std::size_t>(i)], cat.defs[static_cast<std::size_t>(i)]));
    }
  }

  // Overrides apply on top of the defaults.
  {
    const UnitCatalog tuned =
        load_unit_catalog_from_json(R"({"units": {"army": {"cost": 8, "sight": 3}, "missile": {"blast_radius": 3}}})");
    EMP_ASSERT(tuned.get(UnitType::Army).cost == 8);
    EMP_ASSERT(tuned.get(UnitType::Army).sight == 3);
    EMP_ASSERT(tuned.get(UnitType::Army).moves == 1);
    EMP_ASSERT(tuned.get(UnitType::NuclearMissile).blast_radius == 3);
    EMP_ASSERT(tuned.get(UnitType::Fighter).cost == 10);
  }

  // A document without a units section yields the defaults.
  EMP_ASSERT(load_unit_catalog_from_json("{}").get(UnitType::Carrier).cost == 20);

  // Bad documents are rejected.
  EMP_ASSERT(load_error(R"({"units": {"battleship": {"cost": 5}}})").find("unknown unit type") != std::string::npos);
  EMP_ASSERT(load_error(R"({"units": {"army": {"cost": 0}}})").find("must be positive") != std::string::npos);
  EMP_ASSERT(load_error(R"({"units": {"army": {"moves": "fast"}}})").find("must be a number") != std::string::npos);
  EMP_ASSERT(load_error(R"({"units": {"army": {"glyph": "AB"}}})").find("one character") != std::string::npos);
  EMP_ASSERT(!load_error("{\"units\": [").empty());

  return 0;
}
