#include "empire/core/enum_strings.h"

#include "empire/util/strings.h"

namespace empire {

std::string unit_type_to_string(UnitType t) {
  switch (t) {
    case UnitType::Army: return "army";
    case UnitType::Fighter: return "fighter";
    case UnitType::Carrier: return "carrier";
    case UnitType::NuclearMissile: return "nuclear_missile";
  }
  return "army";
}

std::optional<UnitType> unit_type_from_string(const std::string& raw) {
  const std::string s = to_lower(raw);
  if (s == "army" || s == "a") return UnitType::Army;
  if (s == "fighter" || s == "f") return UnitType::Fighter;
  if (s == "carrier" || s == "c") return UnitType::Carrier;
  if (s == "nuclear_missile" || s == "nuclear missile" || s == "nuclearmissile" || s == "missile" ||
      s == "nuke" || s == "n") {
    return UnitType::NuclearMissile;
  }
  return std::nullopt;
}

std::string battle_outcome_to_string(BattleOutcome o) {
  switch (o) {
    case BattleOutcome::AttackerWon: return "attacker_won";
    case BattleOutcome::DefenderWon: return "defender_won";
  }
  return "defender_won";
}

BattleOutcome battle_outcome_from_string(const std::string& s) {
  if (s == "attacker_won") return BattleOutcome::AttackerWon;
  return BattleOutcome::DefenderWon;
}

} // namespace empire
