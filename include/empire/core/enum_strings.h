#pragma once

#include <optional>
#include <string>

#include "empire/core/entities.h"

namespace empire {

// Shared string <-> enum conversions for the save format, the unit catalog
// file and CLI output.

std::string unit_type_to_string(UnitType t);
std::optional<UnitType> unit_type_from_string(const std::string& s);

std::string battle_outcome_to_string(BattleOutcome o);
BattleOutcome battle_outcome_from_string(const std::string& s);

} // namespace empire
