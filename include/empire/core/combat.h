#pragma once

#include "empire/core/entities.h"
#include "empire/util/hash_rng.h"

namespace empire {

// Tunable combat constants.
struct CombatRules {
  // Matchup hit chances (attacker, defender).
  double fighter_vs_army_attack{0.70};
  double fighter_vs_army_defend{0.30};
  double fighter_vs_other_attack{0.60};
  double fighter_vs_other_defend{0.50};
  double base_attack{0.55};
  double base_defend{0.50};

  // Swing applied when the defender stands in a city it owns: the attacker
  // loses this much hit chance and the defender gains the same.
  double city_defense_bonus{0.10};

  // Damage per landed hit.
  int attacker_damage{3};
  int defender_damage{2};
};

struct CombatOdds {
  double attacker_hit{0.0};
  double defender_hit{0.0};
};

// Hit chances for a matchup, city modifier included, clamped to [0, 1].
CombatOdds select_combat_odds(UnitType attacker, UnitType defender, bool defender_in_own_city,
                              const CombatRules& rules);

struct CombatResult {
  bool attacker_alive{false};
  bool defender_alive{false};
  int attacker_hp{0};
  int defender_hp{0};
  int rounds{0};
};

// Exchange blows until one side drops.
//
// Each round the attacker swings first: a draw below attacker_hit costs the
// defender rules.attacker_damage. Only if the defender survives does it swing
// back (draw below defender_hit costs the attacker rules.defender_damage).
// The loser's hp is reported as 0. Exactly one side survives unless a side
// starts at hp <= 0.
CombatResult resolve_combat(int attacker_hp, int defender_hp, const CombatOdds& odds, const CombatRules& rules,
                            util::HashRng& rng);

} // namespace empire
