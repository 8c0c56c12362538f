#include "empire/core/combat.h"

#include <algorithm>

namespace empire {

CombatOdds select_combat_odds(UnitType attacker, UnitType defender, bool defender_in_own_city,
                              const CombatRules& rules) {
  CombatOdds odds{rules.base_attack, rules.base_defend};
  if (attacker == UnitType::Fighter) {
    if (defender == UnitType::Army) {
      odds = {rules.fighter_vs_army_attack, rules.fighter_vs_army_defend};
    } else {
      odds = {rules.fighter_vs_other_attack, rules.fighter_vs_other_defend};
    }
  }
  if (defender_in_own_city) {
    odds.attacker_hit -= rules.city_defense_bonus;
    odds.defender_hit += rules.city_defense_bonus;
  }
  odds.attacker_hit = std::clamp(odds.attacker_hit, 0.0, 1.0);
  odds.defender_hit = std::clamp(odds.defender_hit, 0.0, 1.0);
  return odds;
}

CombatResult resolve_combat(int attacker_hp, int defender_hp, const CombatOdds& odds, const CombatRules& rules,
                            util::HashRng& rng) {
  CombatResult r;
  r.attacker_hp = attacker_hp;
  r.defender_hp = defender_hp;

  // A round where nobody can land a hit would never end.
  const bool stalemate = odds.attacker_hit <= 0.0 && odds.defender_hit <= 0.0;
  if (stalemate || rules.attacker_damage <= 0 || rules.defender_damage <= 0) {
    r.attacker_alive = r.attacker_hp > 0;
    r.defender_alive = r.defender_hp > 0;
    return r;
  }

  while (r.attacker_hp > 0 && r.defender_hp > 0) {
    ++r.rounds;
    if (rng.next_u01() < odds.attacker_hit) r.defender_hp -= rules.attacker_damage;
    if (r.defender_hp <= 0) break;
    if (rng.next_u01() < odds.defender_hit) r.attacker_hp -= rules.defender_damage;
  }

  r.attacker_alive = r.attacker_hp > 0;
  r.defender_alive = r.defender_hp > 0;
  if (!r.attacker_alive) r.attacker_hp = 0;
  if (!r.defender_alive) r.defender_hp = 0;
  return r;
}

} // namespace empire
