#include "empire/core/simulation.h"

#include <algorithm>
#include <cstdlib>

#include "empire/util/log.h"

namespace empire {

EndTurnResult Simulation::end_turn() {
  EndTurnResult out;
  if (state_.victory.game_over) {
    out.already_over = true;
    out.winner = state_.victory.winner;
    out.message = "Game is over; " + player_name(out.winner) + " won";
    return out;
  }

  const PlayerId ending = state_.current_player;

  out.production = advance_production(state_, catalog_);
  out.units_healed = apply_healing(state_);
  out.missiles_detonated = force_missile_detonations(ending, out.production.spawned);
  out.fighters_lost = enforce_fighter_basing(ending);

  if (check_end_turn_victory(out)) {
    refresh_both_players();
    return out;
  }

  prune_dead_units();
  state_.current_player = opponent_of(ending);
  state_.turn_number += 1;
  reset_moves(state_.current_player);
  refresh_both_players();

  out.advanced = true;
  out.message = "Turn " + std::to_string(state_.turn_number) + ": " + player_name(state_.current_player) +
                " to move";
  log::debug(out.message);
  return out;
}

int Simulation::force_missile_detonations(PlayerId player, const std::vector<Id>& just_built) {
  int n = 0;
  // detonate_at() never adds units, so indices stay valid.
  for (std::size_t i = 0; i < state_.units.size(); ++i) {
    Unit& u = state_.units[i];
    if (!u.alive() || u.owner != player || u.type != UnitType::NuclearMissile) continue;
    // Finished this turn; it has not had a turn to fly yet.
    if (std::find(just_built.begin(), just_built.end(), u.id) != just_built.end()) continue;
    u.hp = 0;
    detonate_at(u.x, u.y, catalog_.get(u.type).blast_radius, player);
    ++n;
  }
  return n;
}

bool Simulation::fighter_is_based(const Unit& fighter) const {
  const City* c = empire::city_at(state_, fighter.x, fighter.y);
  if (c && c->owner == fighter.owner) return true;
  for (const Unit& other : state_.units) {
    if (!other.alive() || other.owner != fighter.owner || other.type != UnitType::Carrier) continue;
    if (std::abs(other.x - fighter.x) <= 1 && std::abs(other.y - fighter.y) <= 1) return true;
  }
  return false;
}

int Simulation::enforce_fighter_basing(PlayerId player) {
  int lost = 0;
  for (Unit& u : state_.units) {
    if (!u.alive() || u.owner != player || u.type != UnitType::Fighter) continue;
    if (fighter_is_based(u)) continue;
    u.hp = 0;
    record_kill(kNeutral, u);
    ++lost;
    log::info(player_name(player) + " lost fighter #" + std::to_string(u.id) + ": out of fuel");
  }
  return lost;
}

void Simulation::prune_dead_units() {
  state_.units.erase(std::remove_if(state_.units.begin(), state_.units.end(),
                                    [](const Unit& u) { return !u.alive(); }),
                     state_.units.end());
}

void Simulation::reset_moves(PlayerId player) {
  for (Unit& u : state_.units) {
    if (!u.alive() || u.owner != player) continue;
    u.moves_left = u.moves_per_turn;
    u.locked_direction.reset();
  }
}

bool Simulation::check_end_turn_victory(EndTurnResult& out) {
  const PlayerId active = state_.current_player;
  const PlayerId opp = opponent_of(active);
  const int mine = empire::city_count(state_, active);
  const int theirs = empire::city_count(state_, opp);

  PlayerId winner = kNeutral;
  if (theirs == 0 && mine >= 1) {
    winner = active;
  } else if (mine == 0 && theirs >= 1) {
    winner = opp;
  }
  if (winner == kNeutral) return false;

  state_.victory.game_over = true;
  state_.victory.winner = winner;
  out.victory = true;
  out.winner = winner;
  out.message = player_name(winner) + " wins: " + player_name(opponent_of(winner)) + " has no cities left";
  log::info(out.message);
  return true;
}

} // namespace empire
