#include "empire/core/simulation.h"

#include <cstddef>
#include <utility>

#include "empire/core/enum_strings.h"
#include "empire/util/hash_rng.h"
#include "empire/util/log.h"

namespace empire {

namespace {

std::string pos_str(int x, int y) { return "(" + std::to_string(x) + "," + std::to_string(y) + ")"; }

std::string unit_label(const Unit& u) { return unit_type_to_string(u.type) + " #" + std::to_string(u.id); }

std::string terrain_name(Terrain t) { return t == Terrain::Land ? "land" : "ocean"; }

} // namespace

bool Simulation::validate_command(const Unit* u, Id unit_id, std::string* error) const {
  if (state_.victory.game_over) {
    if (error) *error = "Game is over";
    return false;
  }
  if (!u) {
    if (error) *error = "No such unit #" + std::to_string(unit_id);
    return false;
  }
  if (u->owner != state_.current_player) {
    if (error) *error = "Unit #" + std::to_string(unit_id) + " belongs to " + player_name(u->owner);
    return false;
  }
  return true;
}

MoveResult Simulation::attempt_move(Id unit_id, int dx, int dy) {
  MoveResult out;
  Unit* u = empire::find_unit(state_, unit_id);
  if (!validate_command(u, unit_id, &out.message)) return out;

  if (u->moves_left <= 0) {
    out.message = unit_label(*u) + " has no moves left";
    return out;
  }
  if (dx < -1 || dx > 1 || dy < -1 || dy > 1 || (dx == 0 && dy == 0)) {
    out.message = "Invalid direction " + pos_str(dx, dy);
    return out;
  }

  if (u->type == UnitType::NuclearMissile) {
    move_missile(*u, dx, dy, out);
    if (out.moved) refresh_both_players();
    return out;
  }

  const UnitTypeDef& def = catalog_.get(u->type);
  const int nx = u->x + dx;
  const int ny = u->y + dy;
  if (!state_.map.in_bounds(nx, ny)) {
    out.message = "Destination " + pos_str(nx, ny) + " is off the map";
    return out;
  }
  if (!terrain_allows(def.terrain, state_.map.at(nx, ny))) {
    out.message = def.name + " cannot enter " + terrain_name(state_.map.at(nx, ny));
    return out;
  }

  Unit* other = empire::unit_at(state_, nx, ny);
  if (other && other->owner == u->owner) {
    if (!def.can_hop_friendly || u->moves_left < 2) {
      out.message = "Destination " + pos_str(nx, ny) + " is occupied by a friendly unit";
      return out;
    }
    const int hx = nx + dx;
    const int hy = ny + dy;
    if (!state_.map.in_bounds(hx, hy) || empire::unit_at(state_, hx, hy) ||
        !terrain_allows(def.terrain, state_.map.at(hx, hy))) {
      out.message = "No room to hop past the friendly unit at " + pos_str(nx, ny);
      return out;
    }
    u->x = hx;
    u->y = hy;
    u->moves_left -= 2;
    out.moved = true;
    if (try_capture(*u)) {
      out.captured_city = true;
      out.victory = check_capture_victory(u->owner);
    }
    out.message = unit_label(*u) + " hopped to " + pos_str(hx, hy);
    refresh_both_players();
    return out;
  }

  if (other) {
    fight(*u, *other, nx, ny, out);
    refresh_both_players();
    return out;
  }

  u->x = nx;
  u->y = ny;
  u->moves_left -= 1;
  out.moved = true;
  out.message = unit_label(*u) + " moved to " + pos_str(nx, ny);
  if (try_capture(*u)) {
    out.captured_city = true;
    out.message += " and captured the city";
    out.victory = check_capture_victory(u->owner);
  }
  refresh_both_players();
  return out;
}

void Simulation::move_missile(Unit& u, int dx, int dy, MoveResult& out) {
  const UnitTypeDef& def = catalog_.get(u.type);
  const Direction dir{dx, dy};
  if (u.locked_direction && *u.locked_direction != dir) {
    out.message = unit_label(u) + " is locked to direction " +
                  pos_str(u.locked_direction->dx, u.locked_direction->dy);
    return;
  }

  int tx = u.x + dx;
  int ty = u.y + dy;
  if (!state_.map.in_bounds(tx, ty)) {
    out.message = "Destination " + pos_str(tx, ty) + " is off the map";
    return;
  }

  int steps = 1;
  if (empire::unit_at(state_, tx, ty)) {
    const int hx = tx + dx;
    const int hy = ty + dy;
    if (u.moves_left < 2 || !state_.map.in_bounds(hx, hy) || empire::unit_at(state_, hx, hy)) {
      out.message = "Flight path of " + unit_label(u) + " is blocked at " + pos_str(tx, ty);
      return;
    }
    tx = hx;
    ty = hy;
    steps = 2;
  }
  if (!terrain_allows(def.terrain, state_.map.at(tx, ty))) {
    out.message = def.name + " cannot enter " + terrain_name(state_.map.at(tx, ty));
    return;
  }

  u.x = tx;
  u.y = ty;
  u.moves_left -= steps;
  u.traveled += steps;
  u.locked_direction = dir;
  out.moved = true;
  out.message = unit_label(u) + " flew to " + pos_str(tx, ty);

  const bool out_of_range = def.max_range > 0 && u.traveled >= def.max_range;
  if (out_of_range || u.moves_left <= 0) {
    u.hp = 0;
    out.detonated = true;
    out.detonation = detonate_at(u.x, u.y, def.blast_radius, u.owner);
    out.message += " and detonated";
  }
}

void Simulation::fight(Unit& attacker, Unit& defender, int nx, int ny, MoveResult& out) {
  const City* c = empire::city_at(state_, nx, ny);
  const bool in_city = c && c->owner == defender.owner;
  const CombatOdds odds = select_combat_odds(attacker.type, defender.type, in_city, cfg_.combat);

  util::HashRng rng(state_.rng_state);
  const CombatResult r = resolve_combat(attacker.hp, defender.hp, odds, cfg_.combat, rng);
  state_.rng_state = rng.s;

  attacker.hp = r.attacker_hp;
  defender.hp = r.defender_hp;
  out.combat = true;

  BattleReport rep;
  rep.turn = state_.turn_number;
  rep.attacker_id = attacker.id;
  rep.attacker_owner = attacker.owner;
  rep.attacker_type = attacker.type;
  rep.defender_id = defender.id;
  rep.defender_owner = defender.owner;
  rep.defender_type = defender.type;
  rep.x = nx;
  rep.y = ny;
  rep.attacker_hit = odds.attacker_hit;
  rep.defender_hit = odds.defender_hit;
  rep.defender_in_city = in_city;
  rep.outcome = r.defender_alive ? BattleOutcome::DefenderWon : BattleOutcome::AttackerWon;
  rep.rounds = r.rounds;
  rep.summary = player_name(attacker.owner) + " " + unit_label(attacker) + " attacked " +
                player_name(defender.owner) + " " + unit_label(defender) + " at " + pos_str(nx, ny) + ": " +
                battle_outcome_to_string(rep.outcome) + " after " + std::to_string(r.rounds) + " rounds";

  if (!defender.alive()) record_kill(attacker.owner, defender);
  if (!attacker.alive()) record_kill(defender.owner, attacker);

  out.message = rep.summary;
  log::info(rep.summary);
  record_battle(std::move(rep));

  if (!defender.alive() && attacker.alive()) {
    out.attacker_won = true;
    attacker.x = nx;
    attacker.y = ny;
    attacker.moves_left -= 1;
    out.moved = true;
    if (try_capture(attacker)) {
      out.captured_city = true;
      out.victory = check_capture_victory(attacker.owner);
    }
  }
}

bool Simulation::try_capture(Unit& u) {
  if (!catalog_.get(u.type).can_capture) return false;
  City* c = empire::city_at(state_, u.x, u.y);
  if (!c || c->owner == u.owner) return false;

  const PlayerId previous = c->owner;
  c->owner = u.owner;
  assign_default_production(*c, catalog_);
  log::info(player_name(u.owner) + " captured the city at " + pos_str(c->x, c->y) + " from " +
            player_name(previous));
  return true;
}

bool Simulation::check_capture_victory(PlayerId capturer) {
  const PlayerId opp = opponent_of(capturer);
  if (empire::city_count(state_, opp) != 0 || empire::city_count(state_, capturer) < 1) return false;
  state_.victory.game_over = true;
  state_.victory.winner = capturer;
  log::info(player_name(capturer) + " wins: " + player_name(opp) + " has no cities left");
  return true;
}

void Simulation::record_battle(BattleReport report) {
  state_.battle_log.push_back(std::move(report));
  const int cap = cfg_.battle_log_capacity;
  if (cap > 0 && static_cast<int>(state_.battle_log.size()) > cap) {
    const auto excess = static_cast<std::ptrdiff_t>(state_.battle_log.size()) - cap;
    state_.battle_log.erase(state_.battle_log.begin(), state_.battle_log.begin() + excess);
  }
}

void Simulation::record_kill(PlayerId killer, const Unit& victim) {
  if (is_valid_player(state_, victim.owner)) {
    state_.players[static_cast<std::size_t>(victim.owner)].losses[victim.type] += 1;
  }
  if (is_valid_player(state_, killer) && killer != victim.owner) {
    state_.players[static_cast<std::size_t>(killer)].kills[victim.type] += 1;
  }
}

} // namespace empire
