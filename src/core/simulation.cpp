#include "empire/core/simulation.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "empire/core/city_placement.h"
#include "empire/core/enum_strings.h"
#include "empire/core/terrain_gen.h"
#include "empire/core/visibility.h"
#include "empire/util/hash_rng.h"
#include "empire/util/log.h"

namespace empire {

namespace {

// Salts for deriving the secondary seeds from the map seed.
constexpr std::uint64_t kPlacementSalt = 0x43495459504c4143ULL;
constexpr std::uint64_t kCombatSalt = 0x434f4d4241545247ULL;

std::uint64_t derive_seed(const std::optional<std::uint64_t>& explicit_seed,
                          const std::optional<std::uint64_t>& map_seed, std::uint64_t salt) {
  if (explicit_seed) return *explicit_seed;
  if (map_seed) return util::splitmix64(*map_seed ^ salt);
  return util::entropy_seed();
}

std::string pos_str(int x, int y) { return "(" + std::to_string(x) + "," + std::to_string(y) + ")"; }

} // namespace

Simulation::Simulation(UnitCatalog catalog, SimConfig cfg) : catalog_(std::move(catalog)), cfg_(cfg) {}

void Simulation::new_game(const NewGameConfig& cfg) {
  const std::uint64_t map_seed = cfg.map_seed ? *cfg.map_seed : util::entropy_seed();
  const std::uint64_t placement_seed = derive_seed(cfg.placement_seed, map_seed, kPlacementSalt);
  const std::uint64_t combat_seed = derive_seed(cfg.combat_seed, map_seed, kCombatSalt);

  GameState s;
  s.map = generate_terrain(cfg.width, cfg.height, map_seed, cfg.land_fraction);
  s.cities = place_cities(s.map, cfg.city_count, cfg.min_city_separation, placement_seed, cfg_.default_support_cap);
  if (s.cities.size() < 2) {
    throw std::runtime_error("new_game: only " + std::to_string(s.cities.size()) + " cities fit on a " +
                             std::to_string(cfg.width) + "x" + std::to_string(cfg.height) +
                             " map; at least 2 are required");
  }

  s.players.resize(kNumPlayers);
  s.players[0].id = 0;
  s.players[0].name = cfg.player1_name;
  s.players[1].id = 1;
  s.players[1].name = cfg.player2_name;

  s.rng_state = combat_seed;

  City& home1 = s.cities.front();
  City& home2 = s.cities.back();
  home1.owner = 0;
  home2.owner = 1;
  assign_default_production(home1, catalog_);
  assign_default_production(home2, catalog_);
  const TileCoord p1 = home1.pos();
  const TileCoord p2 = home2.pos();
  spawn_unit(s, catalog_, UnitType::Army, 0, p1, p1);
  spawn_unit(s, catalog_, UnitType::Army, 1, p2, p2);

  state_ = std::move(s);
  init_fog(state_);
  refresh_both_players();

  log::info("New game: " + std::to_string(cfg.width) + "x" + std::to_string(cfg.height) + ", " +
            std::to_string(state_.cities.size()) + " cities, " + std::to_string(state_.map.land_count()) +
            " land tiles, map seed " + std::to_string(map_seed));
}

void Simulation::load_game(GameState loaded) {
  state_ = std::move(loaded);

  // Hand-edited saves may reuse ids; keep new ids ahead of every stored one.
  Id max_id = 0;
  for (const auto& u : state_.units) max_id = std::max(max_id, u.id);
  if (state_.next_unit_id <= max_id) state_.next_unit_id = max_id + 1;

  bool fog_ok = state_.fog.size() == state_.players.size();
  for (const auto& f : state_.fog) {
    fog_ok = fog_ok && f.explored.size() == state_.map.tiles.size();
  }
  if (!fog_ok) {
    log::warn("Loaded save has no usable fog data; exploration history was reset");
    init_fog(state_);
  }
  for (auto& f : state_.fog) f.visible.assign(state_.map.tiles.size(), 0);

  refresh_both_players();
}

bool Simulation::set_production(int x, int y, const std::string& type_name, std::string* error) {
  if (state_.victory.game_over) {
    if (error) *error = "Game is over";
    return false;
  }
  City* c = empire::city_at(state_, x, y);
  if (!c || c->owner != state_.current_player) {
    if (error) *error = "No city of yours at " + pos_str(x, y);
    return false;
  }
  return empire::set_production(*c, type_name, catalog_, error);
}

bool Simulation::cycle_production(int x, int y, std::string* error) {
  if (state_.victory.game_over) {
    if (error) *error = "Game is over";
    return false;
  }
  City* c = empire::city_at(state_, x, y);
  if (!c || c->owner != state_.current_player) {
    if (error) *error = "No city of yours at " + pos_str(x, y);
    return false;
  }
  empire::cycle_production(*c, catalog_);
  return true;
}

bool Simulation::found_city(Id unit_id, std::string* error) {
  Unit* u = empire::find_unit(state_, unit_id);
  if (!validate_command(u, unit_id, error)) return false;
  if (u->type != UnitType::Army) {
    if (error) *error = "Only armies can found cities";
    return false;
  }
  if (!state_.map.is_land(u->x, u->y)) {
    if (error) *error = "Cannot found a city off land";
    return false;
  }
  if (empire::city_at(state_, u->x, u->y)) {
    if (error) *error = "There is already a city at " + pos_str(u->x, u->y);
    return false;
  }
  for (const auto& other : state_.units) {
    if (other.alive() && other.owner != u->owner && other.x == u->x && other.y == u->y) {
      if (error) *error = "Enemy unit present at " + pos_str(u->x, u->y);
      return false;
    }
  }

  City c;
  c.x = u->x;
  c.y = u->y;
  c.owner = u->owner;
  c.support_cap = cfg_.default_support_cap;
  assign_default_production(c, catalog_);

  // The army settles; this is not a combat loss.
  u->hp = 0;
  state_.cities.push_back(c);

  log::info(player_name(c.owner) + " founded a city at " + pos_str(c.x, c.y));
  refresh_both_players();
  return true;
}

bool Simulation::detonate_missile(Id unit_id, DetonationResult* out, std::string* error) {
  Unit* u = empire::find_unit(state_, unit_id);
  if (!validate_command(u, unit_id, error)) return false;
  if (u->type != UnitType::NuclearMissile) {
    if (error) *error = "Unit #" + std::to_string(unit_id) + " is not a missile";
    return false;
  }

  // Consumed, not lost: the missile is excluded from its own blast count.
  u->hp = 0;
  const DetonationResult r = detonate_at(u->x, u->y, catalog_.get(u->type).blast_radius, u->owner);
  if (out) *out = r;
  refresh_both_players();
  return true;
}

DetonationResult Simulation::detonate_at(int x, int y, int radius, PlayerId by_player) {
  DetonationResult r;
  r.x = x;
  r.y = y;
  r.radius = std::max(0, radius);
  const long long r2 = static_cast<long long>(r.radius) * r.radius;

  for (Unit& u : state_.units) {
    if (!u.alive()) continue;
    if (distance_squared(u.pos(), TileCoord{x, y}) > r2) continue;
    u.hp = 0;
    record_kill(by_player, u);
    ++r.units_destroyed;
  }
  for (City& c : state_.cities) {
    if (c.is_neutral()) continue;
    if (distance_squared(c.pos(), TileCoord{x, y}) > r2) continue;
    c.owner = kNeutral;
    ++r.cities_neutralized;
  }

  log::info("Detonation at " + pos_str(x, y) + " radius " + std::to_string(r.radius) + ": " +
            std::to_string(r.units_destroyed) + " units destroyed, " + std::to_string(r.cities_neutralized) +
            " cities neutralized");
  return r;
}

void Simulation::recompute_visibility(PlayerId player) {
  empire::recompute_visibility(state_, catalog_, cfg_.city_sight_radius, player);
}

void Simulation::refresh_both_players() {
  for (PlayerId p = 0; p < static_cast<PlayerId>(state_.players.size()); ++p) recompute_visibility(p);
}

std::vector<std::string> Simulation::render_snapshot(const Viewport& view, std::optional<PlayerId> observer) const {
  return empire::render_snapshot(state_, catalog_, view, observer);
}

const Unit* Simulation::find_unit(Id id) const { return empire::find_unit(state_, id); }

const City* Simulation::city_at(int x, int y) const { return empire::city_at(state_, x, y); }

int Simulation::city_count(PlayerId player) const { return empire::city_count(state_, player); }

std::vector<const Unit*> Simulation::alive_units(std::optional<PlayerId> owner) const {
  std::vector<const Unit*> out;
  for (const auto& u : state_.units) {
    if (!u.alive()) continue;
    if (owner && u.owner != *owner) continue;
    out.push_back(&u);
  }
  return out;
}

std::vector<const City*> Simulation::cities_of(PlayerId owner) const {
  std::vector<const City*> out;
  for (const auto& c : state_.cities) {
    if (c.owner == owner) out.push_back(&c);
  }
  return out;
}

Id Simulation::next_unit(PlayerId owner, Id current) const {
  const auto own = alive_units(owner);
  if (own.empty()) return kInvalidId;

  std::size_t start = own.size() - 1;
  for (std::size_t i = 0; i < own.size(); ++i) {
    if (own[i]->id == current) start = i;
  }
  for (std::size_t step = 1; step <= own.size(); ++step) {
    const Unit* cand = own[(start + step) % own.size()];
    if (cand->moves_left > 0) return cand->id;
  }
  return own[(start + 1) % own.size()]->id;
}

const std::string& Simulation::player_name(PlayerId p) const {
  static const std::string kNeutralName = "neutral";
  if (!is_valid_player(state_, p)) return kNeutralName;
  return state_.players[static_cast<std::size_t>(p)].name;
}

} // namespace empire
