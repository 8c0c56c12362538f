#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "empire/core/combat.h"
#include "empire/core/game_state.h"
#include "empire/core/production.h"
#include "empire/core/render.h"
#include "empire/core/unit_catalog.h"

namespace empire {

struct SimConfig {
  // Sight radius of every owned city. Units use their catalog sight.
  int city_sight_radius{3};

  // Support cap given to cities created by placement or founding.
  int default_support_cap{2};

  // Maximum number of entries kept in GameState::battle_log (oldest dropped
  // first). 0 means unlimited.
  int battle_log_capacity{20};

  CombatRules combat;
};

// Parameters for Simulation::new_game().
struct NewGameConfig {
  int width{60};
  int height{24};

  // Unset seeds are derived from map_seed when that is set, and drawn from
  // the platform entropy source otherwise.
  std::optional<std::uint64_t> map_seed;
  std::optional<std::uint64_t> placement_seed;
  std::optional<std::uint64_t> combat_seed;

  double land_fraction{0.55};

  int city_count{12};
  int min_city_separation{3};

  std::string player1_name{"P1"};
  std::string player2_name{"P2"};
};

struct DetonationResult {
  int x{0};
  int y{0};
  int radius{0};
  int units_destroyed{0};
  int cities_neutralized{0};
};

struct MoveResult {
  bool moved{false};
  bool captured_city{false};

  // Set only by the move that ended the game.
  bool victory{false};

  // A battle was fought (whether or not the attacker advanced).
  bool combat{false};
  bool attacker_won{false};

  // A missile reached its range or ran out of moves and went off.
  bool detonated{false};
  DetonationResult detonation;

  std::string message;
};

struct EndTurnResult {
  // The active player changed.
  bool advanced{false};

  // This call declared the winner.
  bool victory{false};

  // The game had already ended before this call; nothing was processed.
  bool already_over{false};

  PlayerId winner{kNeutral};

  ProductionReport production;
  int units_healed{0};
  int missiles_detonated{0};
  int fighters_lost{0};

  std::string message;
};

class Simulation {
 public:
  explicit Simulation(UnitCatalog catalog = default_unit_catalog(), SimConfig cfg = SimConfig{});

  const UnitCatalog& catalog() const { return catalog_; }
  const SimConfig& cfg() const { return cfg_; }

  GameState& state() { return state_; }
  const GameState& state() const { return state_; }

  // Generate terrain, place cities, hand out the two starting cities with
  // an army each and compute fog. Throws std::runtime_error if fewer than
  // two cities fit on the map, std::invalid_argument for a bad map size.
  void new_game(const NewGameConfig& cfg = NewGameConfig{});

  // Adopt a deserialized state. Visible grids are rebuilt from positions.
  void load_game(GameState loaded);

  // --- Player commands ---
  // Commands never throw for gameplay reasons. A rejected command leaves the
  // state unchanged and explains itself through the result message or the
  // error out-parameter. After the game is over every command is rejected.

  // Step a unit one tile in a king direction (dx, dy in {-1, 0, 1}).
  MoveResult attempt_move(Id unit_id, int dx, int dy);

  // Production orders for a city of the active player, addressed by tile.
  bool set_production(int x, int y, const std::string& type_name, std::string* error = nullptr);
  bool cycle_production(int x, int y, std::string* error = nullptr);

  // Consume an army of the active player to found a city on its tile.
  bool found_city(Id unit_id, std::string* error = nullptr);

  // Consume a missile of the active player and detonate it where it stands.
  bool detonate_missile(Id unit_id, DetonationResult* out = nullptr, std::string* error = nullptr);

  // Production, healing, missile and fighter upkeep for the active player,
  // then the victory check and the handoff.
  EndTurnResult end_turn();

  // --- Effects ---

  // Destroy every alive unit within the radius (any owner) and neutralize
  // every city within it. Kills of enemy units are credited to by_player;
  // losses go to each unit's owner. City production fields are kept.
  DetonationResult detonate_at(int x, int y, int radius, PlayerId by_player);

  void recompute_visibility(PlayerId player);

  // --- Queries ---

  std::vector<std::string> render_snapshot(const Viewport& view,
                                           std::optional<PlayerId> observer = std::nullopt) const;

  const Unit* find_unit(Id id) const;
  const City* city_at(int x, int y) const;
  int city_count(PlayerId player) const;

  // Alive units in state order; all players when `owner` is unset.
  std::vector<const Unit*> alive_units(std::optional<PlayerId> owner = std::nullopt) const;
  std::vector<const City*> cities_of(PlayerId owner) const;

  // Unit selection cycling for a driver: the next unit of `owner` after
  // `current` (in state order, wrapping) that still has moves, or the next
  // unit at all when none has moves. kInvalidId when the player has none.
  Id next_unit(PlayerId owner, Id current = kInvalidId) const;

  bool game_over() const { return state_.victory.game_over; }
  PlayerId winner() const { return state_.victory.winner; }
  PlayerId current_player() const { return state_.current_player; }
  const std::string& player_name(PlayerId p) const;

 private:
  // simulation_move.cpp
  bool validate_command(const Unit* u, Id unit_id, std::string* error) const;
  void move_missile(Unit& u, int dx, int dy, MoveResult& out);
  void fight(Unit& attacker, Unit& defender, int nx, int ny, MoveResult& out);
  bool try_capture(Unit& u);
  bool check_capture_victory(PlayerId capturer);
  void record_battle(BattleReport report);
  void record_kill(PlayerId killer, const Unit& victim);

  // simulation_turn.cpp
  int force_missile_detonations(PlayerId player, const std::vector<Id>& just_built);
  int enforce_fighter_basing(PlayerId player);
  bool fighter_is_based(const Unit& fighter) const;
  void prune_dead_units();
  void reset_moves(PlayerId player);
  bool check_end_turn_victory(EndTurnResult& out);

  void refresh_both_players();

  UnitCatalog catalog_;
  SimConfig cfg_;
  GameState state_;
};

} // namespace empire
