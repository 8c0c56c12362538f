#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "empire/core/grid.h"
#include "empire/core/ids.h"

namespace empire {

// Closed set of unit kinds. Per-type behavior lives in UnitCatalog, not in
// a class hierarchy.
enum class UnitType : std::uint8_t {
  Army = 0,
  Fighter = 1,
  Carrier = 2,
  NuclearMissile = 3,
};

constexpr int kNumUnitTypes = 4;

constexpr std::array<UnitType, kNumUnitTypes> kAllUnitTypes = {
    UnitType::Army, UnitType::Fighter, UnitType::Carrier, UnitType::NuclearMissile};

inline int unit_type_index(UnitType t) { return static_cast<int>(t); }

// A unit step. Both components are in {-1, 0, 1}.
struct Direction {
  int dx{0};
  int dy{0};

  bool operator==(const Direction& rhs) const { return dx == rhs.dx && dy == rhs.dy; }
  bool operator!=(const Direction& rhs) const { return !(*this == rhs); }
};

struct City {
  int x{0};
  int y{0};

  PlayerId owner{kNeutral};

  // Production order. Progress counts up to cost; it is reset to 0 after a
  // spawn and held at cost while spawning is blocked.
  std::optional<UnitType> production;
  int production_progress{0};
  int production_cost{0};

  // Max number of alive armies that may list this city as home.
  int support_cap{2};

  TileCoord pos() const { return {x, y}; }
  bool is_neutral() const { return owner == kNeutral; }
};

struct Unit {
  Id id{kInvalidId};
  UnitType type{UnitType::Army};
  PlayerId owner{kNeutral};

  int x{0};
  int y{0};

  int hp{0};
  int max_hp{0};

  int moves_per_turn{0};
  int moves_left{0};

  // City that produced this unit, by coordinate. Only used for the army
  // support cap; never owns or outlives-checks the city.
  std::optional<TileCoord> home_city;

  // Missile flight state. The direction is unset until the first move.
  std::optional<Direction> locked_direction;
  int traveled{0};

  bool alive() const { return hp > 0; }
  TileCoord pos() const { return {x, y}; }
};

// Per-unit-type counters.
struct UnitTally {
  std::array<int, kNumUnitTypes> by_type{};

  int& operator[](UnitType t) { return by_type[static_cast<std::size_t>(unit_type_index(t))]; }
  int operator[](UnitType t) const { return by_type[static_cast<std::size_t>(unit_type_index(t))]; }

  int total() const {
    int n = 0;
    for (int v : by_type) n += v;
    return n;
  }
};

struct Player {
  PlayerId id{kNeutral};
  std::string name;

  // Declared for the save format; the engine never drives AI players.
  bool is_ai{false};

  UnitTally kills;
  UnitTally losses;
};

enum class BattleOutcome : std::uint8_t {
  AttackerWon,
  DefenderWon,
};

// One entry of the rolling battle log.
struct BattleReport {
  int turn{0};

  Id attacker_id{kInvalidId};
  PlayerId attacker_owner{kNeutral};
  UnitType attacker_type{UnitType::Army};

  Id defender_id{kInvalidId};
  PlayerId defender_owner{kNeutral};
  UnitType defender_type{UnitType::Army};

  int x{0};
  int y{0};

  // Effective hit chances after matchup and city modifiers.
  double attacker_hit{0.0};
  double defender_hit{0.0};
  bool defender_in_city{false};

  BattleOutcome outcome{BattleOutcome::DefenderWon};
  int rounds{0};

  std::string summary;
};

// Per-player fog of war. Both grids are row-major like TileMap.
// explored is monotonic; visible is rebuilt on every refresh.
struct PlayerFog {
  std::vector<std::uint8_t> explored;
  std::vector<std::uint8_t> visible;
};

struct VictoryState {
  bool game_over{false};
  PlayerId winner{kNeutral};
};

} // namespace empire
