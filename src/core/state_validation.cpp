#include "empire/core/state_validation.h"

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "empire/core/enum_strings.h"

namespace empire {

namespace {

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

unsigned long long id_u64(Id id) { return static_cast<unsigned long long>(id); }

std::string at_str(int x, int y) { return join("(", x, ",", y, ")"); }

bool owner_ok(const GameState& s, PlayerId p) { return p == kNeutral || is_valid_player(s, p); }

std::uint64_t tile_key(int x, int y) {
  return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(x)) << 32) |
         static_cast<std::uint32_t>(y);
}

} // namespace

std::vector<std::string> validate_game_state(const GameState& s, const UnitCatalog* catalog) {
  std::vector<std::string> errors;

  // --- Map ---
  const bool map_ok = s.map.width >= 1 && s.map.height >= 1 &&
                      s.map.tiles.size() == static_cast<std::size_t>(s.map.width) * s.map.height;
  if (!map_ok) {
    push(errors, join("Map size mismatch: ", s.map.width, "x", s.map.height, " with ", s.map.tiles.size(),
                      " tiles"));
  }

  // --- Players / bookkeeping ---
  if (static_cast<int>(s.players.size()) != kNumPlayers) {
    push(errors, join("Expected ", kNumPlayers, " players, found ", s.players.size()));
  }
  for (std::size_t i = 0; i < s.players.size(); ++i) {
    if (s.players[i].id != static_cast<PlayerId>(i)) {
      push(errors, join("Player index ", i, " has id ", s.players[i].id));
    }
  }
  if (!is_valid_player(s, s.current_player)) {
    push(errors, join("current_player ", s.current_player, " is not a player"));
  }
  if (s.turn_number < 1) push(errors, join("turn_number must be >= 1, got ", s.turn_number));
  if (s.next_unit_id == kInvalidId) push(errors, "next_unit_id must be non-zero");
  if (s.victory.game_over && !is_valid_player(s, s.victory.winner)) {
    push(errors, join("Game is over but winner ", s.victory.winner, " is not a player"));
  }

  // --- Cities ---
  std::unordered_set<std::uint64_t> city_tiles;
  for (std::size_t i = 0; i < s.cities.size(); ++i) {
    const City& c = s.cities[i];
    const std::string where = join("City ", i, " at ", at_str(c.x, c.y));
    if (!s.map.in_bounds(c.x, c.y)) {
      push(errors, where + " is out of bounds");
    } else if (map_ok && !s.map.is_land(c.x, c.y)) {
      push(errors, where + " is not on land");
    }
    if (!city_tiles.insert(tile_key(c.x, c.y)).second) push(errors, where + " shares its tile with another city");
    if (!owner_ok(s, c.owner)) push(errors, join(where, " has unknown owner ", c.owner));
    if (c.production_progress < 0) push(errors, join(where, " has negative progress ", c.production_progress));
    if (c.production && c.production_cost <= 0) {
      push(errors, join(where, " builds ", unit_type_to_string(*c.production), " with cost ", c.production_cost));
    }
    if (c.support_cap < 0) push(errors, join(where, " has negative support cap ", c.support_cap));
  }

  // --- Units ---
  std::unordered_set<Id> ids;
  std::unordered_set<std::uint64_t> occupied;
  for (const Unit& u : s.units) {
    const std::string who = join("Unit #", id_u64(u.id));
    if (u.id == kInvalidId) push(errors, "Unit with invalid id 0");
    if (!ids.insert(u.id).second) push(errors, who + " id is not unique");
    if (u.id >= s.next_unit_id) {
      push(errors, join(who, " is not below next_unit_id ", id_u64(s.next_unit_id)));
    }
    if (!is_valid_player(s, u.owner)) push(errors, join(who, " has unknown owner ", u.owner));
    if (u.max_hp <= 0) push(errors, join(who, " has max_hp ", u.max_hp));
    if (u.hp > u.max_hp) push(errors, join(who, " has hp ", u.hp, " above max ", u.max_hp));
    if (u.moves_left < 0 || u.moves_left > u.moves_per_turn) {
      push(errors, join(who, " has moves_left ", u.moves_left, " outside [0, ", u.moves_per_turn, "]"));
    }
    if (u.traveled < 0) push(errors, join(who, " has negative traveled ", u.traveled));
    if (u.locked_direction) {
      const Direction d = *u.locked_direction;
      if (u.type != UnitType::NuclearMissile) push(errors, who + " has a locked direction but is not a missile");
      if (d.dx < -1 || d.dx > 1 || d.dy < -1 || d.dy > 1 || (d.dx == 0 && d.dy == 0)) {
        push(errors, join(who, " has invalid locked direction ", at_str(d.dx, d.dy)));
      }
    }
    if (u.home_city && !s.map.in_bounds(u.home_city->x, u.home_city->y)) {
      push(errors, join(who, " has out-of-bounds home city ", at_str(u.home_city->x, u.home_city->y)));
    }

    // Dead units are inert until the next prune; only the living must be placed.
    if (!u.alive()) continue;
    if (!s.map.in_bounds(u.x, u.y)) {
      push(errors, join(who, " at ", at_str(u.x, u.y), " is out of bounds"));
      continue;
    }
    if (!occupied.insert(tile_key(u.x, u.y)).second) {
      push(errors, join(who, " shares tile ", at_str(u.x, u.y), " with another unit"));
    }
    if (catalog && map_ok && !terrain_allows(catalog->get(u.type).terrain, s.map.at(u.x, u.y))) {
      push(errors, join(who, " (", unit_type_to_string(u.type), ") stands on forbidden terrain at ",
                        at_str(u.x, u.y)));
    }
  }

  // --- Fog ---
  if (!s.fog.empty()) {
    if (s.fog.size() != s.players.size()) {
      push(errors, join("Fog has ", s.fog.size(), " entries for ", s.players.size(), " players"));
    }
    for (std::size_t p = 0; p < s.fog.size(); ++p) {
      const PlayerFog& f = s.fog[p];
      if (f.explored.size() != s.map.tiles.size()) {
        push(errors, join("Fog of player ", p, ": explored grid has ", f.explored.size(), " cells"));
        continue;
      }
      if (f.visible.empty()) continue;
      if (f.visible.size() != f.explored.size()) {
        push(errors, join("Fog of player ", p, ": visible grid has ", f.visible.size(), " cells"));
        continue;
      }
      for (std::size_t i = 0; i < f.visible.size(); ++i) {
        if (f.visible[i] && !f.explored[i]) {
          push(errors, join("Fog of player ", p, ": cell ", i, " is visible but not explored"));
          break;
        }
      }
    }
  }

  // --- Battle log ---
  for (std::size_t i = 0; i < s.battle_log.size(); ++i) {
    const BattleReport& b = s.battle_log[i];
    if (!is_valid_player(s, b.attacker_owner) || !is_valid_player(s, b.defender_owner)) {
      push(errors, join("Battle log entry ", i, " references an unknown player"));
    }
  }

  return errors;
}

} // namespace empire
