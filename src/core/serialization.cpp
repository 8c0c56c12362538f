#include "empire/core/serialization.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "empire/core/enum_strings.h"
#include "empire/core/state_validation.h"

namespace empire {

namespace {

using json::Array;
using json::Object;
using json::Value;

// --- Writing ---

Value num(double v) { return v; }

Value tile_coord_to_json(const TileCoord& c) {
  Object o;
  o["x"] = num(c.x);
  o["y"] = num(c.y);
  return o;
}

Value tally_to_json(const UnitTally& t) {
  Object o;
  for (UnitType type : kAllUnitTypes) o[unit_type_to_string(type)] = num(t[type]);
  return o;
}

Value owner_to_json(PlayerId p) {
  if (p == kNeutral) return nullptr;
  return num(p);
}

// One string per row, '+' for land and '.' for ocean.
Array tiles_to_rows(const TileMap& m) {
  Array rows;
  rows.reserve(static_cast<std::size_t>(m.height));
  for (int y = 0; y < m.height; ++y) {
    std::string row;
    row.reserve(static_cast<std::size_t>(m.width));
    for (int x = 0; x < m.width; ++x) row.push_back(m.at(x, y) == Terrain::Land ? '+' : '.');
    rows.push_back(std::move(row));
  }
  return rows;
}

Array grid_to_rows(const std::vector<std::uint8_t>& g, int width, int height) {
  Array rows;
  for (int y = 0; y < height; ++y) {
    std::string row;
    for (int x = 0; x < width; ++x) {
      const std::size_t i = static_cast<std::size_t>(y) * width + x;
      row.push_back(i < g.size() && g[i] ? '1' : '0');
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

Value city_to_json(const City& c) {
  Object o;
  o["x"] = num(c.x);
  o["y"] = num(c.y);
  o["owner"] = owner_to_json(c.owner);
  o["production"] = c.production ? Value(unit_type_to_string(*c.production)) : Value(nullptr);
  o["production_progress"] = num(c.production_progress);
  o["production_cost"] = num(c.production_cost);
  o["support_cap"] = num(c.support_cap);
  return o;
}

Value unit_to_json(const Unit& u) {
  Object o;
  o["id"] = num(static_cast<double>(u.id));
  o["type"] = unit_type_to_string(u.type);
  o["owner"] = num(u.owner);
  o["x"] = num(u.x);
  o["y"] = num(u.y);
  o["hp"] = num(u.hp);
  o["max_hp"] = num(u.max_hp);
  o["moves_per_turn"] = num(u.moves_per_turn);
  o["moves_left"] = num(u.moves_left);
  o["home_city"] = u.home_city ? tile_coord_to_json(*u.home_city) : Value(nullptr);
  if (u.locked_direction) {
    Object d;
    d["dx"] = num(u.locked_direction->dx);
    d["dy"] = num(u.locked_direction->dy);
    o["locked_direction"] = d;
  } else {
    o["locked_direction"] = nullptr;
  }
  o["traveled"] = num(u.traveled);
  return o;
}

Value battle_to_json(const BattleReport& b) {
  Object o;
  o["turn"] = num(b.turn);
  o["attacker_id"] = num(static_cast<double>(b.attacker_id));
  o["attacker_owner"] = num(b.attacker_owner);
  o["attacker_type"] = unit_type_to_string(b.attacker_type);
  o["defender_id"] = num(static_cast<double>(b.defender_id));
  o["defender_owner"] = num(b.defender_owner);
  o["defender_type"] = unit_type_to_string(b.defender_type);
  o["x"] = num(b.x);
  o["y"] = num(b.y);
  o["attacker_hit"] = num(b.attacker_hit);
  o["defender_hit"] = num(b.defender_hit);
  o["defender_in_city"] = b.defender_in_city;
  o["outcome"] = battle_outcome_to_string(b.outcome);
  o["rounds"] = num(b.rounds);
  o["summary"] = b.summary;
  return o;
}

// --- Reading ---
// Every accessor names the field it failed on; the json layer's own
// messages do not carry enough context for a save file.

const Value& field(const Value& obj, const std::string& key, const std::string& where) {
  const Object& o = obj.object();
  auto it = o.find(key);
  if (it == o.end()) throw std::runtime_error(where + ": missing '" + key + "'");
  return it->second;
}

// Whole number that fits an int; anything else would wrap on the cast.
int int_from_json(const Value& v, const std::string& what) {
  const double* d = v.as_number();
  if (!d) throw std::runtime_error(what + " must be a number");
  if (std::trunc(*d) != *d) throw std::runtime_error(what + " must be a whole number");
  if (*d < static_cast<double>(std::numeric_limits<int>::min()) ||
      *d > static_cast<double>(std::numeric_limits<int>::max())) {
    throw std::runtime_error(what + " is out of range");
  }
  return static_cast<int>(*d);
}

int int_field(const Value& obj, const std::string& key, const std::string& where) {
  return int_from_json(field(obj, key, where), where + ": '" + key + "'");
}

// Ids are non-negative and must stay exact in a double.
Id id_from_json(const Value& v, const std::string& what) {
  const double* d = v.as_number();
  if (!d) throw std::runtime_error(what + " must be a number");
  if (std::trunc(*d) != *d || *d < 0.0 || *d > 9007199254740992.0) {
    throw std::runtime_error(what + " must be a non-negative whole number");
  }
  return static_cast<Id>(*d);
}

Id id_field(const Value& obj, const std::string& key, const std::string& where) {
  return id_from_json(field(obj, key, where), where + ": '" + key + "'");
}

double number_field(const Value& obj, const std::string& key, const std::string& where) {
  const Value& v = field(obj, key, where);
  if (!v.is_number()) throw std::runtime_error(where + ": '" + key + "' must be a number");
  return v.number_value();
}

const std::string& string_field(const Value& obj, const std::string& key, const std::string& where) {
  const Value& v = field(obj, key, where);
  const std::string* s = v.as_string();
  if (!s) throw std::runtime_error(where + ": '" + key + "' must be a string");
  return *s;
}

const Array& array_field(const Value& obj, const std::string& key, const std::string& where) {
  const Value& v = field(obj, key, where);
  const Array* a = v.as_array();
  if (!a) throw std::runtime_error(where + ": '" + key + "' must be an array");
  return *a;
}

bool optional_bool(const Value& obj, const std::string& key, bool def) {
  const Object& o = obj.object();
  auto it = o.find(key);
  if (it == o.end()) return def;
  return it->second.bool_value(def);
}

UnitType unit_type_field(const Value& obj, const std::string& key, const std::string& where) {
  const std::string& name = string_field(obj, key, where);
  const auto t = unit_type_from_string(name);
  if (!t) throw std::runtime_error(where + ": unknown unit type '" + name + "'");
  return *t;
}

PlayerId owner_from_json(const Value& v, const std::string& where) {
  if (v.is_null()) return kNeutral;
  if (!v.is_number()) throw std::runtime_error(where + ": owner must be null or a player id");
  return int_from_json(v, where + ": owner");
}

std::vector<std::string> string_rows(const Array& rows, int width, int height, const std::string& where) {
  if (static_cast<int>(rows.size()) != height) {
    throw std::runtime_error(where + ": expected " + std::to_string(height) + " rows, found " +
                             std::to_string(rows.size()));
  }
  std::vector<std::string> out;
  out.reserve(rows.size());
  for (std::size_t y = 0; y < rows.size(); ++y) {
    const std::string* row = rows[y].as_string();
    if (!row || static_cast<int>(row->size()) != width) {
      throw std::runtime_error(where + ": row " + std::to_string(y) + " must be a string of " +
                               std::to_string(width) + " characters");
    }
    out.push_back(*row);
  }
  return out;
}

TileMap tiles_from_json(const Value& mv) {
  const int width = int_field(mv, "width", "map");
  const int height = int_field(mv, "height", "map");
  if (width < 1 || height < 1) throw std::runtime_error("map: width and height must be >= 1");

  TileMap m(width, height, Terrain::Ocean);
  const auto rows = string_rows(array_field(mv, "tiles", "map"), width, height, "map.tiles");
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      const char ch = rows[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
      if (ch == '+') {
        m.set(x, y, Terrain::Land);
      } else if (ch != '.') {
        throw std::runtime_error("map.tiles: unexpected character '" + std::string(1, ch) + "' at (" +
                                 std::to_string(x) + "," + std::to_string(y) + ")");
      }
    }
  }
  return m;
}

City city_from_json(const Value& v, std::size_t index) {
  const std::string where = "city " + std::to_string(index);
  City c;
  c.x = int_field(v, "x", where);
  c.y = int_field(v, "y", where);
  c.owner = owner_from_json(field(v, "owner", where), where);
  const Value& prod = field(v, "production", where);
  if (!prod.is_null()) c.production = unit_type_field(v, "production", where);
  c.production_progress = int_field(v, "production_progress", where);
  c.production_cost = int_field(v, "production_cost", where);
  c.support_cap = int_field(v, "support_cap", where);
  return c;
}

Unit unit_from_json(const Value& v, std::size_t index) {
  const std::string where = "unit " + std::to_string(index);
  Unit u;
  u.id = id_field(v, "id", where);
  u.type = unit_type_field(v, "type", where);
  u.owner = int_field(v, "owner", where);
  u.x = int_field(v, "x", where);
  u.y = int_field(v, "y", where);
  u.hp = int_field(v, "hp", where);
  u.max_hp = int_field(v, "max_hp", where);
  u.moves_per_turn = int_field(v, "moves_per_turn", where);
  u.moves_left = int_field(v, "moves_left", where);

  const Object& o = v.object();
  if (auto it = o.find("home_city"); it != o.end() && !it->second.is_null()) {
    u.home_city = TileCoord{int_field(it->second, "x", where + ".home_city"),
                            int_field(it->second, "y", where + ".home_city")};
  }
  if (auto it = o.find("locked_direction"); it != o.end() && !it->second.is_null()) {
    u.locked_direction = Direction{int_field(it->second, "dx", where + ".locked_direction"),
                                   int_field(it->second, "dy", where + ".locked_direction")};
  }
  if (auto it = o.find("traveled"); it != o.end()) u.traveled = int_from_json(it->second, where + ": 'traveled'");
  return u;
}

UnitTally tally_from_json(const Value& v, const std::string& where) {
  UnitTally t;
  if (v.is_null()) return t;
  for (const auto& [name, count] : v.object()) {
    const auto type = unit_type_from_string(name);
    if (!type) throw std::runtime_error(where + ": unknown unit type '" + name + "'");
    t[*type] = int_from_json(count, where + ": count for '" + name + "'");
  }
  return t;
}

Player player_from_json(const Value& v, std::size_t index) {
  const std::string where = "player " + std::to_string(index);
  Player p;
  p.id = int_field(v, "id", where);
  p.name = string_field(v, "name", where);
  p.is_ai = optional_bool(v, "is_ai", false);
  const Object& o = v.object();
  if (auto it = o.find("kills"); it != o.end()) p.kills = tally_from_json(it->second, where + ".kills");
  if (auto it = o.find("losses"); it != o.end()) p.losses = tally_from_json(it->second, where + ".losses");
  return p;
}

BattleReport battle_from_json(const Value& v, std::size_t index) {
  const std::string where = "battle " + std::to_string(index);
  BattleReport b;
  b.turn = int_field(v, "turn", where);
  b.attacker_id = id_field(v, "attacker_id", where);
  b.attacker_owner = int_field(v, "attacker_owner", where);
  b.attacker_type = unit_type_field(v, "attacker_type", where);
  b.defender_id = id_field(v, "defender_id", where);
  b.defender_owner = int_field(v, "defender_owner", where);
  b.defender_type = unit_type_field(v, "defender_type", where);
  b.x = int_field(v, "x", where);
  b.y = int_field(v, "y", where);
  b.attacker_hit = number_field(v, "attacker_hit", where);
  b.defender_hit = number_field(v, "defender_hit", where);
  b.defender_in_city = optional_bool(v, "defender_in_city", false);
  b.outcome = battle_outcome_from_string(string_field(v, "outcome", where));
  b.rounds = int_field(v, "rounds", where);
  const Object& o = v.object();
  if (auto it = o.find("summary"); it != o.end()) b.summary = it->second.string_value();
  return b;
}

GameState parse_state(const Value& root) {
  if (!root.is_object()) throw std::runtime_error("save: top level must be an object");

  GameState s;
  {
    int loaded_version = 1;
    if (auto it = root.object().find("save_version"); it != root.object().end()) {
      loaded_version = int_from_json(it->second, "save: 'save_version'");
    }
    if (loaded_version > kCurrentSaveVersion) {
      throw std::runtime_error("save: version " + std::to_string(loaded_version) +
                               " is newer than this build supports (" + std::to_string(kCurrentSaveVersion) + ")");
    }
    s.save_version = kCurrentSaveVersion;
  }

  const Value& mv = field(root, "map", "save");
  s.map = tiles_from_json(mv);

  const Array& cities = array_field(mv, "cities", "map");
  s.cities.reserve(cities.size());
  for (std::size_t i = 0; i < cities.size(); ++i) s.cities.push_back(city_from_json(cities[i], i));

  const Array& units = array_field(root, "units", "save");
  s.units.reserve(units.size());
  for (std::size_t i = 0; i < units.size(); ++i) s.units.push_back(unit_from_json(units[i], i));

  const Array& players = array_field(root, "players", "save");
  for (std::size_t i = 0; i < players.size(); ++i) s.players.push_back(player_from_json(players[i], i));

  s.turn_number = int_field(root, "turn_number", "save");
  s.current_player = int_field(root, "current_player", "save");

  s.next_unit_id = 1;
  if (auto it = root.object().find("next_unit_id"); it != root.object().end()) {
    s.next_unit_id = id_from_json(it->second, "save: 'next_unit_id'");
  }

  // The RNG state is a full 64-bit word, which a JSON number cannot carry
  // exactly; it is stored as a decimal string.
  if (auto it = root.object().find("rng_state"); it != root.object().end()) {
    const std::string* text = it->second.as_string();
    if (!text) throw std::runtime_error("save: 'rng_state' must be a decimal string");
    try {
      std::size_t used = 0;
      s.rng_state = std::stoull(*text, &used, 10);
      if (used != text->size()) throw std::invalid_argument("trailing characters");
    } catch (const std::exception&) {
      throw std::runtime_error("save: 'rng_state' is not a 64-bit decimal: '" + *text + "'");
    }
  }

  if (auto it = root.object().find("victory"); it != root.object().end() && !it->second.is_null()) {
    s.victory.game_over = optional_bool(it->second, "game_over", false);
    s.victory.winner = owner_from_json(field(it->second, "winner", "victory"), "victory");
  }

  if (auto it = root.object().find("battle_log"); it != root.object().end()) {
    const Array& log = it->second.array();
    for (std::size_t i = 0; i < log.size(); ++i) s.battle_log.push_back(battle_from_json(log[i], i));
  }

  // Explored grids are optional; Simulation::load_game() starts fresh fog
  // when they are absent.
  if (auto it = mv.object().find("explored"); it != mv.object().end()) {
    const Array& per_player = it->second.array();
    for (std::size_t p = 0; p < per_player.size(); ++p) {
      const auto rows = string_rows(per_player[p].array(), s.map.width, s.map.height,
                                    "map.explored[" + std::to_string(p) + "]");
      PlayerFog f;
      f.explored.assign(s.map.tiles.size(), 0);
      f.visible.assign(s.map.tiles.size(), 0);
      for (int y = 0; y < s.map.height; ++y) {
        for (int x = 0; x < s.map.width; ++x) {
          const char ch = rows[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
          if (ch != '0' && ch != '1') {
            throw std::runtime_error("map.explored: unexpected character '" + std::string(1, ch) + "'");
          }
          f.explored[s.map.index(x, y)] = ch == '1' ? 1 : 0;
        }
      }
      s.fog.push_back(std::move(f));
    }
  }

  return s;
}

} // namespace

json::Value serialize_game_to_json_value(const GameState& s) {
  Object root;
  root["save_version"] = num(kCurrentSaveVersion);
  root["turn_number"] = num(s.turn_number);
  root["current_player"] = num(s.current_player);
  root["next_unit_id"] = num(static_cast<double>(s.next_unit_id));
  root["rng_state"] = std::to_string(s.rng_state);

  Object map;
  map["width"] = num(s.map.width);
  map["height"] = num(s.map.height);
  map["tiles"] = tiles_to_rows(s.map);
  Array cities;
  cities.reserve(s.cities.size());
  for (const City& c : s.cities) cities.push_back(city_to_json(c));
  map["cities"] = std::move(cities);
  Array explored;
  for (const PlayerFog& f : s.fog) explored.push_back(grid_to_rows(f.explored, s.map.width, s.map.height));
  map["explored"] = std::move(explored);
  root["map"] = std::move(map);

  Array units;
  units.reserve(s.units.size());
  for (const Unit& u : s.units) units.push_back(unit_to_json(u));
  root["units"] = std::move(units);

  Array players;
  for (const Player& p : s.players) {
    Object o;
    o["id"] = num(p.id);
    o["name"] = p.name;
    o["is_ai"] = p.is_ai;
    o["kills"] = tally_to_json(p.kills);
    o["losses"] = tally_to_json(p.losses);
    players.push_back(std::move(o));
  }
  root["players"] = std::move(players);

  Object victory;
  victory["game_over"] = s.victory.game_over;
  victory["winner"] = owner_to_json(s.victory.winner);
  root["victory"] = std::move(victory);

  Array battles;
  for (const BattleReport& b : s.battle_log) battles.push_back(battle_to_json(b));
  root["battle_log"] = std::move(battles);

  return root;
}

std::string serialize_game_to_json(const GameState& s) { return json::stringify(serialize_game_to_json_value(s), 2); }

GameState deserialize_game_from_json(const std::string& json_text) {
  GameState s = parse_state(json::parse(json_text));

  const auto errors = validate_game_state(s);
  if (!errors.empty()) {
    std::string msg = "save failed validation: " + errors.front();
    if (errors.size() > 1) msg += " (and " + std::to_string(errors.size() - 1) + " more)";
    throw std::runtime_error(msg);
  }
  return s;
}

} // namespace empire
