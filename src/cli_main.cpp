#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "empire/core/enum_strings.h"
#include "empire/core/serialization.h"
#include "empire/core/simulation.h"
#include "empire/core/state_validation.h"
#include "empire/core/unit_catalog.h"
#include "empire/util/file_io.h"
#include "empire/util/log.h"
#include "empire/util/strings.h"

namespace {

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

double get_double_arg(int argc, char** argv, const std::string& key, double def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stod(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

// Every value given for a repeatable option, in command-line order.
std::vector<std::string> get_all_str_args(int argc, char** argv, const std::string& key) {
  std::vector<std::string> out;
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) out.push_back(argv[++i]);
  }
  return out;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "Empire CLI (headless)\n\n";
  std::cout << "Usage: " << exe << " [options]\n\n";
  std::cout << "New game:\n";
  std::cout << "  --width N          Map width (default 60)\n";
  std::cout << "  --height N         Map height (default 24)\n";
  std::cout << "  --seed N           Map seed (placement and combat seeds derive from it)\n";
  std::cout << "  --cities N         Number of cities to place (default 12)\n";
  std::cout << "  --min-sep N        Minimum Manhattan distance between cities (default 3)\n";
  std::cout << "  --land F           Land fraction in [0,1] (default 0.55)\n";
  std::cout << "  --content PATH     Unit catalog JSON overriding the built-in stats\n\n";
  std::cout << "Persistence:\n";
  std::cout << "  --load PATH        Load a save instead of generating a map\n";
  std::cout << "  --save PATH        Write the final state to a save\n";
  std::cout << "  --validate-save PATH  Check a save file and exit\n";
  std::cout << "  --dump-json        Print the final state as JSON\n\n";
  std::cout << "Commands:\n";
  std::cout << "  --cmd \"TEXT\"       Run one command (repeatable)\n";
  std::cout << "  --script PATH      Run commands from a file, one per line ('#' comments)\n";
  std::cout << "  --render           Print a map snapshot at the end\n";
  std::cout << "  --observer WHO     P1, P2 or all (default: the active player)\n\n";
  std::cout << "  Script commands:\n";
  std::cout << "    move <id> <dx> <dy>    prod <x> <y> <type>    cycle <x> <y>\n";
  std::cout << "    found <id>             detonate <id>          end\n";
  std::cout << "    render [P1|P2|all]     units    cities    battles\n\n";
  std::cout << "Other:\n";
  std::cout << "  --log-level LEVEL  debug, info, warn, error or off (default warn)\n";
  std::cout << "  --quiet            Only print what was asked for\n";
  std::cout << "  -h, --help         Show this help\n\n";
  std::cout << "Relative save paths are resolved under $EMPIRE_SAVE_DIR when it is set.\n";
}

std::string resolve_save_path(const std::string& path) {
  if (path.empty() || path.front() == '/') return path;
  const char* dir = std::getenv("EMPIRE_SAVE_DIR");
  if (!dir || !*dir) return path;
  std::string base = dir;
  if (base.back() != '/') base.push_back('/');
  return base + path;
}

// "P1"/"P2"/"all", case-insensitive. nullopt in `out` means everything.
bool parse_observer(const std::string& raw, std::optional<empire::PlayerId>* out) {
  const std::string s = empire::to_lower(raw);
  if (s == "all") {
    *out = std::nullopt;
    return true;
  }
  if (s == "p1" || s == "1") {
    *out = 0;
    return true;
  }
  if (s == "p2" || s == "2") {
    *out = 1;
    return true;
  }
  return false;
}

void print_render(const empire::Simulation& sim, std::optional<empire::PlayerId> observer) {
  const auto& s = sim.state();
  std::cout << "Turn " << s.turn_number << ", " << sim.player_name(s.current_player) << " to move";
  if (observer) std::cout << " (view: " << sim.player_name(*observer) << ")";
  std::cout << "\n";
  for (const auto& row : sim.render_snapshot(empire::full_viewport(s.map), observer)) std::cout << row << "\n";
}

void print_units(const empire::Simulation& sim) {
  for (const empire::Unit* u : sim.alive_units()) {
    std::cout << "#" << u->id << " " << sim.player_name(u->owner) << " " << empire::unit_type_to_string(u->type)
              << " at (" << u->x << "," << u->y << ") hp " << u->hp << "/" << u->max_hp << " moves "
              << u->moves_left << "/" << u->moves_per_turn << "\n";
  }
}

void print_cities(const empire::Simulation& sim) {
  for (const auto& c : sim.state().cities) {
    std::cout << "(" << c.x << "," << c.y << ") " << sim.player_name(c.owner);
    if (c.production) {
      std::cout << " building " << empire::unit_type_to_string(*c.production) << " " << c.production_progress << "/"
                << c.production_cost;
    }
    std::cout << "\n";
  }
}

void print_battles(const empire::Simulation& sim) {
  for (const auto& b : sim.state().battle_log) std::cout << "[turn " << b.turn << "] " << b.summary << "\n";
}

// Which fog view to print. By default the view follows the active player.
struct ViewChoice {
  bool follow_active{true};
  std::optional<empire::PlayerId> observer;

  std::optional<empire::PlayerId> resolve(const empire::Simulation& sim) const {
    if (follow_active) return sim.current_player();
    return observer;
  }
};

std::int64_t to_int(const std::string& token) {
  std::size_t used = 0;
  const long long v = std::stoll(token, &used, 10);
  if (used != token.size()) throw std::invalid_argument("not an integer: " + token);
  return v;
}

// Run one script line. Returns false for malformed commands; gameplay
// rejections are reported and do not stop the script.
bool run_command(empire::Simulation& sim, const std::string& line, const ViewChoice& default_view, bool quiet) {
  const auto tok = empire::split_ws(line);
  if (tok.empty() || tok.front().front() == '#') return true;
  const std::string cmd = empire::to_lower(tok.front());

  auto need = [&](std::size_t n) {
    if (tok.size() != n) {
      std::cerr << "Malformed command: '" << line << "'\n";
      return false;
    }
    return true;
  };
  auto report = [&](bool ok, const std::string& msg) {
    if (!ok) {
      std::cout << "rejected: " << msg << "\n";
    } else if (!quiet && !msg.empty()) {
      std::cout << msg << "\n";
    }
  };

  try {
    if (cmd == "move") {
      if (!need(4)) return false;
      const auto r = sim.attempt_move(static_cast<empire::Id>(to_int(tok[1])), static_cast<int>(to_int(tok[2])),
                                      static_cast<int>(to_int(tok[3])));
      report(r.moved || r.combat, r.message);
      if (r.victory) std::cout << sim.player_name(sim.winner()) << " wins\n";
      return true;
    }
    if (cmd == "prod") {
      if (!need(4)) return false;
      std::string err;
      const bool ok = sim.set_production(static_cast<int>(to_int(tok[1])), static_cast<int>(to_int(tok[2])), tok[3], &err);
      report(ok, ok ? "production set to " + tok[3] : err);
      return true;
    }
    if (cmd == "cycle") {
      if (!need(3)) return false;
      std::string err;
      const int x = static_cast<int>(to_int(tok[1]));
      const int y = static_cast<int>(to_int(tok[2]));
      const bool ok = sim.cycle_production(x, y, &err);
      std::string msg = err;
      if (ok) {
        const empire::City* c = sim.city_at(x, y);
        msg = "production set to " + empire::unit_type_to_string(*c->production);
      }
      report(ok, msg);
      return true;
    }
    if (cmd == "found") {
      if (!need(2)) return false;
      std::string err;
      const bool ok = sim.found_city(static_cast<empire::Id>(to_int(tok[1])), &err);
      report(ok, ok ? "city founded" : err);
      return true;
    }
    if (cmd == "detonate") {
      if (!need(2)) return false;
      std::string err;
      empire::DetonationResult d;
      const bool ok = sim.detonate_missile(static_cast<empire::Id>(to_int(tok[1])), &d, &err);
      report(ok, ok ? "detonated: " + std::to_string(d.units_destroyed) + " units destroyed, " +
                          std::to_string(d.cities_neutralized) + " cities neutralized"
                    : err);
      return true;
    }
    if (cmd == "end") {
      if (!need(1)) return false;
      const auto r = sim.end_turn();
      report(!r.already_over, r.message);
      if (r.victory) std::cout << sim.player_name(r.winner) << " wins\n";
      return true;
    }
    if (cmd == "render") {
      std::optional<empire::PlayerId> view = default_view.resolve(sim);
      if (tok.size() == 2 && !parse_observer(tok[1], &view)) {
        std::cerr << "Unknown observer: '" << tok[1] << "'\n";
        return false;
      }
      if (tok.size() > 2) return need(2);
      print_render(sim, view);
      return true;
    }
    if (cmd == "units") {
      print_units(sim);
      return true;
    }
    if (cmd == "cities") {
      print_cities(sim);
      return true;
    }
    if (cmd == "battles") {
      print_battles(sim);
      return true;
    }
  } catch (const std::exception& e) {
    std::cerr << "Malformed command: '" << line << "': " << e.what() << "\n";
    return false;
  }

  std::cerr << "Unknown command: '" << tok.front() << "'\n";
  return false;
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const bool quiet = has_flag(argc, argv, "--quiet");

    {
      empire::log::Level lvl = empire::log::Level::Warn;
      const std::string raw = get_str_arg(argc, argv, "--log-level", "warn");
      if (!empire::log::parse_level(raw, &lvl)) {
        std::cerr << "Unknown --log-level: '" << raw << "'\n\n";
        print_usage(argv[0]);
        return 2;
      }
      empire::log::set_level(lvl);
    }

    const std::string validate_path = get_str_arg(argc, argv, "--validate-save", "");
    if (!validate_path.empty()) {
      const std::string path = resolve_save_path(validate_path);
      try {
        const auto loaded = empire::deserialize_game_from_json(empire::read_text_file(path));
        const auto catalog = empire::default_unit_catalog();
        const auto errors = empire::validate_game_state(loaded, &catalog);
        if (!errors.empty()) {
          std::cerr << "Save validation failed:\n";
          for (const auto& e : errors) std::cerr << "  - " << e << "\n";
          return 1;
        }
      } catch (const std::exception& e) {
        std::cerr << "Save validation failed: " << e.what() << "\n";
        return 1;
      }
      if (!quiet) std::cout << "Save OK\n";
      return 0;
    }

    empire::UnitCatalog catalog = empire::default_unit_catalog();
    if (has_kv_arg(argc, argv, "--content")) {
      catalog = empire::load_unit_catalog_from_file(get_str_arg(argc, argv, "--content", ""));
    }
    empire::Simulation sim(catalog, empire::SimConfig{});

    const std::string load_path = get_str_arg(argc, argv, "--load", "");
    if (!load_path.empty()) {
      sim.load_game(empire::deserialize_game_from_json(empire::read_text_file(resolve_save_path(load_path))));
      if (!quiet) std::cout << "Loaded " << load_path << "\n";
    } else {
      empire::NewGameConfig cfg;
      cfg.width = get_int_arg(argc, argv, "--width", cfg.width);
      cfg.height = get_int_arg(argc, argv, "--height", cfg.height);
      cfg.city_count = get_int_arg(argc, argv, "--cities", cfg.city_count);
      cfg.min_city_separation = get_int_arg(argc, argv, "--min-sep", cfg.min_city_separation);
      cfg.land_fraction = get_double_arg(argc, argv, "--land", cfg.land_fraction);
      if (has_kv_arg(argc, argv, "--seed")) {
        cfg.map_seed = static_cast<std::uint64_t>(std::stoull(get_str_arg(argc, argv, "--seed", "0")));
      }
      sim.new_game(cfg);
    }

    ViewChoice view;
    if (has_kv_arg(argc, argv, "--observer")) {
      const std::string raw = get_str_arg(argc, argv, "--observer", "");
      view.follow_active = false;
      if (!parse_observer(raw, &view.observer)) {
        std::cerr << "Unknown --observer: '" << raw << "' (expected P1, P2 or all)\n";
        return 2;
      }
    }

    std::vector<std::string> commands;
    const std::string script_path = get_str_arg(argc, argv, "--script", "");
    if (!script_path.empty()) {
      std::istringstream in(empire::read_text_file(script_path));
      std::string line;
      while (std::getline(in, line)) commands.push_back(empire::trim_copy(line));
    }
    for (const auto& c : get_all_str_args(argc, argv, "--cmd")) commands.push_back(c);

    for (const auto& c : commands) {
      if (!run_command(sim, c, view, quiet)) return 2;
    }

    if (has_flag(argc, argv, "--render")) print_render(sim, view.resolve(sim));
    if (has_flag(argc, argv, "--dump-json")) std::cout << empire::serialize_game_to_json(sim.state()) << "\n";

    const std::string save_path = get_str_arg(argc, argv, "--save", "");
    if (!save_path.empty()) {
      const std::string path = resolve_save_path(save_path);
      empire::write_text_file(path, empire::serialize_game_to_json(sim.state()));
      if (!quiet) std::cout << "Saved " << path << "\n";
    }

    if (!quiet && sim.game_over()) std::cout << "Game over: " << sim.player_name(sim.winner()) << " won\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
