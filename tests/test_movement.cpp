#include <iostream>
#include <string>

#include "empire/core/simulation.h"
#include "test.h"

#define EMP_ASSERT(expr)                                                                            \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

namespace {

using namespace empire;

// 10x6: land in x 0..6, ocean in x 7..9. P1 city (0,0), P2 city (0,5).
GameState base_state() {
  GameState s = test::make_state(10, 6, Terrain::Land);
  test::paint(s, 7, 0, 9, 5, Terrain::Ocean);
  test::add_city(s, 0, 0, 0);
  test::add_city(s, 0, 5, 1);
  return s;
}

} // namespace

int test_movement() {
  const UnitCatalog cat = default_unit_catalog();

  // Army onto ocean, carrier onto land: rejected, nothing changes.
  {
    GameState s = base_state();
    const Id army = test::add_unit(s, cat, UnitType::Army, 0, 6, 2);
    const Id carrier = test::add_unit(s, cat, UnitType::Carrier, 0, 7, 3);
    Simulation sim;
    sim.load_game(s);

    auto r = sim.attempt_move(army, 1, 0);
    EMP_ASSERT(!r.moved);
    EMP_ASSERT(!r.message.empty());
    EMP_ASSERT(sim.find_unit(army)->x == 6);
    EMP_ASSERT(sim.find_unit(army)->moves_left == 1);

    r = sim.attempt_move(carrier, -1, 0);
    EMP_ASSERT(!r.moved);
    EMP_ASSERT(sim.find_unit(carrier)->x == 7);
    EMP_ASSERT(sim.find_unit(carrier)->moves_left == 3);

    r = sim.attempt_move(carrier, 1, 1);
    EMP_ASSERT(r.moved);
    EMP_ASSERT(sim.find_unit(carrier)->x == 8);
    EMP_ASSERT(sim.find_unit(carrier)->y == 4);
    EMP_ASSERT(sim.find_unit(carrier)->moves_left == 2);
  }

  // Basic validation.
  {
    GameState s = base_state();
    const Id army = test::add_unit(s, cat, UnitType::Army, 0, 3, 3);
    const Id enemy = test::add_unit(s, cat, UnitType::Army, 1, 5, 5);
    const Id edge = test::add_unit(s, cat, UnitType::Army, 0, 0, 2);
    Simulation sim;
    sim.load_game(s);

    EMP_ASSERT(!sim.attempt_move(army, 2, 0).moved);
    EMP_ASSERT(!sim.attempt_move(army, 0, 0).moved);
    EMP_ASSERT(!sim.attempt_move(9999, 1, 0).moved);
    EMP_ASSERT(!sim.attempt_move(enemy, -1, 0).moved); // not P1's unit
    EMP_ASSERT(!sim.attempt_move(edge, -1, 0).moved);  // off the map

    auto r = sim.attempt_move(army, 1, -1);
    EMP_ASSERT(r.moved);
    EMP_ASSERT(sim.find_unit(army)->x == 4);
    EMP_ASSERT(sim.find_unit(army)->y == 2);
    EMP_ASSERT(sim.find_unit(army)->moves_left == 0);

    r = sim.attempt_move(army, 1, 0);
    EMP_ASSERT(!r.moved);
    EMP_ASSERT(r.message.find("no moves") != std::string::npos);
  }

  // No stacking; fighters hop friendly units for 2 moves.
  {
    GameState s = base_state();
    const Id a1 = test::add_unit(s, cat, UnitType::Army, 0, 2, 2);
    test::add_unit(s, cat, UnitType::Army, 0, 3, 2);
    const Id f = test::add_unit(s, cat, UnitType::Fighter, 0, 1, 2);
    test::add_unit(s, cat, UnitType::Army, 0, 4, 4);
    test::add_unit(s, cat, UnitType::Army, 0, 5, 4);
    const Id f2 = test::add_unit(s, cat, UnitType::Fighter, 0, 3, 4);
    Simulation sim;
    sim.load_game(s);

    EMP_ASSERT(!sim.attempt_move(a1, 1, 0).moved);

    // (2,2) is friendly but (3,2) is also taken: no hop.
    EMP_ASSERT(!sim.attempt_move(f, 1, 0).moved);
    EMP_ASSERT(sim.find_unit(f)->moves_left == 6);

    // Hop from (3,4) over (4,4) is blocked by (5,4); go around instead.
    EMP_ASSERT(!sim.attempt_move(f2, 1, 0).moved);
    auto r = sim.attempt_move(f, 0, 1);
    EMP_ASSERT(r.moved);
    r = sim.attempt_move(f, 1, 0); // (1,3) -> (2,3)
    EMP_ASSERT(r.moved);
    r = sim.attempt_move(f, 0, -1); // (2,2) is friendly: hop to (2,1)
    EMP_ASSERT(r.moved);
    EMP_ASSERT(sim.find_unit(f)->x == 2);
    EMP_ASSERT(sim.find_unit(f)->y == 1);
    EMP_ASSERT(sim.find_unit(f)->moves_left == 2);
  }

  // Fighters cross ocean and never capture.
  {
    GameState s = base_state();
    test::add_city(s, 4, 2, kNeutral);
    const Id f = test::add_unit(s, cat, UnitType::Fighter, 0, 3, 2);
    Simulation sim;
    sim.load_game(s);
    auto r = sim.attempt_move(f, 1, 0);
    EMP_ASSERT(r.moved);
    EMP_ASSERT(!r.captured_city);
    EMP_ASSERT(sim.city_at(4, 2)->owner == kNeutral);
    for (int i = 0; i < 3; ++i) EMP_ASSERT(sim.attempt_move(f, 1, 0).moved);
    EMP_ASSERT(sim.state().map.is_ocean(sim.find_unit(f)->x, sim.find_unit(f)->y));
  }

  // Armies capture: owner flips and production resets to the default order.
  {
    GameState s = base_state();
    City& c = test::add_city(s, 4, 2, kNeutral);
    c.production = UnitType::Carrier;
    c.production_progress = 7;
    c.production_cost = 20;
    const Id a = test::add_unit(s, cat, UnitType::Army, 0, 3, 2);
    Simulation sim;
    sim.load_game(s);

    const auto r = sim.attempt_move(a, 1, 0);
    EMP_ASSERT(r.moved);
    EMP_ASSERT(r.captured_city);
    EMP_ASSERT(!r.victory);
    const City* cap = sim.city_at(4, 2);
    EMP_ASSERT(cap->owner == 0);
    EMP_ASSERT(cap->production && *cap->production == UnitType::Army);
    EMP_ASSERT(cap->production_progress == 0);
    EMP_ASSERT(cap->production_cost == 6);
    EMP_ASSERT(sim.city_count(0) == 2);
  }

  // Capturing the opponent's last city wins immediately; then all commands fail.
  {
    GameState s = base_state();
    const Id a = test::add_unit(s, cat, UnitType::Army, 0, 1, 4);
    const Id other = test::add_unit(s, cat, UnitType::Army, 0, 3, 3);
    Simulation sim;
    sim.load_game(s);

    const auto r = sim.attempt_move(a, -1, 1);
    EMP_ASSERT(r.moved);
    EMP_ASSERT(r.captured_city);
    EMP_ASSERT(r.victory);
    EMP_ASSERT(sim.game_over());
    EMP_ASSERT(sim.winner() == 0);
    EMP_ASSERT(sim.city_count(1) == 0);

    EMP_ASSERT(!sim.attempt_move(other, 1, 0).moved);
    std::string err;
    EMP_ASSERT(!sim.set_production(0, 0, "fighter", &err));
    EMP_ASSERT(!err.empty());
  }

  // Combat: a report is logged, one side dies, counters and RNG advance.
  {
    GameState s = base_state();
    const Id att = test::add_unit(s, cat, UnitType::Army, 0, 3, 3);
    const Id def = test::add_unit(s, cat, UnitType::Army, 1, 4, 3);
    Simulation sim;
    sim.load_game(s);
    const auto rng_before = sim.state().rng_state;

    const auto r = sim.attempt_move(att, 1, 0);
    EMP_ASSERT(r.combat);
    EMP_ASSERT(sim.state().rng_state != rng_before);
    EMP_ASSERT(sim.state().battle_log.size() == 1u);

    const auto& b = sim.state().battle_log.back();
    EMP_ASSERT(b.attacker_id == att);
    EMP_ASSERT(b.defender_id == def);
    EMP_ASSERT(b.x == 4 && b.y == 3);
    EMP_ASSERT(b.turn == 1);
    EMP_ASSERT(!b.defender_in_city);

    const Unit* a = sim.find_unit(att);
    const Unit* d = sim.find_unit(def);
    EMP_ASSERT((a == nullptr) != (d == nullptr));
    const auto& p1 = sim.state().players[0];
    const auto& p2 = sim.state().players[1];
    if (r.attacker_won) {
      EMP_ASSERT(b.outcome == BattleOutcome::AttackerWon);
      EMP_ASSERT(r.moved);
      EMP_ASSERT(a->x == 4 && a->y == 3);
      EMP_ASSERT(a->moves_left == 0);
      EMP_ASSERT(p1.kills[UnitType::Army] == 1);
      EMP_ASSERT(p2.losses[UnitType::Army] == 1);
    } else {
      EMP_ASSERT(b.outcome == BattleOutcome::DefenderWon);
      EMP_ASSERT(!r.moved);
      EMP_ASSERT(p2.kills[UnitType::Army] == 1);
      EMP_ASSERT(p1.losses[UnitType::Army] == 1);
    }
  }

  // Same seed, same battle.
  {
    GameState s = base_state();
    const Id att = test::add_unit(s, cat, UnitType::Army, 0, 3, 3);
    test::add_unit(s, cat, UnitType::Army, 1, 4, 3);
    s.rng_state = 424242;
    Simulation a;
    Simulation b;
    a.load_game(s);
    b.load_game(s);
    const auto ra = a.attempt_move(att, 1, 0);
    const auto rb = b.attempt_move(att, 1, 0);
    EMP_ASSERT(ra.attacker_won == rb.attacker_won);
    EMP_ASSERT(a.state().battle_log.back().rounds == b.state().battle_log.back().rounds);
    EMP_ASSERT(a.state().rng_state == b.state().rng_state);
  }

  // City defense modifier is recorded for a defender in its own city.
  {
    GameState s = base_state();
    const Id att = test::add_unit(s, cat, UnitType::Army, 0, 1, 4);
    test::add_unit(s, cat, UnitType::Army, 1, 0, 5);
    Simulation sim;
    sim.load_game(s);
    EMP_ASSERT(sim.attempt_move(att, -1, 1).combat);
    const auto& b = sim.state().battle_log.back();
    EMP_ASSERT(b.defender_in_city);
    EMP_ASSERT(b.attacker_hit < 0.5);
    EMP_ASSERT(b.defender_hit > 0.55);
  }

  // The battle log keeps only the newest entries.
  {
    GameState s = base_state();
    for (int i = 0; i < 5; ++i) {
      test::add_unit(s, cat, UnitType::Fighter, 0, 2, i);
      test::add_unit(s, cat, UnitType::NuclearMissile, 1, 3, i);
    }
    SimConfig cfg;
    cfg.battle_log_capacity = 3;
    Simulation sim(default_unit_catalog(), cfg);
    sim.load_game(s);

    Id last_attacker = kInvalidId;
    for (const Unit* u : sim.alive_units(0)) {
      last_attacker = u->id;
      EMP_ASSERT(sim.attempt_move(u->id, 1, 0).combat);
    }
    EMP_ASSERT(sim.state().battle_log.size() == 3u);
    EMP_ASSERT(sim.state().battle_log.back().attacker_id == last_attacker);
  }

  return 0;
}
