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

int test_missile() {
  using namespace empire;
  const UnitCatalog cat = default_unit_catalog();

  // The first move locks the direction.
  {
    GameState s = test::make_state(20, 7);
    test::add_city(s, 0, 0, 0);
    test::add_city(s, 19, 6, 1);
    const Id m = test::add_unit(s, cat, UnitType::NuclearMissile, 0, 2, 3);
    Simulation sim;
    sim.load_game(s);

    auto r = sim.attempt_move(m, 1, 0);
    EMP_ASSERT(r.moved);
    EMP_ASSERT(!r.detonated);
    const Unit* u = sim.find_unit(m);
    EMP_ASSERT(u->locked_direction && *u->locked_direction == (Direction{1, 0}));
    EMP_ASSERT(u->traveled == 1);
    EMP_ASSERT(u->moves_left == 7);

    r = sim.attempt_move(m, 0, 1);
    EMP_ASSERT(!r.moved);
    EMP_ASSERT(r.message.find("locked") != std::string::npos);
    u = sim.find_unit(m);
    EMP_ASSERT(u->x == 3 && u->y == 3);
    EMP_ASSERT(u->moves_left == 7);
    EMP_ASSERT(u->traveled == 1);
  }

  // Occupied tiles are hopped for 2 moves; a blocked hop is rejected.
  {
    GameState s = test::make_state(20, 7);
    test::add_city(s, 0, 0, 0);
    test::add_city(s, 19, 6, 1);
    const Id m = test::add_unit(s, cat, UnitType::NuclearMissile, 0, 2, 3);
    test::add_unit(s, cat, UnitType::Army, 1, 3, 3);
    test::add_unit(s, cat, UnitType::Army, 0, 6, 3);
    test::add_unit(s, cat, UnitType::Army, 0, 7, 3);
    Simulation sim;
    sim.load_game(s);

    auto r = sim.attempt_move(m, 1, 0);
    EMP_ASSERT(r.moved);
    EMP_ASSERT(!r.combat);
    const Unit* u = sim.find_unit(m);
    EMP_ASSERT(u->x == 4);
    EMP_ASSERT(u->traveled == 2);
    EMP_ASSERT(u->moves_left == 6);

    EMP_ASSERT(sim.attempt_move(m, 1, 0).moved); // (5,3)
    r = sim.attempt_move(m, 1, 0);               // (6,3) and (7,3) both taken
    EMP_ASSERT(!r.moved);
    EMP_ASSERT(sim.find_unit(m)->x == 5);
  }

  // Detonates on reaching max range.
  {
    UnitCatalog short_range = default_unit_catalog();
    short_range.get(UnitType::NuclearMissile).max_range = 3;

    GameState s = test::make_state(20, 7);
    test::add_city(s, 0, 0, 0);
    test::add_city(s, 19, 6, 1);
    City& target = test::add_city(s, 6, 4, 1);
    target.production = UnitType::Fighter;
    target.production_progress = 4;
    target.production_cost = 10;
    const Id m = test::add_unit(s, short_range, UnitType::NuclearMissile, 0, 2, 3);
    const Id victim = test::add_unit(s, short_range, UnitType::Army, 1, 7, 3);
    const Id own = test::add_unit(s, short_range, UnitType::Army, 0, 5, 5);
    const Id safe = test::add_unit(s, short_range, UnitType::Army, 1, 8, 4);
    Simulation sim(short_range, SimConfig{});
    sim.load_game(s);

    EMP_ASSERT(!sim.attempt_move(m, 1, 0).detonated);
    EMP_ASSERT(!sim.attempt_move(m, 1, 0).detonated);
    const auto r = sim.attempt_move(m, 1, 0);
    EMP_ASSERT(r.moved);
    EMP_ASSERT(r.detonated);
    EMP_ASSERT(r.detonation.x == 5 && r.detonation.y == 3);
    EMP_ASSERT(r.detonation.radius == 2);

    // Blast radius 2 around (5,3): (7,3) d2=4 and (5,5) d2=4 die, (8,4) d2=10 lives.
    EMP_ASSERT(sim.find_unit(m) == nullptr);
    EMP_ASSERT(sim.find_unit(victim) == nullptr);
    EMP_ASSERT(sim.find_unit(own) == nullptr);
    EMP_ASSERT(sim.find_unit(safe) != nullptr);
    EMP_ASSERT(r.detonation.units_destroyed == 2);

    // (6,4) is in range: neutralized, production untouched.
    const City* c = sim.city_at(6, 4);
    EMP_ASSERT(c->owner == kNeutral);
    EMP_ASSERT(c->production && *c->production == UnitType::Fighter);
    EMP_ASSERT(c->production_progress == 4);
    EMP_ASSERT(c->production_cost == 10);
    EMP_ASSERT(r.detonation.cities_neutralized == 1);

    // Kills only for enemy units; the missile itself is not a loss.
    const auto& p1 = sim.state().players[0];
    const auto& p2 = sim.state().players[1];
    EMP_ASSERT(p1.kills[UnitType::Army] == 1);
    EMP_ASSERT(p1.losses[UnitType::Army] == 1);
    EMP_ASSERT(p1.losses[UnitType::NuclearMissile] == 0);
    EMP_ASSERT(p2.losses[UnitType::Army] == 1);
  }

  // Detonates when out of moves.
  {
    UnitCatalog slow = default_unit_catalog();
    slow.get(UnitType::NuclearMissile).moves = 2;

    GameState s = test::make_state(20, 7);
    test::add_city(s, 0, 0, 0);
    test::add_city(s, 19, 6, 1);
    const Id m = test::add_unit(s, slow, UnitType::NuclearMissile, 0, 10, 3);
    Simulation sim(slow, SimConfig{});
    sim.load_game(s);
    EMP_ASSERT(!sim.attempt_move(m, -1, -1).detonated);
    EMP_ASSERT(sim.attempt_move(m, -1, -1).detonated);
    EMP_ASSERT(sim.find_unit(m) == nullptr);
  }

  // detonate_at: squared distance, every owner, every city in range.
  {
    GameState s = test::make_state(12, 12);
    test::add_city(s, 0, 0, 0);
    test::add_city(s, 11, 11, 1);
    test::add_city(s, 6, 6, 0);
    test::add_city(s, 5, 7, kNeutral);
    const Id a = test::add_unit(s, cat, UnitType::Army, 0, 5, 5);
    const Id b = test::add_unit(s, cat, UnitType::Army, 1, 8, 5);
    const Id c = test::add_unit(s, cat, UnitType::Fighter, 1, 7, 7);
    const Id d = test::add_unit(s, cat, UnitType::Army, 1, 9, 9);
    Simulation sim;
    sim.load_game(s);

    const auto r = sim.detonate_at(5, 5, 3, 1);
    EMP_ASSERT(sim.find_unit(a) == nullptr); // d2 = 0
    EMP_ASSERT(sim.find_unit(b) == nullptr); // d2 = 9
    EMP_ASSERT(sim.find_unit(c) == nullptr); // d2 = 8
    EMP_ASSERT(sim.find_unit(d) != nullptr); // d2 = 32
    EMP_ASSERT(r.units_destroyed == 3);
    EMP_ASSERT(sim.city_at(6, 6)->owner == kNeutral);
    EMP_ASSERT(sim.city_at(0, 0)->owner == 0);
    EMP_ASSERT(r.cities_neutralized == 1); // (5,7) was already neutral
    EMP_ASSERT(sim.state().players[1].kills[UnitType::Army] == 1);
    EMP_ASSERT(sim.state().players[1].losses.total() == 2);
  }

  // detonate_missile consumes the missile where it stands.
  {
    GameState s = test::make_state(12, 12);
    test::add_city(s, 0, 0, 0);
    test::add_city(s, 11, 11, 1);
    const Id m = test::add_unit(s, cat, UnitType::NuclearMissile, 0, 6, 6);
    const Id a = test::add_unit(s, cat, UnitType::Army, 0, 2, 2);
    const Id e = test::add_unit(s, cat, UnitType::Army, 1, 6, 8);
    Simulation sim;
    sim.load_game(s);

    std::string err;
    EMP_ASSERT(!sim.detonate_missile(a, nullptr, &err));
    EMP_ASSERT(err.find("not a missile") != std::string::npos);
    EMP_ASSERT(!sim.detonate_missile(e, nullptr, &err)); // not ours

    DetonationResult r;
    EMP_ASSERT(sim.detonate_missile(m, &r, &err));
    EMP_ASSERT(r.x == 6 && r.y == 6 && r.radius == 2);
    EMP_ASSERT(r.units_destroyed == 1);
    EMP_ASSERT(sim.find_unit(m) == nullptr);
    EMP_ASSERT(sim.find_unit(e) == nullptr);
    EMP_ASSERT(sim.find_unit(a) != nullptr);
    EMP_ASSERT(sim.state().players[0].losses.total() == 0);
    EMP_ASSERT(sim.state().players[0].kills[UnitType::Army] == 1);
  }

  return 0;
}
