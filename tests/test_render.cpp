#include <iostream>
#include <string>
#include <vector>

#include "empire/core/render.h"
#include "empire/core/visibility.h"
#include "test.h"

#define EMP_ASSERT(expr)                                                                            \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

int test_render() {
  using namespace empire;
  const UnitCatalog cat = default_unit_catalog();

  // Layout (6x3):
  //   row 0: land land land ocean ocean ocean
  //   rows 1-2: land
  GameState s = test::make_state(6, 3, Terrain::Land);
  test::paint(s, 3, 0, 5, 0, Terrain::Ocean);
  test::add_city(s, 0, 1, 0);
  test::add_city(s, 5, 2, 1);
  test::add_city(s, 2, 2, kNeutral);
  test::add_unit(s, cat, UnitType::Army, 0, 1, 1);
  test::add_unit(s, cat, UnitType::Carrier, 1, 4, 0);
  test::add_unit(s, cat, UnitType::Fighter, 1, 5, 2);

  // Reveal-all view.
  {
    const auto rows = render_snapshot(s, cat, full_viewport(s.map));
    EMP_ASSERT(rows.size() == 3u);
    EMP_ASSERT(rows[0] == "+++.c.");
    EMP_ASSERT(rows[1] == "OA++++");
    EMP_ASSERT(rows[2] == "++o++f");
  }

  // Viewport clipping.
  {
    const auto rows = render_snapshot(s, cat, Viewport{4, 1, 10, 10});
    EMP_ASSERT(rows.size() == 2u);
    EMP_ASSERT(rows[0] == "++");
    EMP_ASSERT(rows[1] == "+f");
    EMP_ASSERT(render_snapshot(s, cat, Viewport{7, 0, 3, 3}).empty());
    EMP_ASSERT(render_snapshot(s, cat, Viewport{0, 0, 0, 3}).empty());
  }

  // Fog: P1 has explored columns 0-3 but only sees columns 0-1 right now.
  {
    GameState f = s;
    for (int y = 0; y < 3; ++y) {
      for (int x = 0; x <= 3; ++x) f.fog[0].explored[f.map.index(x, y)] = 1;
      for (int x = 0; x <= 1; ++x) {
        f.fog[0].visible[f.map.index(x, y)] = 1;
      }
    }
    const auto rows = render_snapshot(f, cat, full_viewport(f.map), PlayerId{0});
    EMP_ASSERT(rows[0] == "+++.  ");
    EMP_ASSERT(rows[1] == "OA++  ");
    EMP_ASSERT(rows[2] == "++o+  ");

    // A remembered city shows as unknown even when owned.
    f.fog[0].explored[f.map.index(5, 2)] = 1;
    const auto rows2 = render_snapshot(f, cat, full_viewport(f.map), PlayerId{0});
    EMP_ASSERT(rows2[2] == "++o+ o");
  }

  // Enemy units appear only while visible.
  {
    GameState f = s;
    test::add_unit(f, cat, UnitType::Army, 1, 2, 1);
    recompute_visibility(f, cat, 3, 0);
    const auto rows = render_snapshot(f, cat, full_viewport(f.map), PlayerId{0});
    // The army at (1,1) sees (2,1); nothing of P1 reaches (4,0) or (5,2).
    EMP_ASSERT(rows[1][2] == 'a');
    EMP_ASSERT(rows[0][4] == ' ');
    EMP_ASSERT(rows[2][5] == ' ');

    const auto p2 = render_snapshot(f, cat, full_viewport(f.map), PlayerId{1});
    for (const auto& row : p2) EMP_ASSERT(row == "      ");
  }

  return 0;
}
