#include "empire/core/city_placement.h"

#include "empire/util/hash_rng.h"
#include "empire/util/log.h"

#include <string>

namespace empire {

std::vector<City> place_cities(const TileMap& map, int count, int min_separation,
                               std::optional<std::uint64_t> seed, int support_cap) {
  std::vector<City> cities;
  if (count <= 0) return cities;

  std::vector<TileCoord> candidates;
  for (int y = 0; y < map.height; ++y) {
    for (int x = 0; x < map.width; ++x) {
      if (map.at(x, y) == Terrain::Land) candidates.push_back({x, y});
    }
  }

  util::HashRng rng(seed ? *seed : util::entropy_seed());
  rng.shuffle(candidates);

  for (const TileCoord& c : candidates) {
    if (static_cast<int>(cities.size()) >= count) break;

    bool far_enough = true;
    for (const City& placed : cities) {
      if (manhattan_distance(placed.pos(), c) < min_separation) {
        far_enough = false;
        break;
      }
    }
    if (!far_enough) continue;

    City city;
    city.x = c.x;
    city.y = c.y;
    city.support_cap = support_cap;
    cities.push_back(city);
  }

  if (static_cast<int>(cities.size()) < count) {
    log::debug("City placement: placed " + std::to_string(cities.size()) + " of " + std::to_string(count) +
               " requested cities");
  }
  return cities;
}

} // namespace empire
