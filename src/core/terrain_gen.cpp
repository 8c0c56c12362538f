#include "empire/core/terrain_gen.h"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <stdexcept>
#include <string>

#include "empire/util/hash_rng.h"
#include "empire/util/log.h"

namespace empire {

namespace {

constexpr int kNoisePasses = 4;
constexpr int kCleanupPasses = 2;
constexpr double kLandLeaning = 0.5;
constexpr double kNoiseStep = 0.2;

// Number of in-bounds 8-neighbors of (x, y) matching `pred`.
template <typename Pred>
int count_neighbors(int width, int height, int x, int y, Pred pred) {
  int n = 0;
  for (int dy = -1; dy <= 1; ++dy) {
    for (int dx = -1; dx <= 1; ++dx) {
      if (dx == 0 && dy == 0) continue;
      const int nx = x + dx;
      const int ny = y + dy;
      if (nx < 0 || ny < 0 || nx >= width || ny >= height) continue;
      if (pred(nx, ny)) ++n;
    }
  }
  return n;
}

void smooth_noise(std::vector<double>& noise, int width, int height) {
  std::vector<double> next = noise;
  const auto idx = [width](int x, int y) { return static_cast<std::size_t>(y) * width + x; };
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      const int landish =
          count_neighbors(width, height, x, y, [&](int nx, int ny) { return noise[idx(nx, ny)] > kLandLeaning; });
      double& v = next[idx(x, y)];
      if (landish >= 5) {
        v = std::min(1.0, noise[idx(x, y)] + kNoiseStep);
      } else if (landish <= 3) {
        v = std::max(0.0, noise[idx(x, y)] - kNoiseStep);
      }
    }
  }
  noise.swap(next);
}

void smooth_tiles(TileMap& map) {
  TileMap next = map;
  for (int y = 0; y < map.height; ++y) {
    for (int x = 0; x < map.width; ++x) {
      const int land = count_neighbors(map.width, map.height, x, y,
                                       [&](int nx, int ny) { return map.at(nx, ny) == Terrain::Land; });
      const int water = count_neighbors(map.width, map.height, x, y,
                                        [&](int nx, int ny) { return map.at(nx, ny) == Terrain::Ocean; });
      if (land >= 5) {
        next.set(x, y, Terrain::Land);
      } else if (water >= 5) {
        next.set(x, y, Terrain::Ocean);
      }
    }
  }
  map = std::move(next);
}

// Carve x first, then y. Returns tiles flipped to land.
int carve_corridor(TileMap& map, TileCoord from, TileCoord to) {
  int flipped = 0;
  const auto paint = [&](int x, int y) {
    if (map.at(x, y) != Terrain::Land) {
      map.set(x, y, Terrain::Land);
      ++flipped;
    }
  };
  int x = from.x;
  int y = from.y;
  while (x != to.x) {
    paint(x, y);
    x += (to.x > x) ? 1 : -1;
  }
  while (y != to.y) {
    paint(x, y);
    y += (to.y > y) ? 1 : -1;
  }
  paint(x, y);
  return flipped;
}

} // namespace

std::vector<std::vector<TileCoord>> land_components(const TileMap& map) {
  std::vector<std::vector<TileCoord>> out;
  std::vector<std::uint8_t> seen(map.tiles.size(), 0);

  static constexpr int kDx[4] = {1, -1, 0, 0};
  static constexpr int kDy[4] = {0, 0, 1, -1};

  for (int y = 0; y < map.height; ++y) {
    for (int x = 0; x < map.width; ++x) {
      if (seen[map.index(x, y)] || map.at(x, y) != Terrain::Land) continue;

      std::vector<TileCoord> comp;
      std::deque<TileCoord> queue;
      seen[map.index(x, y)] = 1;
      queue.push_back({x, y});
      while (!queue.empty()) {
        const TileCoord c = queue.front();
        queue.pop_front();
        comp.push_back(c);
        for (int k = 0; k < 4; ++k) {
          const int nx = c.x + kDx[k];
          const int ny = c.y + kDy[k];
          if (!map.is_land(nx, ny) || seen[map.index(nx, ny)]) continue;
          seen[map.index(nx, ny)] = 1;
          queue.push_back({nx, ny});
        }
      }
      out.push_back(std::move(comp));
    }
  }
  return out;
}

int count_land_components(const TileMap& map) { return static_cast<int>(land_components(map).size()); }

int connect_land_components(TileMap& map) {
  auto comps = land_components(map);
  if (comps.size() <= 1) return 0;

  // Largest first; ties keep discovery order.
  std::stable_sort(comps.begin(), comps.end(),
                   [](const auto& a, const auto& b) { return a.size() > b.size(); });

  const TileCoord main_rep = comps.front().front();
  int flipped = 0;
  for (std::size_t i = 1; i < comps.size(); ++i) {
    flipped += carve_corridor(map, comps[i].front(), main_rep);
  }
  log::debug("Terrain: joined " + std::to_string(comps.size() - 1) + " islands to the main landmass (" +
             std::to_string(flipped) + " tiles carved)");
  return flipped;
}

TileMap generate_terrain(int width, int height, std::optional<std::uint64_t> seed, double land_fraction) {
  if (width < 1 || height < 1) {
    throw std::invalid_argument("generate_terrain: map must be at least 1x1 (got " + std::to_string(width) +
                                "x" + std::to_string(height) + ")");
  }
  land_fraction = std::clamp(land_fraction, 0.0, 1.0);

  util::HashRng rng(seed ? *seed : util::entropy_seed());

  const std::size_t n = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
  std::vector<double> noise(n);
  for (double& v : noise) v = rng.next_u01();

  for (int pass = 0; pass < kNoisePasses; ++pass) smooth_noise(noise, width, height);

  std::vector<double> sorted = noise;
  std::sort(sorted.begin(), sorted.end());
  std::size_t cut = static_cast<std::size_t>((1.0 - land_fraction) * static_cast<double>(n));
  if (cut >= n) cut = n - 1;
  const double threshold = sorted[cut];

  TileMap map(width, height, Terrain::Ocean);
  for (std::size_t i = 0; i < n; ++i) {
    if (noise[i] >= threshold) map.tiles[i] = Terrain::Land;
  }

  for (int pass = 0; pass < kCleanupPasses; ++pass) smooth_tiles(map);

  connect_land_components(map);
  return map;
}

} // namespace empire
