#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace empire {

struct TileCoord {
  int x{0};
  int y{0};

  bool operator==(const TileCoord& rhs) const { return x == rhs.x && y == rhs.y; }
  bool operator!=(const TileCoord& rhs) const { return !(*this == rhs); }
};

inline int manhattan_distance(const TileCoord& a, const TileCoord& b) {
  return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

// Squared Euclidean distance; sight and blast tests compare against radius^2
// to stay in integer arithmetic.
inline int distance_squared(const TileCoord& a, const TileCoord& b) {
  const int dx = a.x - b.x;
  const int dy = a.y - b.y;
  return dx * dx + dy * dy;
}

// 8-neighborhood in the fixed priority order used for spawning:
// E, W, S, N, then the diagonals SE, SW, NE, NW.
constexpr int kNeighborCount = 8;
constexpr int kNeighborDx[kNeighborCount] = {1, -1, 0, 0, 1, -1, 1, -1};
constexpr int kNeighborDy[kNeighborCount] = {0, 0, 1, -1, 1, 1, -1, -1};

enum class Terrain : std::uint8_t { Ocean = 0, Land = 1 };

// Row-major width x height terrain grid.
struct TileMap {
  int width{0};
  int height{0};
  std::vector<Terrain> tiles;

  TileMap() = default;
  TileMap(int w, int h, Terrain fill = Terrain::Ocean)
      : width(w), height(h), tiles(static_cast<std::size_t>(w > 0 && h > 0 ? w * h : 0), fill) {}

  bool in_bounds(int x, int y) const { return x >= 0 && y >= 0 && x < width && y < height; }

  std::size_t index(int x, int y) const {
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x);
  }

  Terrain at(int x, int y) const { return tiles[index(x, y)]; }
  void set(int x, int y, Terrain t) { tiles[index(x, y)] = t; }

  // Out-of-bounds coordinates are neither land nor ocean.
  bool is_land(int x, int y) const { return in_bounds(x, y) && at(x, y) == Terrain::Land; }
  bool is_ocean(int x, int y) const { return in_bounds(x, y) && at(x, y) == Terrain::Ocean; }

  int land_count() const {
    int n = 0;
    for (Terrain t : tiles) n += (t == Terrain::Land) ? 1 : 0;
    return n;
  }
};

} // namespace empire
