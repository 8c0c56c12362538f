#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace empire::util {

// splitmix64 (Sebastiano Vigna): a tiny 64-bit mixer used both as the game's
// RNG step and for seeding. Not cryptographically secure.
inline std::uint64_t splitmix64(std::uint64_t x) {
  x += 0x9e3779b97f4a7c15ULL;
  x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
  x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
  return x ^ (x >> 31);
}

// Top 53 bits of a 64-bit word as a double in [0,1).
inline double u01_from_u64(std::uint64_t x) {
  const std::uint64_t v = x >> 11;
  return static_cast<double>(v) * (1.0 / 9007199254740992.0); // 2^53
}

inline std::uint64_t next_splitmix64(std::uint64_t& state) {
  state = splitmix64(state);
  return state;
}

// Unbiased integer in [0, bound_exclusive) by rejection sampling.
inline std::uint64_t bounded_u64(std::uint64_t& state, std::uint64_t bound_exclusive) {
  if (bound_exclusive <= 1) return 0;
  const std::uint64_t threshold = (std::uint64_t(0) - bound_exclusive) % bound_exclusive;
  for (;;) {
    const std::uint64_t r = next_splitmix64(state);
    if (r >= threshold) return r % bound_exclusive;
  }
}

// Fresh seed from the platform entropy source (used when no seed is given).
inline std::uint64_t entropy_seed() {
  std::random_device rd;
  const std::uint64_t hi = static_cast<std::uint64_t>(rd());
  const std::uint64_t lo = static_cast<std::uint64_t>(rd());
  return (hi << 32) ^ lo;
}

struct HashRng {
  std::uint64_t s{0};

  explicit HashRng(std::uint64_t seed) : s(seed) {}

  std::uint64_t next_u64() { return next_splitmix64(s); }

  double next_u01() { return u01_from_u64(next_u64()); }

  // Index in [0, n).
  std::size_t index(std::size_t n) {
    if (n <= 1) return 0;
    return static_cast<std::size_t>(bounded_u64(s, static_cast<std::uint64_t>(n)));
  }

  // Fisher-Yates.
  template <typename T>
  void shuffle(std::vector<T>& v) {
    for (std::size_t i = v.size(); i > 1; --i) {
      const std::size_t j = index(i);
      std::swap(v[i - 1], v[j]);
    }
  }
};

} // namespace empire::util
