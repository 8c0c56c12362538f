#pragma once

#include <cstdint>

namespace empire {

using Id = std::uint64_t;

constexpr Id kInvalidId = 0;

// Players are addressed by their index in GameState::players.
using PlayerId = int;

constexpr PlayerId kNeutral = -1;

// Hot-seat only.
constexpr int kNumPlayers = 2;

inline PlayerId opponent_of(PlayerId p) { return p == 0 ? 1 : (p == 1 ? 0 : kNeutral); }

} // namespace empire
