#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "parlor/types.hpp"
#include "parlor/board.hpp"

namespace parlor {

struct MovePair {
  Square from;
  Square to;
};

// Every (from, to) available to `side` on b, scanning rank 8 to rank 1, a to h.
std::vector<MovePair> all_moves(const Board& b, Color side);

// Leaf count of the pseudo-legal move tree, sides alternating from `side`.
std::uint64_t perft(const Board& b, Color side, int depth);

// Per-move breakdown at root
void perft_divide(const Board& b, Color side, int depth,
                  std::vector<std::pair<MovePair, std::uint64_t>>& out);

} // namespace parlor
