#include "parlor/perft.hpp"
#include "parlor/movegen.hpp"
#include <utility>

namespace parlor {

std::vector<MovePair> all_moves(const Board& b, Color side) {
  std::vector<MovePair> out;
  for (int r = 0; r < Board::kSize; ++r) {
    for (int c = 0; c < Board::kSize; ++c) {
      const Square from{r, c};
      const auto p = b.at(from);
      if (!p || p->color != side) continue;
      for (const auto& to : pseudo_legal_moves(b, from)) out.push_back(MovePair{from, to});
    }
  }
  return out;
}

std::uint64_t perft(const Board& b, Color side, int depth) {
  if (depth <= 0) return 1ULL;

  const auto moves = all_moves(b, side);
  if (depth == 1) return static_cast<std::uint64_t>(moves.size());

  std::uint64_t nodes = 0ULL;
  for (const auto& m : moves) {
    Board child = b;
    if (child.move(m.from, m.to)) nodes += perft(child, other(side), depth - 1);
  }
  return nodes;
}

void perft_divide(const Board& b, Color side, int depth,
                  std::vector<std::pair<MovePair, std::uint64_t>>& out) {
  out.clear();
  if (depth <= 0) return;

  for (const auto& m : all_moves(b, side)) {
    Board child = b;
    if (child.move(m.from, m.to)) out.emplace_back(m, perft(child, other(side), depth - 1));
  }
}

} // namespace parlor
