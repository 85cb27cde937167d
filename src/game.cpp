#include "parlor/game.hpp"

namespace parlor {

bool Game::apply_move(Square src, Square dst) {
  const auto p = board_.at(src);
  if (!p || p->color != turn_) return false;
  if (!board_.move(src, dst)) return false;

  history_.push_back(HistoryEntry{square_name(src), square_name(dst)});
  switch_turn();
  return true;
}

} // namespace parlor
