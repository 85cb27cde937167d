#pragma once

#include <string>
#include <utility>
#include <vector>

#include "parlor/board.hpp"
#include "parlor/types.hpp"

namespace parlor {

struct HistoryEntry {
  std::string from;   // e.g. "e2"
  std::string to;     // e.g. "e4"
};

class Game {
public:
  // Standard starting position, White to move.
  Game() = default;
  Game(Board start, Color toMove) : board_(std::move(start)), turn_(toMove) {}

  const Board& board() const { return board_; }
  Color turn() const { return turn_; }
  const std::vector<HistoryEntry>& history() const { return history_; }

  bool running() const { return running_; }
  void quit() { running_ = false; }

  void switch_turn() { turn_ = other(turn_); }

  // Fails if src is vacant, holds a piece of the side not on move, or
  // Board::move rejects it. On success records the move and passes the turn.
  bool apply_move(Square src, Square dst);

  SquareList legal_moves_from(Square s) const { return board_.legal_moves_from(s); }

private:
  Board board_;
  Color turn_ = Color::White;
  std::vector<HistoryEntry> history_;
  bool running_ = true;
};

} // namespace parlor
