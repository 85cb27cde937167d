#include <cassert>
#include "parlor/board.hpp"
#include "parlor/fen.hpp"
#include "parlor/movegen.hpp"

int main() {
  using namespace parlor;

  // Centre: all eight L-jumps.
  {
    Board b;
    set_from_fen(b, "8/8/8/8/3N4/8/8/8");
    assert(pseudo_legal_moves(b, {4, 3}).size() == 8);
  }

  // Corner: off-board targets are dropped.
  {
    Board b;
    set_from_fen(b, "8/8/8/8/8/8/8/N7");
    const auto ms = pseudo_legal_moves(b, {7, 0});
    assert(ms.size() == 2);
    assert(ms.contains({5, 1}) && ms.contains({6, 2}));
  }

  // Knights jump over pieces; own pieces on landing squares are excluded.
  {
    Board b;
    b.set_piece({5, 5}, Piece{PieceKind::Pawn, Color::White});   // f3
    const auto ms = pseudo_legal_moves(b, {7, 6});                // g1
    assert(ms.size() == 1 && ms.contains({5, 7}));
  }

  // Enemy on a landing square is a capture.
  {
    Board b;
    set_from_fen(b, "8/8/8/8/8/5p2/8/6N1");
    const auto ms = pseudo_legal_moves(b, {7, 6});
    assert(ms.size() == 3);
    assert(ms.contains({5, 5}));
  }

  return 0;
}
