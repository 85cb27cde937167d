#include <cassert>
#include "parlor/board.hpp"
#include "parlor/fen.hpp"
#include "parlor/movegen.hpp"

int main() {
  using namespace parlor;
  const Square e2{6, 4}, e3{5, 4}, e4{4, 4}, d3{5, 3}, f3{5, 5};

  // 1) Double + single from start square with both empty, no diagonals onto empty squares.
  {
    Board b;
    const auto ms = pseudo_legal_moves(b, e2);
    assert(ms.size() == 2);
    assert(ms.contains(e3) && ms.contains(e4));
    assert(!ms.contains(d3) && !ms.contains(f3));
  }

  // 2) Black piece on d3 adds the capture.
  {
    Board b;
    b.set_piece(d3, Piece{PieceKind::Knight, Color::Black});
    const auto ms = pseudo_legal_moves(b, e2);
    assert(ms.size() == 3);
    assert(ms.contains(d3));
    assert(!ms.contains(f3));
  }

  // 3) Own piece on the diagonal is not a capture.
  {
    Board b;
    b.set_piece(f3, Piece{PieceKind::Knight, Color::White});
    assert(pseudo_legal_moves(b, e2).size() == 2);
  }

  // 4) Blocked directly: neither one nor two steps.
  {
    Board b;
    b.set_piece(e3, Piece{PieceKind::Bishop, Color::Black});
    assert(pseudo_legal_moves(b, e2).empty());
    assert(!b.move(e2, e4));
  }

  // 5) Second square occupied: single step only.
  {
    Board b;
    b.set_piece(e4, Piece{PieceKind::Bishop, Color::Black});
    const auto ms = pseudo_legal_moves(b, e2);
    assert(ms.size() == 1 && ms.contains(e3));
  }

  // 6) Off the start row there is never a two-square move.
  {
    Board b;
    set_from_fen(b, "8/8/8/8/8/4P3/8/8");
    const auto ms = pseudo_legal_moves(b, e3);
    assert(ms.size() == 1 && ms.contains(e4));
  }

  // 7) Black pawns move toward rank 1.
  {
    Board b;
    const auto ms = pseudo_legal_moves(b, {1, 4});   // e7
    assert(ms.size() == 2);
    assert(ms.contains({2, 4}) && ms.contains({3, 4}));
  }

  // 8) Edge file: captures only toward the board.
  {
    Board b;
    set_from_fen(b, "8/8/8/8/1p6/P7/8/8");
    const auto ms = pseudo_legal_moves(b, {5, 0});   // a3
    assert(ms.size() == 2);
    assert(ms.contains({4, 0}) && ms.contains({4, 1}));
  }

  // 9) No en passant: a pawn beside an enemy pawn cannot capture onto the empty square behind it.
  {
    Board b;
    set_from_fen(b, "8/8/8/3Pp3/8/8/8/8");
    const auto ms = pseudo_legal_moves(b, {3, 3});   // d5
    assert(ms.size() == 1 && ms.contains({2, 3}));
  }

  return 0;
}
