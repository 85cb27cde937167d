#include <cassert>
#include "parlor/board.hpp"
#include "parlor/fen.hpp"
#include "parlor/movegen.hpp"

int main() {
  using namespace parlor;

  // White bishop on d5, empty board: 3 + 4 + 3 + 3 diagonal squares.
  {
    Board b;
    set_from_fen(b, "8/8/8/3B4/8/8/8/8");
    assert(pseudo_legal_moves(b, {3, 3}).size() == 13);
  }

  // Black bishop on c8 behind its own pawns has nothing; with b7 gone it reaches a6.
  {
    Board b;
    assert(pseudo_legal_moves(b, {0, 2}).empty());
    b.remove_piece({1, 1});
    const auto ms = pseudo_legal_moves(b, {0, 2});
    assert(ms.size() == 2);
    assert(ms.contains({1, 1}) && ms.contains({2, 0}));
  }

  // Diagonal stops on an enemy piece: bishop a1, black knight c3.
  {
    Board b;
    set_from_fen(b, "8/8/8/8/8/2n5/8/B7");
    const auto ms = pseudo_legal_moves(b, {7, 0});
    assert(ms.size() == 2);
    assert(ms.contains({6, 1}) && ms.contains({5, 2}));
  }

  return 0;
}
