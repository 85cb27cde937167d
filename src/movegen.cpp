#include "parlor/movegen.hpp"
#include "parlor/types.hpp"

namespace parlor {

// Orthogonals first, then diagonals; the queen walks all eight.
static constexpr int DR[8] = {-1, +1,  0,  0, -1, -1, +1, +1};
static constexpr int DC[8] = { 0,  0, -1, +1, -1, +1, -1, +1};

static constexpr int KN_DR[8] = {-2, -2, -1, -1, +1, +1, +2, +2};
static constexpr int KN_DC[8] = {-1, +1, -2, +2, -2, +2, -1, +1};

// Empty or opponent-occupied.
static inline bool can_land(const Board& b, int r, int c, Color us) {
  const auto t = b.at(Square{r, c});
  return !t || t->color != us;
}

static void slide(const Board& b, Square from, Color us, int firstDir, int lastDir, SquareList& out) {
  for (int dir = firstDir; dir < lastDir; ++dir) {
    int r = from.row + DR[dir], c = from.col + DC[dir];
    while (in_bounds(r, c)) {
      const auto t = b.at(Square{r, c});
      if (!t) {
        out.push(Square{r, c});
      } else {
        if (t->color != us) out.push(Square{r, c});
        break; // blocked
      }
      r += DR[dir]; c += DC[dir];
    }
  }
}

static void steps(const Board& b, Square from, Color us, const int* dr, const int* dc, SquareList& out) {
  for (int i = 0; i < 8; ++i) {
    const int r = from.row + dr[i], c = from.col + dc[i];
    if (in_bounds(r, c) && can_land(b, r, c, us)) out.push(Square{r, c});
  }
}

static void pawn_moves(const Board& b, Square from, Color us, SquareList& out) {
  const int d     = (us == Color::White ? -1 : +1);
  const int start = (us == Color::White ?  6 :  1);

  const int r1 = from.row + d;
  if (in_bounds(r1, from.col) && !b.at(Square{r1, from.col})) {
    out.push(Square{r1, from.col});
    const int r2 = from.row + 2 * d;
    if (from.row == start && in_bounds(r2, from.col) && !b.at(Square{r2, from.col}))
      out.push(Square{r2, from.col});
  }

  for (int dc : {-1, +1}) {
    const int c = from.col + dc;
    if (!in_bounds(r1, c)) continue;
    const auto t = b.at(Square{r1, c});
    if (t && t->color != us) out.push(Square{r1, c});
  }
}

SquareList pseudo_legal_moves(const Board& b, Square from) {
  SquareList out;
  const auto p = b.at(from);
  if (!p) return out;

  switch (p->kind) {
    case PieceKind::King:   steps(b, from, p->color, DR, DC, out); break;
    case PieceKind::Queen:  slide(b, from, p->color, 0, 8, out); break;
    case PieceKind::Rook:   slide(b, from, p->color, 0, 4, out); break;
    case PieceKind::Bishop: slide(b, from, p->color, 4, 8, out); break;
    case PieceKind::Knight: steps(b, from, p->color, KN_DR, KN_DC, out); break;
    case PieceKind::Pawn:   pawn_moves(b, from, p->color, out); break;
  }
  return out;
}

} // namespace parlor
