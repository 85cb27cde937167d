#include "parlor/board.hpp"
#include "parlor/movegen.hpp"


namespace parlor {


static constexpr PieceKind BACK_RANK[BOARD_N] = {
PieceKind::Rook, PieceKind::Knight, PieceKind::Bishop, PieceKind::Queen,
PieceKind::King, PieceKind::Bishop, PieceKind::Knight, PieceKind::Rook,
};


static inline int promotion_row(Color c) { return c == Color::White ? 0 : BOARD_N - 1; }


Board::Board() { setup_start(); }


void Board::clear() {
for (auto& row : grid_) for (auto& cell : row) cell.reset();
}


void Board::setup_start() {
clear();
for (int c = 0; c < kSize; ++c) {
set_piece({6, c}, Piece{PieceKind::Pawn, Color::White});
set_piece({1, c}, Piece{PieceKind::Pawn, Color::Black});
set_piece({7, c}, Piece{BACK_RANK[c], Color::White});
set_piece({0, c}, Piece{BACK_RANK[c], Color::Black});
}
}


bool Board::move(Square src, Square dst) {
const std::optional<Piece> p = at(src);
if (!p) return false;


const std::optional<Piece> target = at(dst);
if (target && target->color == p->color) return false;


if (!pseudo_legal_moves(*this, src).contains(dst)) return false;


remove_piece(src);
if (p->kind == PieceKind::Pawn && dst.row == promotion_row(p->color))
set_piece(dst, Piece{PieceKind::Queen, p->color});
else
set_piece(dst, *p);
return true;
}


SquareList Board::legal_moves_from(Square s) const {
return pseudo_legal_moves(*this, s);
}


int Board::count(Color c) const {
int n = 0;
for (const auto& row : grid_)
for (const auto& cell : row)
if (cell && cell->color == c) ++n;
return n;
}


} // namespace parlor
