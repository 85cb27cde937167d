#pragma once
#include <array>
#include <optional>
#include "parlor/types.hpp"
#include "parlor/square.hpp"
#include "parlor/movelist.hpp"


namespace parlor {


class Board {
public:
static constexpr int kSize = BOARD_N;


// Standard starting position.
Board();


void clear();
void setup_start();


// Position setup; these bypass the movement rules.
void set_piece(Square s, Piece p) { grid_[idx_(s.row)][idx_(s.col)] = p; }
void remove_piece(Square s) { grid_[idx_(s.row)][idx_(s.col)].reset(); }


// Square must be in bounds.
std::optional<Piece> at(Square s) const { return grid_[idx_(s.row)][idx_(s.col)]; }


// Applies src->dst when the piece on src may go there, capturing whatever
// stands on dst and promoting a pawn that reaches the far rank to a queen.
// Returns false and leaves the board untouched otherwise.
bool move(Square src, Square dst);


// Pseudo-legal destinations of the piece on s; empty if s is vacant.
SquareList legal_moves_from(Square s) const;


int count(Color c) const;


bool operator==(const Board&) const = default;


private:
std::array<std::array<std::optional<Piece>, kSize>, kSize> grid_{};


static std::size_t idx_(int i) { return static_cast<std::size_t>(i); }
};


} // namespace parlor
