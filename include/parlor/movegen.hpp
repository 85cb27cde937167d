#pragma once
#include "parlor/board.hpp"
#include "parlor/movelist.hpp"


namespace parlor {


// Destinations for the piece standing on `from`, following its movement
// pattern and the current occupancy. Check is not considered.
// Returns an empty list if `from` is vacant.
SquareList pseudo_legal_moves(const Board& b, Square from);


} // namespace parlor
