#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include "parlor/board.hpp"

namespace parlor {

struct FenError : std::runtime_error { using std::runtime_error::runtime_error; };

// Piece placement only; side to move is tracked by Game.
inline constexpr char STARTPOS_FEN[] = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR";

// Reads the placement field (first whitespace-separated token) into b.
// Anything after it is ignored. On error b is left cleared and FenError is thrown.
void set_from_fen(Board& b, std::string_view fen);
std::string to_fen(const Board& b);

struct Position {
  Board board;
  Color toMove = Color::White;
};

// Placement from the first token, side to move from the second when present
// ("w" / "b"); remaining FEN fields are ignored. Throws FenError.
Position position_from_fen(std::string_view fen);

// "w" / "b"
Color parse_color(std::string_view tok);
char color_to_char(Color c);

} // namespace parlor
