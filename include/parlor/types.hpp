#pragma once
#include <cstdint>


namespace parlor {


enum class Color : int { White = 0, Black = 1 };


enum class PieceKind : int { Pawn=0, Knight=1, Bishop=2, Rook=3, Queen=4, King=5 };


constexpr int COLOR_N = 2;
constexpr int PIECE_N = 6;


// A piece is only its kind and its color; it carries no move history.
struct Piece {
PieceKind kind{PieceKind::Pawn};
Color color{Color::White};


bool operator==(const Piece&) const = default;
};


inline constexpr Color other(Color c) { return c == Color::White ? Color::Black : Color::White; }


} // namespace parlor
