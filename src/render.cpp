#include "parlor/render.hpp"

#include <sstream>

namespace parlor {

// [color][kind], kinds in PieceKind order: P N B R Q K
static const char* const UNICODE_GLYPHS[COLOR_N][PIECE_N] = {
  { "♙", "♘", "♗", "♖", "♕", "♔" },
  { "♟", "♞", "♝", "♜", "♛", "♚" },
};

static const char* const ASCII_GLYPHS[COLOR_N][PIECE_N] = {
  { "P", "N", "B", "R", "Q", "K" },
  { "p", "n", "b", "r", "q", "k" },
};

std::string glyph(const Piece& p, Glyphs set) {
  const auto c = static_cast<std::size_t>(p.color);
  const auto k = static_cast<std::size_t>(p.kind);
  return set == Glyphs::Ascii ? ASCII_GLYPHS[c][k] : UNICODE_GLYPHS[c][k];
}

std::string render(const Board& b, Glyphs set) {
  static const char* SEP = "  +---+---+---+---+---+---+---+---+";

  std::ostringstream oss;
  for (int r = 0; r < Board::kSize; ++r) {
    oss << SEP << '\n';
    oss << (Board::kSize - r) << " |";
    for (int c = 0; c < Board::kSize; ++c) {
      const auto p = b.at(Square{r, c});
      oss << ' ' << (p ? glyph(*p, set) : std::string(" ")) << " |";
    }
    oss << '\n';
  }
  oss << SEP << '\n';
  oss << "    a   b   c   d   e   f   g   h";
  return oss.str();
}

} // namespace parlor
