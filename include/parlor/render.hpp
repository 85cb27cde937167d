#pragma once

#include <string>

#include "parlor/board.hpp"
#include "parlor/types.hpp"

namespace parlor {

enum class Glyphs { Unicode, Ascii };

// Display symbol for one piece. Distinct for every (kind, color) pair in both sets.
std::string glyph(const Piece& p, Glyphs set);

// Text grid, rank 8 at the top, files a..h beneath.
std::string render(const Board& b, Glyphs set = Glyphs::Unicode);

} // namespace parlor
