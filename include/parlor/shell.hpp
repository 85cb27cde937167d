// include/parlor/shell.hpp
#pragma once
#include <iosfwd>

#include "parlor/render.hpp"

namespace parlor {

class Game;

struct ShellOptions {
  Glyphs glyphs = Glyphs::Unicode;
  bool prompt = true;   // write "White >> " / "Black >> " before each read
};

// Interactive two-player loop. Reads one command per line from `in` until
// "quit"/"exit" or end of input. Malformed commands and illegal moves are
// ignored without output.
void shell_loop(Game& g, std::istream& in, std::ostream& out, const ShellOptions& opt = {});

} // namespace parlor
