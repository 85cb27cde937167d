#include "parlor/shell.hpp"
#include "parlor/game.hpp"
#include "parlor/fen.hpp"
#include "parlor/square.hpp"

#include <istream>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace parlor {

// ------------ helpers ------------
static std::vector<std::string> split_ws(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

static const char* side_name(Color c) { return c == Color::White ? "White" : "Black"; }

static void print_help(std::ostream& out) {
  out << "Commands:\n"
         "  <from> <to>    move a piece, e.g. e2 e4\n"
         "  moves <sq>     list destinations for the piece on <sq>\n"
         "  board          print the board\n"
         "  history        list moves played so far\n"
         "  fen            print the position\n"
         "  help           this text\n"
         "  quit | exit    leave\n";
}

static void print_moves(const Game& g, const std::string& sqText, std::ostream& out) {
  const auto sq = parse_square(sqText);
  if (!sq) return;

  std::string line;
  for (const auto& t : g.legal_moves_from(*sq)) {
    if (!line.empty()) line += ", ";
    line += square_name(t);
  }
  out << line << "\n";
}

// ------------ loop ------------
void shell_loop(Game& g, std::istream& in, std::ostream& out, const ShellOptions& opt) {
  out << render(g.board(), opt.glyphs) << "\n";

  std::string line;
  while (g.running()) {
    if (opt.prompt) { out << side_name(g.turn()) << " >> "; out.flush(); }
    if (!std::getline(in, line)) break;

    const auto tokens = split_ws(line);
    if (tokens.empty()) continue;
    const std::string& cmd = tokens[0];
    const bool bare = tokens.size() == 1;

    if (bare && (cmd == "quit" || cmd == "exit")) {
      g.quit();
    }
    else if (bare && cmd == "board") {
      out << render(g.board(), opt.glyphs) << "\n";
    }
    else if (bare && cmd == "history") {
      for (const auto& h : g.history()) out << h.from << " -> " << h.to << "\n";
    }
    else if (cmd == "moves") {
      if (tokens.size() >= 2) print_moves(g, tokens[1], out);
    }
    else if (bare && cmd == "fen") {
      out << to_fen(g.board()) << ' ' << color_to_char(g.turn()) << "\n";
    }
    else if (bare && cmd == "help") {
      print_help(out);
    }
    else if (tokens.size() == 2) {
      const auto src = parse_square(tokens[0]);
      const auto dst = parse_square(tokens[1]);
      if (!src || !dst) continue;
      if (!g.apply_move(*src, *dst)) continue;
      out << render(g.board(), opt.glyphs) << "\n";
    }
  }
  out.flush();
}

} // namespace parlor
