#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "parlor/board.hpp"
#include "parlor/fen.hpp"
#include "parlor/game.hpp"
#include "parlor/perft.hpp"
#include "parlor/render.hpp"
#include "parlor/shell.hpp"
#include "parlor/square.hpp"

using namespace parlor;

static void usage() {
  std::cout <<
    "Parlor CLI\n"
    "Usage:\n"
    "  parlor [play] [--ascii] [fen <FEN...>]\n"
    "  parlor moves <square> [fen <FEN...>]\n"
    "  parlor perft <depth> [fen <FEN...>]\n"
    "  parlor divide <depth> [fen <FEN...>]\n"
    "If FEN omitted, uses the standard starting position with White to move.\n"
    "PARLOR_GLYPHS=ascii selects ASCII pieces.\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  std::string s;
  for (size_t k = i; k < a.size(); ++k) {
    if (!s.empty()) s.push_back(' ');
    s += a[k];
  }
  return s;
}

// Everything after "fen" (searched from index i) is the FEN, quoted or not.
static Position position_from_args(const std::vector<std::string>& a, size_t i) {
  for (; i < a.size(); ++i) {
    if (a[i] != "fen") continue;
    if (i + 1 >= a.size()) throw FenError("Missing FEN after 'fen'");
    return position_from_fen(join_from(a, i + 1));
  }
  return Position{};
}

static bool has_flag(const std::vector<std::string>& a, const std::string& flag) {
  for (const auto& s : a) if (s == flag) return true;
  return false;
}

static Glyphs glyphs_from_env(const std::vector<std::string>& a) {
  if (has_flag(a, "--ascii")) return Glyphs::Ascii;
  const char* env = std::getenv("PARLOR_GLYPHS");
  if (env && std::string(env) == "ascii") return Glyphs::Ascii;
  return Glyphs::Unicode;
}

static int to_int(const std::string& s) {
  return std::stoi(s);
}

static int run(const std::vector<std::string>& args) {
  const std::string cmd = args.empty() ? "play" : args[0];

  // [play] [--ascii] [fen <FEN...>]
  if (cmd == "play" || cmd == "--ascii" || cmd == "fen") {
    const size_t start = (cmd == "play") ? 1 : 0;
    Position pos = position_from_args(args, start);
    Game g(pos.board, pos.toMove);
    ShellOptions opt;
    opt.glyphs = glyphs_from_env(args);
    shell_loop(g, std::cin, std::cout, opt);
    return 0;
  }

  // moves <square> [fen <FEN...>]
  if (cmd == "moves") {
    if (args.size() < 2) { usage(); return 1; }
    const auto sq = parse_square(args[1]);
    if (!sq) { std::cerr << "error: bad square '" << args[1] << "'\n"; return 1; }
    Position pos = position_from_args(args, 2);
    std::string line;
    for (const auto& t : pos.board.legal_moves_from(*sq)) {
      if (!line.empty()) line += ", ";
      line += square_name(t);
    }
    std::cout << line << "\n";
    return 0;
  }

  // perft <depth> [fen <FEN...>]
  if (cmd == "perft") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    Position pos = position_from_args(args, 2);
    std::cout << perft(pos.board, pos.toMove, depth) << "\n";
    return 0;
  }

  // divide <depth> [fen <FEN...>]
  if (cmd == "divide") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    Position pos = position_from_args(args, 2);
    std::vector<std::pair<MovePair, std::uint64_t>> parts;
    perft_divide(pos.board, pos.toMove, depth, parts);
    std::uint64_t total = 0;
    for (auto& [m, n] : parts) {
      std::cout << square_name(m.from) << square_name(m.to) << " " << n << "\n";
      total += n;
    }
    std::cout << "total " << total << "\n";
    return 0;
  }

  usage();
  return cmd == "help" || cmd == "--help" ? 0 : 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  try {
    return run(args);
  } catch (const FenError& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  } catch (const std::invalid_argument& e) {
    std::cerr << "error: bad number (" << e.what() << ")\n";
    return 1;
  } catch (const std::out_of_range& e) {
    std::cerr << "error: number out of range (" << e.what() << ")\n";
    return 1;
  }
}
