#include "parlor/fen.hpp"
#include <cctype>
#include <sstream>
#include <string>

namespace parlor {

static inline bool is_digit(char c) { return c >= '1' && c <= '8'; }

static inline bool char_to_piece(char c, Piece& out) {
  const Color col = std::isupper(static_cast<unsigned char>(c)) ? Color::White : Color::Black;
  switch (std::tolower(static_cast<unsigned char>(c))) {
    case 'p': out = Piece{PieceKind::Pawn,   col}; return true;
    case 'n': out = Piece{PieceKind::Knight, col}; return true;
    case 'b': out = Piece{PieceKind::Bishop, col}; return true;
    case 'r': out = Piece{PieceKind::Rook,   col}; return true;
    case 'q': out = Piece{PieceKind::Queen,  col}; return true;
    case 'k': out = Piece{PieceKind::King,   col}; return true;
    default:  return false;
  }
}

static inline char piece_to_char(const Piece& p) {
  const char* W = "PNBRQK";
  const char* B = "pnbrqk";
  const int idx = static_cast<int>(p.kind);
  return (p.color == Color::White ? W[idx] : B[idx]);
}

static void parse_placement(Board& b, const std::string& placement) {
  // FEN lists rank 8 first, which is row 0.
  int r = 0, c = 0;
  for (char ch : placement) {
    if (ch == '/') {
      if (c != BOARD_N) throw FenError("FEN rank does not cover 8 files");
      ++r; c = 0;
      if (r >= BOARD_N) throw FenError("FEN has more than 8 ranks");
      continue;
    }
    if (is_digit(ch)) {
      c += ch - '0';
      if (c > BOARD_N) throw FenError("FEN rank does not cover 8 files");
      continue;
    }
    Piece p;
    if (!char_to_piece(ch, p)) throw FenError("Invalid piece character in FEN");
    if (c >= BOARD_N) throw FenError("FEN rank does not cover 8 files");
    b.set_piece(Square{r, c}, p);
    ++c;
  }
  if (r != BOARD_N - 1) throw FenError("FEN must have 8 ranks");
  if (c != BOARD_N) throw FenError("FEN rank does not cover 8 files");
}

void set_from_fen(Board& b, std::string_view fen) {
  b.clear();

  std::istringstream ss{std::string(fen)};
  std::string placement;
  if (!(ss >> placement)) throw FenError("Empty FEN");

  try {
    parse_placement(b, placement);
  } catch (const FenError&) {
    b.clear();
    throw;
  }
}

std::string to_fen(const Board& b) {
  std::string out;
  for (int r = 0; r < BOARD_N; ++r) {
    int empties = 0;
    for (int c = 0; c < BOARD_N; ++c) {
      const auto p = b.at(Square{r, c});
      if (!p) {
        ++empties;
      } else {
        if (empties) { out += char('0' + empties); empties = 0; }
        out += piece_to_char(*p);
      }
    }
    if (empties) out += char('0' + empties);
    if (r != BOARD_N - 1) out += '/';
  }
  return out;
}

Color parse_color(std::string_view tok) {
  if (tok == "w") return Color::White;
  if (tok == "b") return Color::Black;
  throw FenError("Invalid active color in FEN");
}

Position position_from_fen(std::string_view fen) {
  Position pos;
  set_from_fen(pos.board, fen);

  std::istringstream ss{std::string(fen)};
  std::string placement, active;
  ss >> placement;
  if (ss >> active) pos.toMove = parse_color(active);
  return pos;
}

char color_to_char(Color c) { return c == Color::White ? 'w' : 'b'; }

} // namespace parlor
