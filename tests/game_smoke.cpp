#include <cassert>
#include <iostream>
#include "parlor/game.hpp"
#include "parlor/fen.hpp"
#include "parlor/square.hpp"

using namespace parlor;

static bool play(Game& g, const char* from, const char* to) {
  return g.apply_move(*parse_square(from), *parse_square(to));
}

int main() {
  // Turn enforcement end to end
  {
    Game g;
    assert(g.turn() == Color::White);
    assert(g.running());

    assert(play(g, "e2", "e4"));
    assert(g.turn() == Color::Black);

    assert(!play(g, "e2", "e4"));       // e2 is vacant now
    assert(g.turn() == Color::Black);

    assert(play(g, "e7", "e5"));
    assert(g.turn() == Color::White);

    assert(g.history().size() == 2);
    assert(g.history()[0].from == "e2" && g.history()[0].to == "e4");
    assert(g.history()[1].from == "e7" && g.history()[1].to == "e5");
  }

  // Moving the opponent's piece is refused and changes nothing.
  {
    Game g;
    const Board before = g.board();
    assert(!play(g, "e7", "e5"));
    assert(g.turn() == Color::White);
    assert(g.history().empty());
    assert(g.board() == before);
  }

  // Illegal pattern with the right color also leaves turn and history alone.
  {
    Game g;
    assert(!play(g, "e2", "e5"));
    assert(!play(g, "a1", "a2"));       // self-capture
    assert(g.turn() == Color::White);
    assert(g.history().empty());
  }

  // A short game with a capture.
  {
    Game g;
    assert(play(g, "e2", "e4"));
    assert(play(g, "d7", "d5"));
    assert(play(g, "e4", "d5"));
    assert((g.board().at(*parse_square("d5")) == Piece{PieceKind::Pawn, Color::White}));
    assert(g.board().count(Color::Black) == 15);
    assert(g.legal_moves_from(*parse_square("d8")).size() == 3);   // d7, d6, xd5
  }

  // Starting from a custom position with Black to move.
  {
    Board b;
    set_from_fen(b, "8/8/8/8/8/8/7p/K7");
    Game g(b, Color::Black);
    assert(!play(g, "a1", "a2"));
    assert(play(g, "h2", "h1"));
    assert((g.board().at(*parse_square("h1")) == Piece{PieceKind::Queen, Color::Black}));
    assert(g.turn() == Color::White);
  }

  // switch_turn flips and flips back; quit clears the running flag.
  {
    Game g;
    g.switch_turn();
    assert(g.turn() == Color::Black);
    g.switch_turn();
    assert(g.turn() == Color::White);
    g.quit();
    assert(!g.running());
  }

  std::cout << "game_smoke ok\n";
  return 0;
}
