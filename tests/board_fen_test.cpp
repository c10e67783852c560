#include <cassert>
#include <string>

#include "gambit/model/board.hpp"
#include "gambit/model/chess_game.hpp"
#include "gambit/model/fen.hpp"
#include "gambit/model/fen_validator.hpp"
#include "gambit/model/notation.hpp"

using namespace gambit;

static core::Square sq(char file, int rank) {
  return model::make_square(file - 'a', rank - 1);
}

static bool throwsFenError(const std::string& fen) {
  try {
    model::fen::parse(fen);
  } catch (const model::FenError&) {
    return true;
  }
  return false;
}

int main() {
  // Board basics
  {
    model::Board b;
    assert(b.isEmpty(sq('e', 4)));
    b.setPiece(sq('e', 4), {core::PieceType::Knight, core::Color::Black});
    auto p = b.getPiece(sq('e', 4));
    assert(p && p->type == core::PieceType::Knight && p->color == core::Color::Black);
    assert(b.count(core::Color::Black, core::PieceType::Knight) == 1);
    assert(!b.getPiece(core::NO_SQUARE));
    b.setPiece(core::NO_SQUARE, {core::PieceType::Queen, core::Color::White});  // ignored
    assert(b.count(core::PieceType::Queen) == 0);
    b.movePiece(sq('e', 4), sq('f', 6));
    assert(b.isEmpty(sq('e', 4)) && !b.isEmpty(sq('f', 6)));
    assert(b.findKing(core::Color::White) == core::NO_SQUARE);
  }

  // Square text
  {
    assert(model::squareToString(sq('a', 1)) == "a1");
    assert(model::squareToString(sq('h', 8)) == "h8");
    assert(model::squareToString(core::NO_SQUARE) == "-");
    assert(model::stringToSquare("e4") == sq('e', 4));
    assert(model::stringToSquare("i4") == core::NO_SQUARE);
    assert(model::stringToSquare("e9") == core::NO_SQUARE);
    assert(model::BOARD_ORDER.front() == sq('a', 8));
    assert(model::BOARD_ORDER.back() == sq('h', 1));
  }

  // Start position
  {
    model::Position pos = model::fen::parse(core::START_FEN);
    const auto& b = pos.getBoard();
    assert(b.count(core::PieceType::Pawn) == 16);
    assert(b.findKing(core::Color::White) == sq('e', 1));
    assert(b.findKing(core::Color::Black) == sq('e', 8));
    assert(pos.getState().castlingRights == model::Castling::ALL);
    assert(pos.getState().sideToMove == core::Color::White);
    assert(pos.getState().enPassantSquare == core::NO_SQUARE);
    assert(model::fen::serialize(pos) == core::START_FEN);
  }

  // Round trip keeps every field
  {
    const std::string fens[] = {
        "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1",
        "rnbqkbnr/pppp1ppp/8/4p3/4P3/8/PPPP1PPP/RNBQKBNR w KQkq e6 0 2",
        "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 b - - 37 81",
        "4k3/8/8/8/8/8/8/R3K3 w Q - 99 60"};
    for (const auto& f : fens) {
      assert(model::fen::isFenWellFormed(f));
      model::Position p = model::fen::parse(f);
      assert(model::fen::serialize(p) == f);
      assert(model::fen::parse(model::fen::serialize(p)) == p);
    }
  }

  // Missing counters default to "0 1"
  {
    model::Position p = model::fen::parse("4k3/8/8/8/8/8/8/4K3 b - -");
    assert(p.getState().sideToMove == core::Color::Black);
    assert(p.getState().halfmoveClock == 0);
    assert(p.getState().fullmoveNumber == 1);
    assert(model::fen::serialize(p) == "4k3/8/8/8/8/8/8/4K3 b - - 0 1");
  }

  // Malformed input is rejected
  {
    assert(throwsFenError(""));
    assert(throwsFenError("not a fen at all"));
    assert(throwsFenError("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w KQkq - 0 1"));     // 7 ranks
    assert(throwsFenError("rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1"));
    assert(throwsFenError("rnbqkbnr/ppppXppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1"));
    assert(throwsFenError("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1"));
    assert(throwsFenError("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQxq - 0 1"));
    assert(throwsFenError("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq e4 0 1"));
    assert(throwsFenError("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - a 1"));
    assert(throwsFenError("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 0"));
    assert(throwsFenError("rnbq1bnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQ - 0 1"));   // no black king
    assert(throwsFenError("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBKKBNR w - - 0 1"));    // two white kings
    assert(throwsFenError("Pnbqkbnr/pppppppp/8/8/8/8/1PPPPPPP/RNBQKBNR w - - 0 1"));   // pawn on rank 8
    assert(!model::fen::validationError("8/8/8 w - -").empty());
  }

  // The side that just moved may not be left in check
  {
    assert(throwsFenError("4k3/8/8/8/8/8/8/4RK2 w - - 0 1"));  // black king on e8 attacked
    assert(throwsFenError("4k3/8/8/8/8/8/8/4r1K1 b - - 0 1"));  // white king on g1 attacked
    const auto mated = model::fen::parse("R5k1/5ppp/8/8/8/8/8/6K1 b - - 0 1");
    assert(mated.inCheck(core::Color::Black));
    assert(!throwsFenError("4k3/8/8/8/8/8/8/4RK2 b - - 0 1"));
  }

  // A failed load leaves the game as it was
  {
    model::ChessGame game;
    assert(game.doMoveUCI("e2e4"));
    const std::string before = game.getFen();
    bool threw = false;
    try {
      game.setPosition("garbage w - - 0 1");
    } catch (const model::FenError& e) {
      threw = true;
      assert(std::string(e.what()).find("Invalid FEN") != std::string::npos);
    }
    assert(threw);
    assert(game.getFen() == before);
    assert(game.getHistory().size() == 1);
  }

  return 0;
}
