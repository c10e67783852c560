#include <algorithm>
#include <cassert>
#include <cstdint>
#include <vector>

#include "gambit/constants.hpp"
#include "gambit/model/fen.hpp"
#include "gambit/model/move_generator.hpp"
#include "gambit/model/notation.hpp"
#include "gambit/model/position.hpp"

using namespace gambit;

static core::Square sq(char file, int rank) {
  return model::make_square(file - 'a', rank - 1);
}

static std::uint64_t perft(model::Position& pos, const model::MoveGenerator& mg, int depth) {
  std::vector<model::Move> moves;
  mg.generateLegalMoves(pos, moves);
  if (depth == 1) return moves.size();
  std::uint64_t nodes = 0;
  for (const auto& m : moves) {
    bool ok = pos.doMove(m);
    assert(ok);
    nodes += perft(pos, mg, depth - 1);
    pos.undoMove();
  }
  return nodes;
}

static bool hasMove(const std::vector<model::Move>& moves, core::Square from, core::Square to) {
  return std::any_of(moves.begin(), moves.end(),
                     [&](const model::Move& m) { return m.from == from && m.to == to; });
}

int main() {
  model::MoveGenerator mg;

  // Perft counts
  {
    model::Position start = model::fen::parse(core::START_FEN);
    assert(perft(start, mg, 1) == 20);
    assert(perft(start, mg, 2) == 400);
    assert(perft(start, mg, 3) == 8902);
    // make/unmake leaves the position untouched
    assert(start == model::fen::parse(core::START_FEN));

    model::Position kiwipete = model::fen::parse(
        "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
    assert(perft(kiwipete, mg, 1) == 48);
    assert(perft(kiwipete, mg, 2) == 2039);

    model::Position endgame = model::fen::parse("8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1");
    assert(perft(endgame, mg, 3) == 2812);
  }

  // Generation order: board order, then direction order; promotions Q, R, B, N
  {
    model::Position pos = model::fen::parse("4k3/P7/8/8/8/8/8/4K2N w - - 0 1");
    std::vector<model::Move> moves;
    mg.generateLegalMoves(pos, moves);
    assert(moves.size() >= 4);
    assert(moves[0].from == sq('a', 7) && moves[0].promotion == core::PieceType::Queen);
    assert(moves[1].promotion == core::PieceType::Rook);
    assert(moves[2].promotion == core::PieceType::Bishop);
    assert(moves[3].promotion == core::PieceType::Knight);
    // the king on e1 comes before the knight on h1
    auto firstKnight = std::find_if(moves.begin(), moves.end(),
                                    [](const model::Move& m) { return m.from == 7; });
    auto firstKing = std::find_if(moves.begin(), moves.end(),
                                  [](const model::Move& m) { return m.from == 4; });
    assert(firstKing < firstKnight);
  }

  // Pinned piece has no legal moves
  {
    model::Position pos = model::fen::parse("4k3/4r3/8/8/8/8/4B3/4K3 w - - 0 1");
    std::vector<model::Move> moves;
    mg.generateLegalMoves(pos, sq('e', 2), moves);
    assert(moves.empty());
    std::vector<model::Move> pseudo;
    mg.generatePieceMoves(pos.getBoard(), pos.getState(), sq('e', 2), pseudo);
    assert(!pseudo.empty());
  }

  // Empty square: nothing
  {
    model::Position pos = model::fen::parse(core::START_FEN);
    std::vector<model::Move> moves;
    mg.generateLegalMoves(pos, sq('e', 4), moves);
    assert(moves.empty());
  }

  // Castling both ways, and the rook hop
  {
    model::Position pos = model::fen::parse("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    std::vector<model::Move> moves;
    mg.generateLegalMoves(pos, sq('e', 1), moves);
    assert(hasMove(moves, sq('e', 1), sq('g', 1)));
    assert(hasMove(moves, sq('e', 1), sq('c', 1)));

    auto castle = std::find_if(moves.begin(), moves.end(), [](const model::Move& m) {
      return m.castle == model::CastleSide::KingSide;
    });
    assert(castle != moves.end());
    pos.playMove(*castle);
    assert(pos.getBoard().getPiece(sq('f', 1))->type == core::PieceType::Rook);
    assert(pos.getBoard().isEmpty(sq('h', 1)));
    assert(pos.getState().castlingRights == (model::Castling::BK | model::Castling::BQ));
  }

  // No castling through an attacked square or out of check
  {
    model::Position pos = model::fen::parse("4kr2/8/8/8/8/8/8/R3K2R w KQ - 0 1");
    std::vector<model::Move> moves;
    mg.generateLegalMoves(pos, sq('e', 1), moves);
    assert(!hasMove(moves, sq('e', 1), sq('g', 1)));
    assert(hasMove(moves, sq('e', 1), sq('c', 1)));

    model::Position check = model::fen::parse("4r1k1/8/8/8/8/8/8/R3K2R w KQ - 0 1");
    moves.clear();
    mg.generateLegalMoves(check, sq('e', 1), moves);
    assert(!hasMove(moves, sq('e', 1), sq('g', 1)));
    assert(!hasMove(moves, sq('e', 1), sq('c', 1)));
  }

  // Queenside needs b1 empty but b1 may be attacked
  {
    model::Position pos = model::fen::parse("1r2k3/8/8/8/8/8/8/R3K3 w Q - 0 1");
    std::vector<model::Move> moves;
    mg.generateLegalMoves(pos, sq('e', 1), moves);
    assert(hasMove(moves, sq('e', 1), sq('c', 1)));

    model::Position blocked = model::fen::parse("4k3/8/8/8/8/8/8/RN2K3 w Q - 0 1");
    moves.clear();
    mg.generateLegalMoves(blocked, sq('e', 1), moves);
    assert(!hasMove(moves, sq('e', 1), sq('c', 1)));
  }

  // Stale rights without the rook do not allow castling
  {
    model::Position pos = model::fen::parse("4k3/8/8/8/8/8/8/4K3 w KQ - 0 1");
    std::vector<model::Move> moves;
    mg.generateLegalMoves(pos, sq('e', 1), moves);
    assert(!hasMove(moves, sq('e', 1), sq('g', 1)));
    assert(!hasMove(moves, sq('e', 1), sq('c', 1)));
  }

  // Rights vanish for good: rook move, rook capture, king move
  {
    model::Position pos = model::fen::parse("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    pos.playMove(model::Move(sq('a', 1), sq('a', 8), core::PieceType::None, core::PieceType::Rook));
    assert(pos.getState().castlingRights == (model::Castling::WK | model::Castling::BK));
    pos.playMove(model::Move(sq('e', 8), sq('e', 7)));
    assert(pos.getState().castlingRights == model::Castling::WK);
    pos.playMove(model::Move(sq('h', 1), sq('h', 2)));
    pos.playMove(model::Move(sq('e', 7), sq('e', 8)));
    pos.playMove(model::Move(sq('h', 2), sq('h', 1)));
    assert(pos.getState().castlingRights == 0);
    assert(model::fen::serialize(pos).find(" - ") != std::string::npos);
  }

  // En passant is offered for exactly one ply
  {
    model::Position pos = model::fen::parse("4k3/8/8/8/3p4/8/4P3/4K3 w - - 0 1");
    pos.playMove(model::Move(sq('e', 2), sq('e', 4), core::PieceType::None,
                             core::PieceType::None, false, true));
    assert(pos.getState().enPassantSquare == sq('e', 3));

    std::vector<model::Move> moves;
    mg.generateLegalMoves(pos, sq('d', 4), moves);
    auto ep = std::find_if(moves.begin(), moves.end(),
                           [](const model::Move& m) { return m.isEnPassant; });
    assert(ep != moves.end() && ep->to == sq('e', 3));
    assert(ep->captured == core::PieceType::Pawn);

    model::Position taken = pos;
    taken.playMove(*ep);
    assert(taken.getBoard().isEmpty(sq('e', 4)));
    assert(taken.getBoard().getPiece(sq('e', 3))->color == core::Color::Black);
    assert(taken.getState().halfmoveClock == 0);

    pos.playMove(model::Move(sq('e', 8), sq('e', 7)));
    pos.playMove(model::Move(sq('e', 1), sq('d', 1)));
    moves.clear();
    mg.generateLegalMoves(pos, sq('d', 4), moves);
    assert(moves.size() == 1 && moves[0].to == sq('d', 3));
  }

  // Attack detection
  {
    model::Position pos = model::fen::parse(core::START_FEN);
    assert(pos.isSquareAttacked(sq('f', 3), core::Color::White));
    assert(!pos.isSquareAttacked(sq('e', 4), core::Color::White));
    assert(pos.isSquareAttacked(sq('f', 6), core::Color::Black));
    assert(!pos.isSquareAttacked(core::NO_SQUARE, core::Color::Black));
    assert(!pos.inCheck(core::Color::White));
  }

  // Every legal move keeps the own king safe (kiwipete, both colours)
  {
    model::Position pos = model::fen::parse(
        "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
    for (core::Color c : {core::Color::White, core::Color::Black}) {
      std::vector<model::Move> moves;
      mg.generateLegalMoves(pos, c, moves);
      for (const auto& m : moves) {
        model::Position copy = pos;
        copy.playMove(m);
        assert(!copy.inCheck(c));
      }
    }
  }

  return 0;
}
