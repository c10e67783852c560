#pragma once

#include <vector>

#include "board.hpp"
#include "game_state.hpp"
#include "move.hpp"
#include "position.hpp"

namespace gambit::model {

// Two-phase generation: pseudo-legal per piece, then a make/check/unmake filter.
// Output order: squares in BOARD_ORDER, then each piece's fixed direction order.
class MoveGenerator {
 public:
  // Pseudolegal moves of the piece on `from` (either color). Empty for an empty square.
  void generatePieceMoves(const Board& b, const GameState& st, core::Square from,
                          std::vector<Move>& out) const;

  // Pseudolegal moves of every piece of color `c`
  void generatePseudoLegalMoves(const Board& b, const GameState& st, core::Color c,
                                std::vector<Move>& out) const;
  void generatePseudoLegalMoves(const Board& b, const GameState& st,
                                std::vector<Move>& out) const {
    generatePseudoLegalMoves(b, st, st.sideToMove, out);
  }

  // Legal moves. `pos` is modified while filtering and restored before returning.
  void generateLegalMoves(Position& pos, core::Square from, std::vector<Move>& out) const;
  void generateLegalMoves(Position& pos, core::Color c, std::vector<Move>& out) const;
  void generateLegalMoves(Position& pos, std::vector<Move>& out) const {
    generateLegalMoves(pos, pos.getState().sideToMove, out);
  }

  bool hasLegalMove(Position& pos, core::Color c) const;

 private:
  void generatePawnMoves(const Board& b, const GameState& st, core::Square from, core::Color us,
                         std::vector<Move>& out) const;
  void generateCastlingMoves(const Board& b, const GameState& st, core::Square from,
                             core::Color us, std::vector<Move>& out) const;
  void filterLegal(Position& pos, const std::vector<Move>& pseudo, std::vector<Move>& out) const;
};

}  // namespace gambit::model
