#pragma once
#include <cstdint>
#include <vector>

#include "board.hpp"
#include "game_state.hpp"
#include "move.hpp"

namespace gambit::model {

// Board plus the state that travels with it. Cheap to copy; the search
// works exclusively on copies of this type.
class Position {
 public:
  Position() = default;

  Board& getBoard() { return m_board; }
  const Board& getBoard() const { return m_board; }
  GameState& getState() { return m_state; }
  const GameState& getState() const { return m_state; }

  // Make/Unmake. doMove() rejects (and fully rolls back) a move that leaves
  // the mover's own king attacked; accepted moves must be taken back with undoMove().
  bool doMove(const Move& m);
  void undoMove();

  // Applies a move for good, without keeping undo information.
  // Precondition: m was produced by the legal move generator for this position.
  StateInfo playMove(const Move& m);

  // Statusabfragen
  [[nodiscard]] bool isSquareAttacked(core::Square sq, core::Color by) const noexcept;
  [[nodiscard]] bool inCheck() const noexcept { return inCheck(m_state.sideToMove); }
  [[nodiscard]] bool inCheck(core::Color c) const noexcept;
  [[nodiscard]] core::Square kingSquare(core::Color c) const noexcept {
    return m_board.findKing(c);
  }
  [[nodiscard]] bool checkMoveRule() const noexcept { return m_state.halfmoveClock >= 100; }

  bool operator==(const Position& other) const noexcept;

 private:
  Board m_board;
  GameState m_state;
  std::vector<StateInfo> m_history;

  // interne Helfer
  void applyMove(const Move& m, StateInfo& st);
  void unapplyMove(const StateInfo& st);
};

}  // namespace gambit::model
