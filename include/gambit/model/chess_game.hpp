#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../constants.hpp"
#include "game_event.hpp"
#include "game_state.hpp"
#include "move_generator.hpp"
#include "position.hpp"

namespace gambit::model {

struct MoveRecord {
  std::string notation;
  core::Color color = core::Color::White;
  core::Square from = core::NO_SQUARE;
  core::Square to = core::NO_SQUARE;
  Move move{};
  core::PieceType promotion = core::PieceType::None;  // piece actually chosen
};

// The authoritative game: position, derived status, history and captures.
// Only doMove()/undoLastMove()/setPosition()/newGame() mutate it.
class ChessGame {
 public:
  ChessGame();

  void newGame(core::OpponentKind opponent = core::OpponentKind::Ai,
               core::Color playerColor = core::Color::White,
               const std::string& fen = core::START_FEN);
  // Throws FenError; the game is left untouched on failure.
  void setPosition(const std::string& fen);
  std::string getFen() const;  ///< current position as FEN

  // ---- Queries (never modify the game) ----
  const Position& getPosition() const { return m_position; }
  const Board& getBoard() const { return m_position.getBoard(); }
  const GameState& getGameState() const { return m_position.getState(); }
  const GameStatus& getStatus() const { return m_status; }
  std::optional<Piece> getPiece(core::Square sq) const;

  std::vector<Move> generateLegalMoves() const;  // side to move
  std::vector<Move> getLegalMoves(core::Square from) const;
  std::vector<Move> getAllLegalMoves(core::Color c) const;
  std::optional<Move> getMove(core::Square from, core::Square to,
                              core::PieceType promotion = core::PieceType::None) const;

  bool isKingInCheck(core::Color c) const { return m_position.inCheck(c); }
  bool isSquareAttacked(core::Square sq, core::Color by) const {
    return m_position.isSquareAttacked(sq, by);
  }
  core::Square getKingSquare(core::Color c) const { return m_position.kingSquare(c); }
  bool isEndgame() const;
  core::GameResult getResult() const;

  const std::vector<MoveRecord>& getHistory() const { return m_history; }
  std::optional<Move> getLastMove() const;
  // Pieces `capturer` has taken, in capture order
  const std::vector<Piece>& getCapturedBy(core::Color capturer) const {
    return capturer == core::Color::White ? m_captured_by_white : m_captured_by_black;
  }

  core::OpponentKind getOpponent() const { return m_opponent; }
  core::Color getPlayerColor() const { return m_player_color; }

  // ---- Mutation ----
  // Precondition: m comes from the legal move generator for the current position.
  // An explicit promotion choice overrides the piece carried by the move.
  GameEvents doMove(const Move& m, std::optional<core::PieceType> promotion = std::nullopt);
  // Finds the legal move by coordinates; returns false (and changes nothing) if there is none
  bool doMove(core::Square from, core::Square to,
              core::PieceType promotion = core::PieceType::None);
  bool doMoveUCI(const std::string& uciMove);

  bool canUndo() const { return !m_history.empty(); }
  bool undoLastMove();

 private:
  MoveGenerator m_move_gen;
  Position m_position;
  GameStatus m_status;
  std::string m_start_fen = core::START_FEN;
  std::vector<MoveRecord> m_history;
  std::vector<Piece> m_captured_by_white;
  std::vector<Piece> m_captured_by_black;
  core::OpponentKind m_opponent = core::OpponentKind::Ai;
  core::Color m_player_color = core::Color::White;

  void resetRecords();
  void checkGameResult(core::Color mover, GameEvents* events);
};

}  // namespace gambit::model
