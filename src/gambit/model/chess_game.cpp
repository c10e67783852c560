#include "gambit/model/chess_game.hpp"

#include <cassert>
#include <iostream>

#include "gambit/model/fen.hpp"
#include "gambit/model/notation.hpp"

namespace gambit::model {

namespace {
bool isPromotionPiece(core::PieceType t) {
  switch (t) {
    case core::PieceType::Queen:
    case core::PieceType::Rook:
    case core::PieceType::Bishop:
    case core::PieceType::Knight:
      return true;
    default:
      return false;
  }
}

core::PieceType promotionFromChar(char c) {
  switch (c) {
    case 'q':
      return core::PieceType::Queen;
    case 'r':
      return core::PieceType::Rook;
    case 'b':
      return core::PieceType::Bishop;
    case 'n':
      return core::PieceType::Knight;
    default:
      return core::PieceType::None;
  }
}
}  // namespace

ChessGame::ChessGame() {
  setPosition(core::START_FEN);
}

void ChessGame::newGame(core::OpponentKind opponent, core::Color playerColor,
                        const std::string& fen) {
  setPosition(fen);
  m_opponent = opponent;
  m_player_color = playerColor;
}

void ChessGame::setPosition(const std::string& fen) {
  Position parsed = fen::parse(fen);  // throws before anything is touched
  m_position = parsed;
  m_start_fen = fen;
  resetRecords();
  checkGameResult(~m_position.getState().sideToMove, nullptr);
}

std::string ChessGame::getFen() const {
  return fen::serialize(m_position);
}

void ChessGame::resetRecords() {
  m_status = GameStatus{};
  m_history.clear();
  m_captured_by_white.clear();
  m_captured_by_black.clear();
}

// ---------------------- Queries ----------------------

std::optional<Piece> ChessGame::getPiece(core::Square sq) const {
  return m_position.getBoard().getPiece(sq);
}

std::vector<Move> ChessGame::generateLegalMoves() const {
  return getAllLegalMoves(m_position.getState().sideToMove);
}

std::vector<Move> ChessGame::getLegalMoves(core::Square from) const {
  std::vector<Move> out;
  const auto p = getPiece(from);
  if (!p || p->color != m_position.getState().sideToMove) return out;
  Position scratch = m_position;
  m_move_gen.generateLegalMoves(scratch, from, out);
  return out;
}

std::vector<Move> ChessGame::getAllLegalMoves(core::Color c) const {
  std::vector<Move> out;
  Position scratch = m_position;
  m_move_gen.generateLegalMoves(scratch, c, out);
  return out;
}

std::optional<Move> ChessGame::getMove(core::Square from, core::Square to,
                                       core::PieceType promotion) const {
  for (const auto& m : getLegalMoves(from)) {
    if (m.to != to) continue;
    if (promotion != core::PieceType::None && m.promotion != promotion) continue;
    return m;  // first variant (queen) when no promotion piece was asked for
  }
  return std::nullopt;
}

bool ChessGame::isEndgame() const {
  const Board& b = m_position.getBoard();
  const int queens = b.count(core::PieceType::Queen);
  const int minors = b.count(core::PieceType::Knight) + b.count(core::PieceType::Bishop);
  return queens == 0 || minors <= 2;
}

core::GameResult ChessGame::getResult() const {
  if (m_status.isCheckmate) return core::GameResult::CHECKMATE;
  if (m_status.isStalemate) return core::GameResult::STALEMATE;
  if (m_status.isDraw) return core::GameResult::MOVERULE;
  return core::GameResult::ONGOING;
}

std::optional<Move> ChessGame::getLastMove() const {
  if (m_history.empty()) return std::nullopt;
  return m_history.back().move;
}

// ---------------------- Mutation ----------------------

GameEvents ChessGame::doMove(const Move& m, std::optional<core::PieceType> promotion) {
  GameEvents events;
  const auto moverPiece = m_position.getBoard().getPiece(m.from);
  assert(moverPiece && moverPiece->color == m_position.getState().sideToMove &&
         "doMove: move does not belong to the side to move");
  if (!moverPiece) return events;
  const core::Color mover = moverPiece->color;

  Move applied = m;
  if (m.isPromotion()) {
    core::PieceType choice = promotion.value_or(m.promotion);
    if (!isPromotionPiece(choice)) choice = core::PieceType::Queen;
    applied.promotion = choice;
  }

  const StateInfo st = m_position.playMove(applied);

  if (st.captured.type != core::PieceType::None) {
    (mover == core::Color::White ? m_captured_by_white : m_captured_by_black)
        .push_back(st.captured);
    events.push_back({GameEventType::Capture, applied, st.captured, mover, DrawReason::None});
  }
  if (applied.isPromotion()) {
    events.push_back({GameEventType::Promotion, applied, Piece{applied.promotion, mover}, mover,
                      DrawReason::None});
  }

  m_history.push_back(MoveRecord{moveToNotation(applied, moverPiece->type, applied.promotion),
                                 mover, applied.from, applied.to, applied, applied.promotion});

  checkGameResult(mover, &events);

  const core::Color next = m_position.getState().sideToMove;
  events.push_back({GameEventType::Move, applied, std::nullopt, mover, DrawReason::None});
  events.push_back({GameEventType::TurnChange, applied, std::nullopt, next, DrawReason::None});
  return events;
}

bool ChessGame::doMove(core::Square from, core::Square to, core::PieceType promotion) {
  const auto m = getMove(from, to, promotion);
  if (!m) return false;
  doMove(*m);
  return true;
}

bool ChessGame::doMoveUCI(const std::string& uciMove) {
  if (uciMove.size() < 4 || uciMove.size() > 5) return false;

  const core::Square from = stringToSquare(uciMove.substr(0, 2));
  const core::Square to = stringToSquare(uciMove.substr(2, 2));
  if (from == core::NO_SQUARE || to == core::NO_SQUARE) return false;

  core::PieceType promo = core::PieceType::None;
  if (uciMove.size() == 5) {  // z.B. g7g8q
    promo = promotionFromChar(uciMove[4]);
    if (promo == core::PieceType::None) return false;
  }
  return doMove(from, to, promo);
}

bool ChessGame::undoLastMove() {
  if (m_history.empty()) return false;

  // Replay from the starting position; restores every derived field on the way
  std::vector<MoveRecord> replay(m_history.begin(), m_history.end() - 1);
  m_position = fen::parse(m_start_fen);
  resetRecords();
  checkGameResult(~m_position.getState().sideToMove, nullptr);
  for (const auto& rec : replay) doMove(rec.move, rec.promotion);
  return true;
}

void ChessGame::checkGameResult(core::Color mover, GameEvents* events) {
  const core::Color stm = m_position.getState().sideToMove;
  auto emit = [&](GameEventType type, core::Color color, DrawReason reason = DrawReason::None) {
    if (events) events->push_back({type, Move{}, std::nullopt, color, reason});
  };

  m_status = GameStatus{};
  m_status.isCheck = m_position.inCheck(stm);

  Position scratch = m_position;
  if (!m_move_gen.hasLegalMove(scratch, stm)) {
    m_status.gameOver = true;
    if (m_status.isCheck) {
      m_status.isCheckmate = true;
      m_status.winner = mover;
      emit(GameEventType::Checkmate, mover);
    } else {
      m_status.isStalemate = true;
      emit(GameEventType::Stalemate, stm);
    }
  } else if (m_status.isCheck) {
    emit(GameEventType::Check, stm);
  }

  // Fifty-move rule applies on top of mate or stalemate
  if (m_position.checkMoveRule()) {
    m_status.isDraw = true;
    m_status.gameOver = true;
    m_status.drawReason = DrawReason::FiftyMove;
    emit(GameEventType::Draw, stm, DrawReason::FiftyMove);
  }

  if (events && m_status.gameOver) {
    std::cout << "[ChessGame] game over: "
              << (m_status.isCheckmate  ? "checkmate"
                  : m_status.isStalemate ? "stalemate"
                                         : "fifty-move draw")
              << " after " << m_history.size() << " plies\n";
  }
}

}  // namespace gambit::model
