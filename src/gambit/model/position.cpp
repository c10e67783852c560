#include "gambit/model/position.hpp"

#include <array>
#include <cassert>
#include <cstdlib>

#include "gambit/model/move_helper.hpp"

namespace gambit::model {

namespace {
// --------- Castling-Right Clear-Masken ----------
// A move touching one of these squares (as origin or destination) drops the
// listed rights: a rook leaving its corner or being captured on it.
constexpr std::array<std::uint8_t, 64> CR_CLEAR = [] {
  std::array<std::uint8_t, 64> a{};
  a[H1] |= Castling::WK;
  a[A1] |= Castling::WQ;
  a[H8] |= Castling::BK;
  a[A8] |= Castling::BQ;
  return a;
}();

constexpr std::uint8_t rights_of(core::Color c) {
  return c == core::Color::White ? (Castling::WK | Castling::WQ) : (Castling::BK | Castling::BQ);
}

inline core::Square en_passant_victim(core::Square to, core::Color us) {
  return make_square(file_of(to), rank_of(to) - pawn_push(us));
}

struct RookHop {
  core::Square from;
  core::Square to;
};

inline RookHop castle_rook(CastleSide side, core::Color us) {
  const int r = home_rank(us);
  if (side == CastleSide::KingSide) return {make_square(7, r), make_square(5, r)};
  return {make_square(0, r), make_square(3, r)};
}
}  // namespace

// ---------------------- Utility Checks ----------------------

bool Position::isSquareAttacked(core::Square sq, core::Color by) const noexcept {
  return attackedBy(m_board, sq, by);
}

bool Position::inCheck(core::Color c) const noexcept {
  const core::Square ksq = m_board.findKing(c);
  if (ksq == core::NO_SQUARE) return false;
  return attackedBy(m_board, ksq, ~c);
}

bool Position::operator==(const Position& other) const noexcept {
  const GameState& a = m_state;
  const GameState& b = other.m_state;
  return m_board == other.m_board && a.sideToMove == b.sideToMove &&
         a.castlingRights == b.castlingRights && a.enPassantSquare == b.enPassantSquare &&
         a.halfmoveClock == b.halfmoveClock && a.fullmoveNumber == b.fullmoveNumber;
}

// ---------------------- Make / Unmake ----------------------

bool Position::doMove(const Move& m) {
  const auto fromPiece = m_board.getPiece(m.from);
  if (!fromPiece || m.from == m.to) return false;

  StateInfo st{};
  applyMove(m, st);

  // Illegal (eigener König im Schach) => rollback
  const core::Color us = st.moved.color;
  const core::Square ksq = m_board.findKing(us);
  if (ksq != core::NO_SQUARE && attackedBy(m_board, ksq, ~us)) {
    unapplyMove(st);
    return false;
  }

  m_history.push_back(st);
  return true;
}

void Position::undoMove() {
  if (m_history.empty()) return;
  StateInfo st = m_history.back();
  m_history.pop_back();
  unapplyMove(st);
}

StateInfo Position::playMove(const Move& m) {
  StateInfo st{};
  assert(m_board.getPiece(m.from).has_value() && "playMove: no piece on origin square");
  applyMove(m, st);
  return st;
}

void Position::applyMove(const Move& m, StateInfo& st) {
  st.move = m;
  st.prevCastlingRights = m_state.castlingRights;
  st.prevEnPassantSquare = m_state.enPassantSquare;
  st.prevHalfmoveClock = m_state.halfmoveClock;
  st.prevFullmoveNumber = m_state.fullmoveNumber;
  st.prevSideToMove = m_state.sideToMove;

  const auto fromPiece = m_board.getPiece(m.from);
  if (!fromPiece) return;
  st.moved = *fromPiece;

  const core::Color us = fromPiece->color;
  const core::Color them = ~us;
  const bool movingPawn = fromPiece->type == core::PieceType::Pawn;

  // Captured piece: en passant takes the pawn behind the destination
  st.capturedSquare = m.isEnPassant ? en_passant_victim(m.to, us) : m.to;
  const auto victim = m_board.getPiece(st.capturedSquare);
  if (victim && victim->color == them) {
    st.captured = *victim;
    m_board.removePiece(st.capturedSquare);
  } else {
    st.captured = Piece{core::PieceType::None, them};
    st.capturedSquare = core::NO_SQUARE;
  }

  m_board.movePiece(m.from, m.to);
  if (m.promotion != core::PieceType::None) m_board.setPiece(m.to, Piece{m.promotion, us});

  if (m.castle != CastleSide::None) {
    const RookHop hop = castle_rook(m.castle, us);
    m_board.movePiece(hop.from, hop.to);
  }

  // castling rights
  if (fromPiece->type == core::PieceType::King) m_state.castlingRights &= ~rights_of(us);
  m_state.castlingRights &= ~(CR_CLEAR[m.from] | CR_CLEAR[m.to]);

  // new EP square (double push only)
  m_state.enPassantSquare = core::NO_SQUARE;
  if (movingPawn && std::abs(rank_of(m.to) - rank_of(m.from)) == 2)
    m_state.enPassantSquare = make_square(file_of(m.from), rank_of(m.from) + pawn_push(us));

  // 50-move rule
  if (movingPawn || st.captured.type != core::PieceType::None)
    m_state.halfmoveClock = 0;
  else
    ++m_state.halfmoveClock;

  if (us == core::Color::Black) ++m_state.fullmoveNumber;
  m_state.sideToMove = them;
}

void Position::unapplyMove(const StateInfo& st) {
  m_state.sideToMove = st.prevSideToMove;
  m_state.castlingRights = st.prevCastlingRights;
  m_state.enPassantSquare = st.prevEnPassantSquare;
  m_state.halfmoveClock = st.prevHalfmoveClock;
  m_state.fullmoveNumber = st.prevFullmoveNumber;

  const Move& m = st.move;
  if (st.moved.type == core::PieceType::None) return;

  if (m.castle != CastleSide::None) {
    const RookHop hop = castle_rook(m.castle, st.moved.color);
    m_board.movePiece(hop.to, hop.from);
  }

  m_board.removePiece(m.to);
  m_board.setPiece(m.from, st.moved);
  if (st.captured.type != core::PieceType::None) m_board.setPiece(st.capturedSquare, st.captured);
}

}  // namespace gambit::model
