#include "gambit/model/move_generator.hpp"

#include <array>

#include "gambit/model/core/offsets.hpp"
#include "gambit/model/move_helper.hpp"

namespace gambit::model {

namespace {

using core::Color;
using core::PieceType;
using core::Square;

using PT = core::PieceType;

constexpr std::array<PT, 4> PROMOTION_ORDER = {PT::Queen, PT::Rook, PT::Bishop, PT::Knight};

inline PT victim_type(const Board& b, Square to) {
  const auto p = b.getPiece(to);
  return p ? p->type : PT::None;
}

inline int pawn_start_rank(Color c) {
  return c == Color::White ? 1 : 6;
}

// Rank an en passant target lies on when `c` is the side able to take it
inline int en_passant_rank(Color c) {
  return c == Color::White ? 5 : 2;
}

inline void push_pawn_move(Square from, Square to, PT captured, Color us, std::vector<Move>& out) {
  if (rank_of(to) == promotion_rank(us)) {
    for (PT promo : PROMOTION_ORDER) out.emplace_back(from, to, promo, captured);
  } else {
    out.emplace_back(from, to, PT::None, captured);
  }
}

template <std::size_t N>
void gen_steps(const Board& b, Square from, Color us, const std::array<Offset, N>& offs,
               std::vector<Move>& out) {
  for (const Offset& o : offs) {
    const Square to = offset_square(from, o);
    if (!is_valid(to)) continue;
    const auto target = b.getPiece(to);
    if (!target)
      out.emplace_back(from, to);
    else if (target->color != us)
      out.emplace_back(from, to, PT::None, target->type);
  }
}

template <std::size_t N>
void gen_slides(const Board& b, Square from, Color us, const std::array<Offset, N>& dirs,
                std::vector<Move>& out) {
  for (const Offset& d : dirs) {
    for (Square to = offset_square(from, d); is_valid(to); to = offset_square(to, d)) {
      const auto target = b.getPiece(to);
      if (!target) {
        out.emplace_back(from, to);
        continue;
      }
      if (target->color != us) out.emplace_back(from, to, PT::None, target->type);
      break;
    }
  }
}

}  // namespace

// ---------------- Pseudolegal ----------------

void MoveGenerator::generatePieceMoves(const Board& b, const GameState& st, Square from,
                                       std::vector<Move>& out) const {
  const auto piece = b.getPiece(from);
  if (!piece) return;
  const Color us = piece->color;

  switch (piece->type) {
    case PT::Pawn:
      generatePawnMoves(b, st, from, us, out);
      break;
    case PT::Knight:
      gen_steps(b, from, us, KNIGHT_OFFSETS, out);
      break;
    case PT::Bishop:
      gen_slides(b, from, us, BISHOP_DIRS, out);
      break;
    case PT::Rook:
      gen_slides(b, from, us, ROOK_DIRS, out);
      break;
    case PT::Queen:
      gen_slides(b, from, us, QUEEN_DIRS, out);
      break;
    case PT::King:
      gen_steps(b, from, us, KING_OFFSETS, out);
      generateCastlingMoves(b, st, from, us, out);
      break;
    default:
      break;
  }
}

void MoveGenerator::generatePseudoLegalMoves(const Board& b, const GameState& st, Color c,
                                             std::vector<Move>& out) const {
  for (Square sq : BOARD_ORDER) {
    const auto p = b.getPiece(sq);
    if (p && p->color == c) generatePieceMoves(b, st, sq, out);
  }
}

void MoveGenerator::generatePawnMoves(const Board& b, const GameState& st, Square from, Color us,
                                      std::vector<Move>& out) const {
  const int file = file_of(from);
  const int rank = rank_of(from);
  const int dir = pawn_push(us);

  // Quiet pushes
  const Square one = make_square(file, rank + dir);
  if (is_valid(one) && b.isEmpty(one)) {
    push_pawn_move(from, one, PT::None, us, out);

    if (rank == pawn_start_rank(us)) {
      const Square two = make_square(file, rank + 2 * dir);
      if (is_valid(two) && b.isEmpty(two))
        out.emplace_back(from, two, PT::None, PT::None, false, /*doublePush=*/true);
    }
  }

  // Captures, en passant
  for (int df : {-1, 1}) {
    const Square to = make_square(file + df, rank + dir);
    if (!is_valid(to)) continue;

    const auto target = b.getPiece(to);
    if (target && target->color != us) push_pawn_move(from, to, target->type, us, out);

    if (st.enPassantSquare == to && !target && rank_of(to) == en_passant_rank(us)) {
      const Square victimSq = make_square(file_of(to), rank);
      const auto victim = b.getPiece(victimSq);
      if (victim && victim->color != us && victim->type == PT::Pawn)
        out.emplace_back(from, to, PT::None, PT::Pawn, /*ep=*/true);
    }
  }
}

void MoveGenerator::generateCastlingMoves(const Board& b, const GameState& st, Square from,
                                          Color us, std::vector<Move>& out) const {
  const int r = home_rank(us);
  if (from != make_square(4, r)) return;

  const bool white = us == Color::White;
  const bool canKingSide = st.castlingRights & (white ? Castling::WK : Castling::BK);
  const bool canQueenSide = st.castlingRights & (white ? Castling::WQ : Castling::BQ);
  if (!canKingSide && !canQueenSide) return;

  const Color them = ~us;
  if (attackedBy(b, from, them)) return;

  auto ownRookOn = [&](int file) {
    const auto p = b.getPiece(make_square(file, r));
    return p && p->color == us && p->type == PT::Rook;
  };
  auto emptyAndSafe = [&](int file) {
    const Square s = make_square(file, r);
    return b.isEmpty(s) && !attackedBy(b, s, them);
  };

  if (canKingSide && ownRookOn(7) && emptyAndSafe(5) && emptyAndSafe(6)) {
    out.emplace_back(from, make_square(6, r), PT::None, PT::None, false, false,
                     CastleSide::KingSide);
  }

  if (canQueenSide && ownRookOn(0) && b.isEmpty(make_square(1, r)) && emptyAndSafe(3) &&
      emptyAndSafe(2)) {
    out.emplace_back(from, make_square(2, r), PT::None, PT::None, false, false,
                     CastleSide::QueenSide);
  }
}

// ---------------- Legal ----------------

void MoveGenerator::filterLegal(Position& pos, const std::vector<Move>& pseudo,
                                std::vector<Move>& out) const {
  for (const auto& m : pseudo) {
    if (pos.doMove(m)) {
      pos.undoMove();
      out.push_back(m);
    }
  }
}

void MoveGenerator::generateLegalMoves(Position& pos, Square from, std::vector<Move>& out) const {
  thread_local std::vector<Move> pseudo;
  pseudo.clear();
  generatePieceMoves(pos.getBoard(), pos.getState(), from, pseudo);
  filterLegal(pos, pseudo, out);
}

void MoveGenerator::generateLegalMoves(Position& pos, Color c, std::vector<Move>& out) const {
  thread_local std::vector<Move> pseudo;
  pseudo.clear();
  generatePseudoLegalMoves(pos.getBoard(), pos.getState(), c, pseudo);
  filterLegal(pos, pseudo, out);
}

bool MoveGenerator::hasLegalMove(Position& pos, Color c) const {
  std::vector<Move> pseudo;
  for (Square sq : BOARD_ORDER) {
    const auto p = pos.getBoard().getPiece(sq);
    if (!p || p->color != c) continue;
    pseudo.clear();
    generatePieceMoves(pos.getBoard(), pos.getState(), sq, pseudo);
    for (const auto& m : pseudo) {
      if (pos.doMove(m)) {
        pos.undoMove();
        return true;
      }
    }
  }
  return false;
}

}  // namespace gambit::model
