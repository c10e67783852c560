#pragma once
#include <cstddef>

#include "../chess_types.hpp"
#include "board.hpp"
#include "core/offsets.hpp"

namespace gambit::model {
// ---------------- Angriffsabfrage ----------------

namespace detail {
inline bool holds(const Board& b, core::Square sq, core::Color c, core::PieceType t) noexcept {
  const auto p = b.getPiece(sq);
  return p && p->color == c && p->type == t;
}

template <std::size_t N>
inline bool slider_hits(const Board& b, core::Square sq, core::Color by,
                        const std::array<Offset, N>& dirs, core::PieceType slider) noexcept {
  for (const Offset& d : dirs) {
    for (core::Square s = offset_square(sq, d); is_valid(s); s = offset_square(s, d)) {
      const auto p = b.getPiece(s);
      if (!p) continue;
      if (p->color == by && (p->type == slider || p->type == core::PieceType::Queen)) return true;
      break;  // first blocker ends the ray
    }
  }
  return false;
}
}  // namespace detail

// True if any piece of `by` attacks `sq`. Off-board squares are never attacked.
inline bool attackedBy(const Board& b, core::Square sq, core::Color by) noexcept {
  if (!is_valid(sq)) return false;

  // Pawn: an attacking pawn sits one rank behind sq from its own point of view
  const int pawnRank = rank_of(sq) - pawn_push(by);
  for (int df : {-1, 1}) {
    if (detail::holds(b, make_square(file_of(sq) + df, pawnRank), by, core::PieceType::Pawn))
      return true;
  }

  for (const Offset& o : KNIGHT_OFFSETS)
    if (detail::holds(b, offset_square(sq, o), by, core::PieceType::Knight)) return true;

  for (const Offset& o : KING_OFFSETS)
    if (detail::holds(b, offset_square(sq, o), by, core::PieceType::King)) return true;

  if (detail::slider_hits(b, sq, by, ROOK_DIRS, core::PieceType::Rook)) return true;
  if (detail::slider_hits(b, sq, by, BISHOP_DIRS, core::PieceType::Bishop)) return true;
  return false;
}

}  // namespace gambit::model
