#pragma once
#include <cstdint>
#include <type_traits>

#include "core/model_types.hpp"

namespace gambit::model {

enum class CastleSide : std::uint8_t { None = 0, KingSide, QueenSide };

// Value type produced by the move generator. Bitfields keep it register sized.
struct Move {
  // 7+7+4+4+1+1+2 = 26 Bits
  core::Square from : 7;          // 0..63, 64 = none
  core::Square to : 7;            // 0..63, 64 = none
  core::PieceType promotion : 4;  // None or N/B/R/Q
  core::PieceType captured : 4;   // victim type, Pawn for en passant
  bool isEnPassant : 1;
  bool isDoublePush : 1;
  CastleSide castle : 2;

  constexpr Move() noexcept
      : from(core::NO_SQUARE),
        to(core::NO_SQUARE),
        promotion(core::PieceType::None),
        captured(core::PieceType::None),
        isEnPassant(false),
        isDoublePush(false),
        castle(CastleSide::None) {}

  constexpr Move(core::Square f, core::Square t, core::PieceType promo = core::PieceType::None,
                 core::PieceType cap = core::PieceType::None, bool ep = false,
                 bool doublePush = false, CastleSide cs = CastleSide::None) noexcept
      : from(f),
        to(t),
        promotion(promo),
        captured(cap),
        isEnPassant(ep),
        isDoublePush(doublePush),
        castle(cs) {}

  [[nodiscard]] constexpr bool isCapture() const noexcept {
    return captured != core::PieceType::None;
  }
  [[nodiscard]] constexpr bool isPromotion() const noexcept {
    return promotion != core::PieceType::None;
  }
  [[nodiscard]] constexpr bool isNull() const noexcept {
    return from == core::NO_SQUARE || to == core::NO_SQUARE;
  }
};

constexpr inline bool operator==(const Move& a, const Move& b) noexcept {
  return (a.from == b.from && a.to == b.to && a.promotion == b.promotion &&
          a.captured == b.captured && a.isEnPassant == b.isEnPassant &&
          a.isDoublePush == b.isDoublePush && a.castle == b.castle);
}

static_assert(std::is_trivially_copyable_v<Move>, "Move must be trivially copyable");
static_assert(sizeof(Move) <= 8, "Move should be tightly packed (<= 8 bytes)");

}  // namespace gambit::model
