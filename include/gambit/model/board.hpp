#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "core/model_types.hpp"

namespace gambit::model {

// 8x8 mailbox. Off-board squares read as empty and are ignored on write.
class Board {
 public:
  Board();

  void clear() noexcept;

  void setPiece(core::Square sq, Piece p) noexcept;
  void removePiece(core::Square sq) noexcept;
  std::optional<Piece> getPiece(core::Square sq) const noexcept;
  bool isEmpty(core::Square sq) const noexcept { return getPiece(sq) == std::nullopt; }

  // Relocates whatever stands on `from` to `to`, replacing anything on `to`
  void movePiece(core::Square from, core::Square to) noexcept;

  // First king of that color in board order, NO_SQUARE if there is none
  core::Square findKing(core::Color c) const noexcept;

  int count(core::Color c, core::PieceType t) const noexcept;
  int count(core::PieceType t) const noexcept {
    return count(core::Color::White, t) + count(core::Color::Black, t);
  }

  bool operator==(const Board& other) const noexcept { return m_piece_on == other.m_piece_on; }

 private:
  // 0 = empty, sonst (ptIdx+1) | (color<<3)
  std::array<std::uint8_t, 64> m_piece_on{};

  static inline std::uint8_t pack_piece(Piece p) noexcept;
  static inline Piece unpack_piece(std::uint8_t pp) noexcept;
};

}  // namespace gambit::model
