#pragma once
#include <array>
#include <cstdint>

#include "../../chess_types.hpp"

// =======================================================
// Square layout (same convention as the FEN/UCI world):
// - index 0  = a1 (bottom left, white view)
// - index 63 = h8 (top right, white view)
// Display rows run the other way: row 0 is rank 8, row 7 is rank 1.
// This file defines:
// - Piece value type and castling flags
// - helpfunctions for files, ranks and display rows
// - the fixed square enumeration order used by move generation
// =======================================================

namespace gambit::model {

struct Piece {
  core::PieceType type = core::PieceType::None;
  core::Color color = core::Color::White;
};

constexpr inline bool operator==(const Piece& a, const Piece& b) noexcept {
  return a.type == b.type && a.color == b.color;
}

namespace Castling {
enum : std::uint8_t { WK = 1, WQ = 2, BK = 4, BQ = 8, ALL = WK | WQ | BK | BQ };
}

[[nodiscard]] constexpr inline int ci(core::Color c) noexcept {
  return static_cast<int>(c);
}

enum SquareName : core::Square {
  A1 = 0, B1, C1, D1, E1, F1, G1, H1,
  A2, B2, C2, D2, E2, F2, G2, H2,
  A3, B3, C3, D3, E3, F3, G3, H3,
  A4, B4, C4, D4, E4, F4, G4, H4,
  A5, B5, C5, D5, E5, F5, G5, H5,
  A6, B6, C6, D6, E6, F6, G6, H6,
  A7, B7, C7, D7, E7, F7, G7, H7,
  A8, B8, C8, D8, E8, F8, G8, H8
};

[[nodiscard]] constexpr inline int file_of(core::Square sq) noexcept {
  return static_cast<int>(sq) % 8;
}

[[nodiscard]] constexpr inline int rank_of(core::Square sq) noexcept {
  return static_cast<int>(sq) / 8;
}

[[nodiscard]] constexpr inline bool on_board(int file, int rank) noexcept {
  return file >= 0 && file < 8 && rank >= 0 && rank < 8;
}

[[nodiscard]] constexpr inline bool is_valid(core::Square sq) noexcept {
  return sq < core::NO_SQUARE;
}

[[nodiscard]] constexpr inline core::Square make_square(int file, int rank) noexcept {
  return on_board(file, rank) ? static_cast<core::Square>(rank * 8 + file) : core::NO_SQUARE;
}

// Display row (0 = rank 8) / column (0 = file a) to square
[[nodiscard]] constexpr inline core::Square square_at(int row, int col) noexcept {
  return make_square(col, 7 - row);
}

[[nodiscard]] constexpr inline int row_of(core::Square sq) noexcept {
  return 7 - rank_of(sq);
}

// Rank a side's pieces start on / a side's pawns promote on
[[nodiscard]] constexpr inline int home_rank(core::Color c) noexcept {
  return c == core::Color::White ? 0 : 7;
}
[[nodiscard]] constexpr inline int promotion_rank(core::Color c) noexcept {
  return c == core::Color::White ? 7 : 0;
}
[[nodiscard]] constexpr inline int pawn_push(core::Color c) noexcept {
  return c == core::Color::White ? 1 : -1;
}

// Row-major board order as seen from white: a8..h8, a7..h7, ..., a1..h1.
// All generators walk squares in this order so equal-scored moves resolve the same way.
constexpr std::array<core::Square, 64> BOARD_ORDER = [] {
  std::array<core::Square, 64> a{};
  for (int row = 0; row < 8; ++row)
    for (int col = 0; col < 8; ++col) a[row * 8 + col] = square_at(row, col);
  return a;
}();

}  // namespace gambit::model
