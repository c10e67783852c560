#pragma once
#include <array>

#include "../model/core/model_types.hpp"

namespace gambit::engine {

// -------- helpers (inline) --------
// Tables are written as the board is drawn for white: first entry a8, last entry h1.
// White reads them straight, black reads them upside down.
inline constexpr int pst_index(core::Square sq, core::Color c) noexcept {
  const int row = c == core::Color::White ? model::row_of(sq) : model::rank_of(sq);
  return row * 8 + model::file_of(sq);
}

// =============================================================================
// PSTs
// =============================================================================
// clang-format off
inline constexpr std::array<int, 64> PST_PAWN = {
    0,   0,   0,   0,   0,   0,   0,   0,
   50,  50,  50,  50,  50,  50,  50,  50,
   10,  10,  20,  30,  30,  20,  10,  10,
    5,   5,  10,  45,  45,  10,   5,   5,
    0,   0,   0,  40,  40,   0,   0,   0,
    5,  -5, -10,   0,   0, -10,  -5,   5,
    5,  10,  10, -25, -25,  10,  10,   5,
    0,   0,   0,   0,   0,   0,   0,   0};

inline constexpr std::array<int, 64> PST_KNIGHT = {
  -50, -40, -30, -30, -30, -30, -40, -50,
  -40, -20,   0,   0,   0,   0, -20, -40,
  -30,   0,  10,  15,  15,  10,   0, -30,
  -30,   5,  15,  20,  20,  15,   5, -30,
  -30,   0,  15,  20,  20,  15,   0, -30,
  -30,   5,  10,  15,  15,  10,   5, -30,
  -40, -20,   0,   5,   5,   0, -20, -40,
  -50, -40, -30, -30, -30, -30, -40, -50};

inline constexpr std::array<int, 64> PST_BISHOP = {
  -20, -10, -10, -10, -10, -10, -10, -20,
  -10,   0,   0,   0,   0,   0,   0, -10,
  -10,   0,  10,  10,  10,  10,   0, -10,
  -10,   5,   5,  10,  10,   5,   5, -10,
  -10,   0,  10,  10,  10,  10,   0, -10,
  -10,  10,  10,  10,  10,  10,  10, -10,
  -10,   5,   0,   0,   0,   0,   5, -10,
  -20, -10, -10, -10, -10, -10, -10, -20};

inline constexpr std::array<int, 64> PST_ROOK = {
    0,   0,   0,   0,   0,   0,   0,   0,
    5,  10,  10,  10,  10,  10,  10,   5,
   -5,   0,   0,   0,   0,   0,   0,  -5,
   -5,   0,   0,   0,   0,   0,   0,  -5,
   -5,   0,   0,   0,   0,   0,   0,  -5,
   -5,   0,   0,   0,   0,   0,   0,  -5,
   -5,   0,   0,   0,   0,   0,   0,  -5,
    0,   0,   0,  10,  10,   0,   0,   0};

inline constexpr std::array<int, 64> PST_QUEEN = {
  -20, -10, -10,  -5,  -5, -10, -10, -20,
  -10,   0,   0,   0,   0,   0,   0, -10,
  -10,   0,   5,   5,   5,   5,   0, -10,
   -5,   0,   5,   5,   5,   5,   0,  -5,
    0,   0,   5,   5,   5,   5,   0,  -5,
  -10,   5,   5,   5,   5,   5,   0, -10,
  -10,   0,   5,   0,   0,   0,   0, -10,
  -20, -10, -10,  -5,  -5, -10, -10, -20};

inline constexpr std::array<int, 64> PST_KING_MG = {
  -30, -40, -40, -50, -50, -40, -40, -30,
  -30, -40, -40, -50, -50, -40, -40, -30,
  -30, -40, -40, -50, -50, -40, -40, -30,
  -30, -40, -40, -50, -50, -40, -40, -30,
  -20, -30, -30, -40, -40, -30, -30, -20,
  -10, -20, -20, -20, -20, -20, -20, -10,
   20,  20,   0,   0,   0,   0,  20,  20,
   20,  40,  10,   0,   0,  10,  40,  20};
// clang-format on

// -------- PST accessor (inline) --------
inline int pst(core::PieceType pt, core::Square sq, core::Color c) {
  const int i = pst_index(sq, c);
  switch (pt) {
    case core::PieceType::Pawn:
      return PST_PAWN[i];
    case core::PieceType::Knight:
      return PST_KNIGHT[i];
    case core::PieceType::Bishop:
      return PST_BISHOP[i];
    case core::PieceType::Rook:
      return PST_ROOK[i];
    case core::PieceType::Queen:
      return PST_QUEEN[i];
    case core::PieceType::King:
      return PST_KING_MG[i];
    default:
      return 0;
  }
}

// =============================================================================
// Center control
// =============================================================================
inline constexpr std::array<core::Square, 4> CENTER = {model::D4, model::E4, model::D5,
                                                       model::E5};
inline constexpr std::array<core::Square, 12> EXTENDED_CENTER = {
    model::C6, model::D6, model::E6, model::F6, model::C5, model::F5,
    model::C4, model::F4, model::C3, model::D3, model::E3, model::F3};

}  // namespace gambit::engine
