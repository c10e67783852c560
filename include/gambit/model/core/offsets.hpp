#pragma once
#include <array>

#include "model_types.hpp"

// Direction / jump tables in (file, rank) deltas.
// The order of every table is part of the engine's contract: generation and
// therefore tie-breaking between equal moves follow it.

namespace gambit::model {

struct Offset {
  int df;
  int dr;
};

constexpr std::array<Offset, 4> ROOK_DIRS = {{{1, 0}, {-1, 0}, {0, -1}, {0, 1}}};
constexpr std::array<Offset, 4> BISHOP_DIRS = {{{1, -1}, {-1, -1}, {1, 1}, {-1, 1}}};
constexpr std::array<Offset, 8> QUEEN_DIRS = {
    {{1, 0}, {-1, 0}, {0, -1}, {0, 1}, {1, -1}, {-1, -1}, {1, 1}, {-1, 1}}};
constexpr std::array<Offset, 8> KING_OFFSETS = QUEEN_DIRS;
constexpr std::array<Offset, 8> KNIGHT_OFFSETS = {
    {{1, -2}, {-1, -2}, {1, 2}, {-1, 2}, {2, -1}, {-2, -1}, {2, 1}, {-2, 1}}};

// NO_SQUARE when the step leaves the board
[[nodiscard]] constexpr inline core::Square offset_square(core::Square sq, Offset o) noexcept {
  return make_square(file_of(sq) + o.df, rank_of(sq) + o.dr);
}

}  // namespace gambit::model
