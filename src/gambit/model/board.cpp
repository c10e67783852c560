#include "gambit/model/board.hpp"

#include <cassert>

namespace gambit::model {

namespace {
constexpr std::int8_t kTypeIndex[7] = {0, 1, 2, 3, 4, 5, -1};
inline int type_index(core::PieceType t) noexcept {
  return kTypeIndex[static_cast<int>(t)];
}

// Packed byte layout:
//  low 3 bits: (typeIndex + 1) in [1..6], 0 means empty
//  bit 3: color (0 white, 1 black)
inline int decode_ti(std::uint8_t packed) noexcept {
  return (packed & 0x7) - 1;
}  // only if packed!=0
inline int decode_ci(std::uint8_t packed) noexcept {
  return (packed >> 3) & 0x1;
}  // only if packed!=0
}  // namespace

Board::Board() {
  clear();
}

void Board::clear() noexcept {
  m_piece_on.fill(0);
}

inline std::uint8_t Board::pack_piece(Piece p) noexcept {
  if (p.type == core::PieceType::None) return 0;
  const int ti = type_index(p.type);  // 0..5
  assert(ti >= 0 && ti < 6 && "Invalid PieceType");
  const std::uint8_t c = static_cast<std::uint8_t>(ci(p.color) & 1u);
  return static_cast<std::uint8_t>((ti + 1) | (c << 3));
}

inline Piece Board::unpack_piece(std::uint8_t pp) noexcept {
  if (pp == 0) return Piece{core::PieceType::None, core::Color::White};
  const core::PieceType pt = static_cast<core::PieceType>(decode_ti(pp));
  const core::Color col = decode_ci(pp) ? core::Color::Black : core::Color::White;
  return Piece{pt, col};
}

void Board::setPiece(core::Square sq, Piece p) noexcept {
  if (!is_valid(sq)) return;
  m_piece_on[sq] = pack_piece(p);
}

void Board::removePiece(core::Square sq) noexcept {
  if (!is_valid(sq)) return;
  m_piece_on[sq] = 0;
}

std::optional<Piece> Board::getPiece(core::Square sq) const noexcept {
  if (!is_valid(sq)) return std::nullopt;
  const std::uint8_t packed = m_piece_on[sq];
  if (!packed) return std::nullopt;
  return unpack_piece(packed);
}

void Board::movePiece(core::Square from, core::Square to) noexcept {
  if (!is_valid(from) || !is_valid(to) || from == to) return;
  const std::uint8_t packed = m_piece_on[from];
  if (!packed) return;  // nothing to move
  m_piece_on[to] = packed;
  m_piece_on[from] = 0;
}

core::Square Board::findKing(core::Color c) const noexcept {
  const std::uint8_t king = pack_piece(Piece{core::PieceType::King, c});
  for (core::Square sq : BOARD_ORDER)
    if (m_piece_on[sq] == king) return sq;
  return core::NO_SQUARE;
}

int Board::count(core::Color c, core::PieceType t) const noexcept {
  if (t == core::PieceType::None) return 0;
  const std::uint8_t wanted = pack_piece(Piece{t, c});
  int n = 0;
  for (std::uint8_t packed : m_piece_on)
    if (packed == wanted) ++n;
  return n;
}

}  // namespace gambit::model
