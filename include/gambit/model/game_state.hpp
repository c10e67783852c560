#pragma once
#include <cstdint>
#include <optional>
#include <type_traits>

#include "core/model_types.hpp"
#include "move.hpp"

namespace gambit::model {

struct GameState {
  std::uint32_t fullmoveNumber = 1;  // incremented after black's move
  std::uint32_t halfmoveClock = 0;   // plies since last pawn move or capture
  std::uint8_t castlingRights = Castling::ALL;
  core::Color sideToMove = core::Color::White;
  core::Square enPassantSquare = core::NO_SQUARE;  // valid for exactly one ply
};

// Everything needed to take a move back again
struct StateInfo {
  Move move{};
  Piece moved{};                         // piece as it stood on move.from
  Piece captured{};                      // type None if nothing was taken
  core::Square capturedSquare{core::NO_SQUARE};
  std::uint32_t prevHalfmoveClock{};
  std::uint32_t prevFullmoveNumber{};
  std::uint8_t prevCastlingRights{};
  core::Square prevEnPassantSquare{core::NO_SQUARE};
  core::Color prevSideToMove{core::Color::White};
};

enum class DrawReason : std::uint8_t { None, FiftyMove };

// Terminal flags, derived after every applied move, never set by callers
struct GameStatus {
  bool isCheck = false;
  bool isCheckmate = false;
  bool isStalemate = false;
  bool isDraw = false;
  bool gameOver = false;
  std::optional<core::Color> winner;
  DrawReason drawReason = DrawReason::None;
};

static_assert((Castling::WK | Castling::WQ | Castling::BK | Castling::BQ) <= 0xF,
              "Castling rights must fit in 4 bits");
static_assert(std::is_trivially_copyable_v<StateInfo>, "StateInfo should be POD");

}  // namespace gambit::model
