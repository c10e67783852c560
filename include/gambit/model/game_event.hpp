#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "core/model_types.hpp"
#include "game_state.hpp"
#include "move.hpp"

namespace gambit::model {

enum class GameEventType : std::uint8_t {
  Capture,     // piece = captured piece
  Promotion,   // piece = piece the pawn became
  Check,       // color = side now in check
  Checkmate,   // color = winner
  Stalemate,
  Draw,        // drawReason set
  Move,        // move = applied move, color = mover
  TurnChange   // color = side to move now
};

struct GameEvent {
  GameEventType type = GameEventType::Move;
  Move move{};
  std::optional<Piece> piece;
  core::Color color = core::Color::White;
  DrawReason drawReason = DrawReason::None;
};

// Events of one applied move in emission order:
// capture, promotion, check | checkmate | stalemate, draw, move, turn change
using GameEvents = std::vector<GameEvent>;

}  // namespace gambit::model
