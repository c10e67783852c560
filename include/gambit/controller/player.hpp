#pragma once

#include <atomic>
#include <future>
#include <optional>

#include "../model/chess_game.hpp"

namespace gambit::controller {

struct IPlayer {
  virtual ~IPlayer() = default;

  // The future resolves on another thread. It must not touch `game` after returning;
  // implementations copy what they need. nullopt: no legal move or cancelled.
  virtual std::future<std::optional<model::Move>> requestMove(const model::ChessGame& game,
                                                              std::atomic<bool>& cancelToken) = 0;

  virtual bool isHuman() const = 0;
};

}  // namespace gambit::controller
