#pragma once

#include <optional>

#include "../model/move.hpp"
#include "../model/position.hpp"
#include "config.hpp"

namespace gambit::engine {
struct SearchStats;

class Engine {
 public:
  explicit Engine(const EngineConfig& cfg = {});
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Find best move for `side` (returns empty if none). The position is only read.
  std::optional<model::Move> find_best_move(const model::Position& pos, core::Color side,
                                            int depth);
  // Static evaluation, white's point of view
  int evaluate(const model::Position& pos) const;
  const SearchStats& getLastSearchStats() const;
  const EngineConfig& getConfig() const;

 private:
  struct Impl;
  Impl* pimpl;
};

}  // namespace gambit::engine
