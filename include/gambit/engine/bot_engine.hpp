#pragma once

#include <optional>
#include <random>
#include <string>

#include "../model/chess_game.hpp"
#include "../model/move.hpp"
#include "../model/position.hpp"
#include "engine.hpp"
#include "search.hpp"

namespace gambit::engine {

struct SearchResult {
  std::optional<model::Move> bestMove;
  engine::SearchStats stats;
  bool randomMove = false;  // Easy-Stufe hat gewuerfelt statt gesucht
};

class BotEngine {
 public:
  explicit BotEngine(Difficulty difficulty = Difficulty::Medium, const EngineConfig& cfg = {});
  ~BotEngine();

  void setDifficulty(Difficulty d) { m_difficulty = d; }
  // Unbekannte Namen lassen die Stufe unveraendert; liefert false in dem Fall
  bool setDifficulty(const std::string& name);
  Difficulty getDifficulty() const { return m_difficulty; }
  int getSearchDepth() const { return m_engine.getConfig().depthFor(m_difficulty); }

  // Sucht fuer `side` auf einer eigenen Kopie; `pos` bleibt unangetastet.
  SearchResult findBestMove(const model::Position& pos, core::Color side);
  SearchResult findBestMove(const model::ChessGame& game) {
    return findBestMove(game.getPosition(), game.getGameState().sideToMove);
  }
  std::optional<model::Move> selectMove(const model::Position& pos, core::Color side) {
    return findBestMove(pos, side).bestMove;
  }

  engine::SearchStats getLastSearchStats() const { return m_last_stats; }

 private:
  Engine m_engine;
  Difficulty m_difficulty;
  std::mt19937 m_rng;
  SearchStats m_last_stats;
  model::MoveGenerator m_move_gen;
};

}  // namespace gambit::engine
