#pragma once

#include <atomic>
#include <memory>

#include "../engine/bot_engine.hpp"
#include "player.hpp"

namespace gambit::controller {

class BotPlayer : public IPlayer {
 public:
  explicit BotPlayer(engine::Difficulty difficulty = engine::Difficulty::Medium,
                     const engine::EngineConfig& cfg = {})
      : m_engine(std::make_shared<engine::BotEngine>(difficulty, cfg)),
        m_difficulty(difficulty) {}
  ~BotPlayer() override = default;

  bool isHuman() const override { return false; }
  std::future<std::optional<model::Move>> requestMove(const model::ChessGame& game,
                                                      std::atomic<bool>& cancelToken) override;

  // Wirkt ab der naechsten Anfrage
  void setDifficulty(engine::Difficulty d) { m_difficulty.store(d); }
  engine::Difficulty getDifficulty() const { return m_difficulty.load(); }

 private:
  std::shared_ptr<engine::BotEngine> m_engine;  // nur vom Such-Thread benutzt
  std::atomic<engine::Difficulty> m_difficulty;
};

}  // namespace gambit::controller
