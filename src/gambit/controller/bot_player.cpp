#include "gambit/controller/bot_player.hpp"

#include <iostream>

#include "gambit/model/notation.hpp"

namespace gambit::controller {

std::future<std::optional<model::Move>> BotPlayer::requestMove(const model::ChessGame& game,
                                                               std::atomic<bool>& cancelToken) {
  // Kopie der Stellung: der Such-Thread sieht das laufende Spiel nie
  model::Position pos = game.getPosition();
  const core::Color side = game.getGameState().sideToMove;
  const engine::Difficulty difficulty = m_difficulty.load();
  auto eng = m_engine;

  return std::async(std::launch::async,
                    [eng, pos, side, difficulty, &cancelToken]() -> std::optional<model::Move> {
                      if (cancelToken.load()) return std::nullopt;

                      eng->setDifficulty(difficulty);
                      engine::SearchResult res = eng->findBestMove(pos, side);

                      if (cancelToken.load()) {
                        std::cout << "[BotPlayer] search cancelled, move discarded\n";
                        return std::nullopt;
                      }
                      if (!res.bestMove) {
                        std::cout << "[BotPlayer] no legal move\n";
                        return std::nullopt;
                      }
                      return res.bestMove;
                    });
}

}  // namespace gambit::controller
