#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../constants.hpp"
#include "../engine/config.hpp"
#include "../model/chess_game.hpp"
#include "bot_player.hpp"
#include "player.hpp"

namespace gambit::controller {

enum class SelectionResult { Ignored, Selected, Deselected, Moved, NeedsPromotion };

struct Selection {
  SelectionResult result = SelectionResult::Ignored;
  core::Square square = core::NO_SQUARE;
  std::vector<model::Move> moves;  // Selected: legal moves of the piece
  std::optional<model::Move> move;  // Moved / NeedsPromotion
};

/**
 * @brief GameManager: Spiel-Lifecycle, Square-Auswahl und Bot-Orchestrierung ueber einem ChessGame.
 *
 * Responsibilities:
 * - Start/Stop eines Spiels (gegen KI oder Mensch)
 * - select-square Helfer fuer Klick-UIs, inklusive Promotion-Flow
 * - Asynchrone Bot-Zuege, angewendet im Thread des Aufrufers (update())
 * - Weiterreichen der GameEvents jedes Zugs an registrierte Listener
 */
class GameManager {
 public:
  using EventListener = std::function<void(const model::GameEvent&)>;
  using PromotionCallback = std::function<void(core::Square promotionSquare)>;
  using EndCallback = std::function<void(core::GameResult)>;

  explicit GameManager(model::ChessGame& game);
  ~GameManager();

  // Lifecycle. Throws model::FenError for a bad fen; the running game is kept then.
  void startGame(core::OpponentKind opponent, core::Color playerColor,
                 const std::string& fen = core::START_FEN);
  void stopGame();

  // Polls the bot future and applies a finished bot move. Returns true if a move was applied.
  bool update();
  // Blocks until the pending bot move (if any) is applied
  bool waitForBot();

  Selection selectSquare(core::Square sq);
  std::optional<core::Square> getSelectedSquare() const;
  bool isWaitingForPromotion() const;
  // Returns false if no promotion is pending or the piece is not a legal choice
  bool completePendingPromotion(core::PieceType promotion);

  // apply-move surface; move must come from the game's legal move list
  model::GameEvents applyMove(const model::Move& mv,
                              std::optional<core::PieceType> promotion = std::nullopt);

  // Listeners and callbacks run with the manager locked and must not call back into it.
  void addListener(EventListener cb);
  void setOnPromotionRequested(PromotionCallback cb) { onPromotionRequested_ = std::move(cb); }
  void setOnGameEnd(EndCallback cb) { onGameEnd_ = std::move(cb); }

  void setBotForColor(core::Color color, std::unique_ptr<IPlayer> bot);
  void setDifficulty(engine::Difficulty d);
  engine::Difficulty getDifficulty() const;
  void setEngineConfig(const engine::EngineConfig& cfg);

  // Safe to poll from another thread while the bot is searching
  bool isHuman(core::Color color) const;
  bool isHumanTurn() const;
  bool isBotThinking() const;

 private:
  model::ChessGame& m_game;
  engine::Difficulty m_difficulty = engine::Difficulty::Medium;
  engine::EngineConfig m_engine_cfg;

  // Players: nullptr bedeutet menschlicher Spieler
  std::unique_ptr<IPlayer> m_white_player;
  std::unique_ptr<IPlayer> m_black_player;
  BotPlayer* m_ai_player = nullptr;  // der von startGame installierte Bot, falls vorhanden

  // Token vor dem Future: der Such-Thread haelt eine Referenz darauf
  std::atomic<bool> m_cancel_bot{false};
  std::future<std::optional<model::Move>> m_bot_future;

  // Auswahl & pending promotion
  std::optional<core::Square> m_selected;
  std::vector<model::Move> m_selected_moves;
  bool m_waiting_promotion = false;
  model::Move m_promotion_move{};

  mutable std::mutex m_mutex;

  std::vector<EventListener> m_listeners;
  PromotionCallback onPromotionRequested_;
  EndCallback onGameEnd_;

  // intern
  model::GameEvents applyMoveAndNotify(const model::Move& mv,
                                       std::optional<core::PieceType> promotion);
  void clearSelection();
  bool isHumanUnlocked(core::Color color) const;
  void cancelPendingBot();
  void startBotIfNeeded();
  bool finishBotMove();
};

}  // namespace gambit::controller
