#include "gambit/controller/game_manager.hpp"

#include <chrono>
#include <iostream>

#include "gambit/model/notation.hpp"

namespace gambit::controller {

GameManager::GameManager(model::ChessGame& game) : m_game(game) {}

GameManager::~GameManager() {
  stopGame();
}

void GameManager::startGame(core::OpponentKind opponent, core::Color playerColor,
                            const std::string& fen) {
  std::lock_guard lock(m_mutex);
  m_game.newGame(opponent, playerColor, fen);  // wirft FenError, bevor irgendetwas ersetzt wird
  cancelPendingBot();

  clearSelection();
  m_waiting_promotion = false;
  m_white_player.reset();
  m_black_player.reset();
  m_ai_player = nullptr;

  if (opponent == core::OpponentKind::Ai) {
    auto bot = std::make_unique<BotPlayer>(m_difficulty, m_engine_cfg);
    m_ai_player = bot.get();
    if (playerColor == core::Color::White)
      m_black_player = std::move(bot);
    else
      m_white_player = std::move(bot);
  }

  std::cout << "[GameManager] new game vs "
            << (opponent == core::OpponentKind::Ai ? "ai" : "human") << ", player is "
            << (playerColor == core::Color::White ? "white" : "black") << "\n";
  startBotIfNeeded();
}

void GameManager::stopGame() {
  std::lock_guard lock(m_mutex);
  cancelPendingBot();
  clearSelection();
  m_waiting_promotion = false;
}

void GameManager::cancelPendingBot() {
  if (!m_bot_future.valid()) return;
  m_cancel_bot.store(true);
  m_bot_future.wait();
  m_bot_future = {};
  m_cancel_bot.store(false);
}

bool GameManager::update() {
  std::lock_guard lock(m_mutex);
  using namespace std::chrono_literals;
  if (!m_bot_future.valid()) return false;
  if (m_bot_future.wait_for(1ms) != std::future_status::ready) return false;
  return finishBotMove();
}

bool GameManager::waitForBot() {
  std::lock_guard lock(m_mutex);
  if (!m_bot_future.valid()) return false;
  m_bot_future.wait();
  return finishBotMove();
}

bool GameManager::finishBotMove() {
  std::optional<model::Move> mv;
  try {
    mv = m_bot_future.get();
  } catch (const std::exception& e) {
    std::cerr << "[GameManager] bot failed: " << e.what() << "\n";
    m_bot_future = {};
    return false;
  }
  m_bot_future = {};
  if (!mv) return false;

  applyMoveAndNotify(*mv, std::nullopt);
  startBotIfNeeded();
  return true;
}

Selection GameManager::selectSquare(core::Square sq) {
  std::lock_guard lock(m_mutex);
  Selection sel;
  sel.square = sq;
  if (m_waiting_promotion || m_game.getStatus().gameOver ||
      !isHumanUnlocked(m_game.getGameState().sideToMove))
    return sel;

  // Eigene Figur: (neu) auswaehlen
  const auto piece = m_game.getPiece(sq);
  if (piece && piece->color == m_game.getGameState().sideToMove) {
    m_selected = sq;
    m_selected_moves = m_game.getLegalMoves(sq);
    sel.result = SelectionResult::Selected;
    sel.moves = m_selected_moves;
    return sel;
  }

  if (m_selected) {
    for (const auto& m : m_selected_moves) {
      if (m.to != sq) continue;
      sel.move = m;
      if (m.isPromotion() && onPromotionRequested_) {
        m_waiting_promotion = true;
        m_promotion_move = m;
        sel.result = SelectionResult::NeedsPromotion;
        onPromotionRequested_(sq);
        return sel;
      }
      // ohne Auswahl-Callback wird zur Dame umgewandelt
      applyMoveAndNotify(m, std::nullopt);
      startBotIfNeeded();
      sel.result = SelectionResult::Moved;
      return sel;
    }
  }

  clearSelection();
  sel.result = SelectionResult::Deselected;
  return sel;
}

bool GameManager::completePendingPromotion(core::PieceType promotion) {
  std::lock_guard lock(m_mutex);
  if (!m_waiting_promotion) return false;
  switch (promotion) {
    case core::PieceType::Queen:
    case core::PieceType::Rook:
    case core::PieceType::Bishop:
    case core::PieceType::Knight:
      break;
    default:
      return false;  // weiter warten
  }
  m_waiting_promotion = false;
  applyMoveAndNotify(m_promotion_move, promotion);
  startBotIfNeeded();
  return true;
}

model::GameEvents GameManager::applyMove(const model::Move& mv,
                                         std::optional<core::PieceType> promotion) {
  std::lock_guard lock(m_mutex);
  m_waiting_promotion = false;
  model::GameEvents events = applyMoveAndNotify(mv, promotion);
  startBotIfNeeded();
  return events;
}

model::GameEvents GameManager::applyMoveAndNotify(const model::Move& mv,
                                                  std::optional<core::PieceType> promotion) {
  clearSelection();
  model::GameEvents events = m_game.doMove(mv, promotion);
  for (const auto& ev : events)
    for (const auto& cb : m_listeners) cb(ev);

  const auto result = m_game.getResult();
  if (result != core::GameResult::ONGOING) {
    std::cout << "[GameManager] game over after " << model::moveToUci(mv) << "\n";
    if (onGameEnd_) onGameEnd_(result);
  }
  return events;
}

void GameManager::clearSelection() {
  m_selected.reset();
  m_selected_moves.clear();
}

void GameManager::startBotIfNeeded() {
  if (m_bot_future.valid()) return;
  if (m_game.getStatus().gameOver) return;

  const core::Color stm = m_game.getGameState().sideToMove;
  IPlayer* p = (stm == core::Color::White) ? m_white_player.get() : m_black_player.get();
  if (p && !p->isHuman()) {
    m_cancel_bot.store(false);
    m_bot_future = p->requestMove(m_game, m_cancel_bot);
  }
}

void GameManager::addListener(EventListener cb) {
  std::lock_guard lock(m_mutex);
  m_listeners.push_back(std::move(cb));
}

void GameManager::setBotForColor(core::Color color, std::unique_ptr<IPlayer> bot) {
  std::lock_guard lock(m_mutex);
  cancelPendingBot();
  auto& slot = (color == core::Color::White) ? m_white_player : m_black_player;
  if (slot.get() == m_ai_player) m_ai_player = nullptr;
  slot = std::move(bot);
  startBotIfNeeded();
}

void GameManager::setDifficulty(engine::Difficulty d) {
  std::lock_guard lock(m_mutex);
  m_difficulty = d;
  if (m_ai_player) m_ai_player->setDifficulty(d);
}

void GameManager::setEngineConfig(const engine::EngineConfig& cfg) {
  std::lock_guard lock(m_mutex);
  m_engine_cfg = cfg;
}

engine::Difficulty GameManager::getDifficulty() const {
  std::lock_guard lock(m_mutex);
  return m_difficulty;
}

std::optional<core::Square> GameManager::getSelectedSquare() const {
  std::lock_guard lock(m_mutex);
  return m_selected;
}

bool GameManager::isWaitingForPromotion() const {
  std::lock_guard lock(m_mutex);
  return m_waiting_promotion;
}

bool GameManager::isHumanUnlocked(core::Color color) const {
  const IPlayer* p = (color == core::Color::White) ? m_white_player.get() : m_black_player.get();
  return !p || p->isHuman();
}

bool GameManager::isHuman(core::Color color) const {
  std::lock_guard lock(m_mutex);
  return isHumanUnlocked(color);
}

bool GameManager::isHumanTurn() const {
  std::lock_guard lock(m_mutex);
  return isHumanUnlocked(m_game.getGameState().sideToMove);
}

bool GameManager::isBotThinking() const {
  std::lock_guard lock(m_mutex);
  return m_bot_future.valid();
}

}  // namespace gambit::controller
