#include "gambit/engine/bot_engine.hpp"

#include <iostream>
#include <vector>

#include "gambit/model/notation.hpp"

namespace gambit::engine {

namespace {
std::uint32_t seed_from(const EngineConfig& cfg) {
  if (cfg.randomSeed) return *cfg.randomSeed;
  std::random_device rd;
  return rd();
}

std::string format_top_moves(const std::vector<std::pair<model::Move, int>>& top) {
  std::string out;
  bool first = true;
  for (auto& p : top) {
    if (!first) out += ", ";
    first = false;
    out += model::moveToUci(p.first) + " (" + std::to_string(p.second) + ")";
  }
  if (out.empty()) out = "<none>";
  return out;
}
}  // namespace

BotEngine::BotEngine(Difficulty difficulty, const EngineConfig& cfg)
    : m_engine(cfg), m_difficulty(difficulty), m_rng(seed_from(cfg)) {}
BotEngine::~BotEngine() = default;

bool BotEngine::setDifficulty(const std::string& name) {
  const auto d = difficultyFromString(name);
  if (!d) {
    std::cerr << "[BotEngine] ignoring unknown difficulty '" << name << "'\n";
    return false;
  }
  m_difficulty = *d;
  return true;
}

SearchResult BotEngine::findBestMove(const model::Position& pos, core::Color side) {
  SearchResult res;
  const EngineConfig& cfg = m_engine.getConfig();
  const int depth = cfg.depthFor(m_difficulty);

  // Easy: mit fester Wahrscheinlichkeit einen beliebigen legalen Zug
  if (m_difficulty == Difficulty::Easy && cfg.easyRandomMoveChance > 0.0) {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(m_rng) < cfg.easyRandomMoveChance) {
      model::Position scratch = pos;
      std::vector<model::Move> moves;
      m_move_gen.generateLegalMoves(scratch, side, moves);
      if (!moves.empty()) {
        std::uniform_int_distribution<std::size_t> pick(0, moves.size() - 1);
        res.bestMove = moves[pick(m_rng)];
        res.randomMove = true;
        res.stats.bestMove = res.bestMove;
        res.stats.depth = 0;
        m_last_stats = res.stats;
        if (cfg.logSearch)
          std::cout << "[BotEngine] random move " << model::moveToUci(*res.bestMove) << "\n";
        return res;
      }
      // keine Zuege: unten liefert die Suche ebenfalls nullopt
    }
  }

  res.bestMove = m_engine.find_best_move(pos, side, depth);
  res.stats = m_engine.getLastSearchStats();
  m_last_stats = res.stats;

  if (!cfg.logSearch) return res;

  std::cout << "[BotEngine] Search finished: difficulty=" << toString(m_difficulty)
            << " depth=" << depth << " time=" << res.stats.elapsedMs << "ms\n";
  std::cout << "[BotEngine] info nodes=" << res.stats.nodes
            << " bestScore=" << res.stats.bestScore;
  if (res.stats.bestMove.has_value()) {
    std::cout << " bestMove=" << model::moveToUci(res.stats.bestMove.value());
  } else {
    std::cout << " bestMove=<none>";
  }
  std::cout << "\n";
  if (!res.stats.topMoves.empty()) {
    std::cout << "[BotEngine] topMoves " << format_top_moves(res.stats.topMoves) << "\n";
  }
  return res;
}

}  // namespace gambit::engine
