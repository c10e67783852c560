#include "gambit/engine/search.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "gambit/engine/eval.hpp"
#include "gambit/engine/move_order.hpp"

namespace gambit::engine {

Search::Search(std::shared_ptr<const Evaluator> eval) : eval_(std::move(eval)) {}

std::vector<model::Move> Search::ordered_moves(const model::Position& pos, core::Color c) {
  model::Position scratch = pos;
  std::vector<model::Move> moves;
  mg.generateLegalMoves(scratch, c, moves);
  order_captures_first(moves);
  return moves;
}

int Search::minimax(const model::Position& pos, int depth, int alpha, int beta,
                    bool maximizing) {
  ++stats.nodes;
  const core::Color us = maximizing ? core::Color::White : core::Color::Black;

  // Terminal vor Tiefe: Matt/Patt wird auch im Blatt erkannt
  std::vector<model::Move> moves = ordered_moves(pos, us);
  if (moves.empty()) {
    if (pos.inCheck(us)) return maximizing ? -MATE : MATE;
    return 0;
  }

  if (depth <= 0) return eval_->evaluate(pos);

  if (maximizing) {
    int best = -INF;
    for (const auto& m : moves) {
      model::Position child = pos;
      child.playMove(m);
      const int score = minimax(child, depth - 1, alpha, beta, false);
      best = std::max(best, score);
      alpha = std::max(alpha, score);
      if (beta <= alpha) break;
    }
    return best;
  }

  int best = INF;
  for (const auto& m : moves) {
    model::Position child = pos;
    child.playMove(m);
    const int score = minimax(child, depth - 1, alpha, beta, true);
    best = std::min(best, score);
    beta = std::min(beta, score);
    if (beta <= alpha) break;
  }
  return best;
}

std::optional<model::Move> Search::search_root(const model::Position& pos, core::Color side,
                                               int depth) {
  using steady_clock = std::chrono::steady_clock;
  const auto t0 = steady_clock::now();

  stats = SearchStats{};
  stats.depth = std::max(1, depth);

  const bool maximizing = side == core::Color::White;
  std::vector<model::Move> moves = ordered_moves(pos, side);
  if (moves.empty()) return std::nullopt;

  // Jeder Root-Zug bekommt das volle Fenster; bei Gleichstand bleibt der erste
  model::Move best = moves.front();
  int bestScore = maximizing ? -INF : INF;
  for (const auto& m : moves) {
    model::Position child = pos;
    child.playMove(m);
    const int score = minimax(child, stats.depth - 1, -INF, INF, !maximizing);
    stats.topMoves.emplace_back(m, score);
    if (maximizing ? score > bestScore : score < bestScore) {
      bestScore = score;
      best = m;
    }
  }

  stats.bestMove = best;
  stats.bestScore = bestScore;
  stats.elapsedMs = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::now() - t0).count());
  return best;
}

}  // namespace gambit::engine
