#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "../model/move_generator.hpp"
#include "../model/position.hpp"
#include "config.hpp"

namespace gambit::engine {

// -----------------------------------------------------------------------------
// SearchStats
// -----------------------------------------------------------------------------
struct SearchStats {
  std::uint64_t nodes = 0;
  std::uint64_t elapsedMs = 0;
  int depth = 0;
  int bestScore = 0;  // aus Sicht von Weiss
  std::optional<model::Move> bestMove;
  // Root-Zuege in Suchreihenfolge mit ihrem Minimax-Wert
  std::vector<std::pair<model::Move, int>> topMoves;
};

class Evaluator;

// -----------------------------------------------------------------------------
// Search – Minimax mit Alpha-Beta, Weiss maximiert, jede Stellung wird kopiert
// -----------------------------------------------------------------------------
class Search {
 public:
  explicit Search(std::shared_ptr<const Evaluator> eval);
  ~Search() = default;

  Search(const Search&) = delete;
  Search& operator=(const Search&) = delete;

  // Bester Zug fuer `side` bei fester Tiefe (>= 1). nullopt, wenn `side` keinen legalen Zug hat.
  // `pos` wird nicht veraendert.
  std::optional<model::Move> search_root(const model::Position& pos, core::Color side, int depth);

  // Wert der Stellung, in der `maximizing` ? Weiss : Schwarz am Zug ist
  int minimax(const model::Position& pos, int depth, int alpha, int beta, bool maximizing);

  [[nodiscard]] const SearchStats& getStats() const noexcept { return stats; }

 private:
  std::vector<model::Move> ordered_moves(const model::Position& pos, core::Color c);

  std::shared_ptr<const Evaluator> eval_;
  model::MoveGenerator mg;
  SearchStats stats;
};

}  // namespace gambit::engine
