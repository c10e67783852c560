#include "gambit/engine/engine.hpp"

#include <memory>

#include "gambit/engine/eval.hpp"
#include "gambit/engine/search.hpp"

namespace gambit::engine {

struct Engine::Impl {
  EngineConfig cfg;
  std::shared_ptr<const Evaluator> eval;
  std::unique_ptr<Search> search;

  explicit Impl(const EngineConfig& c) : cfg(c) {
    eval = std::make_shared<Evaluator>(cfg);
    search = std::make_unique<Search>(eval);
  }
};

Engine::Engine(const EngineConfig& cfg) : pimpl(new Impl(cfg)) {}

Engine::~Engine() {
  delete pimpl;
}

std::optional<model::Move> Engine::find_best_move(const model::Position& pos, core::Color side,
                                                  int depth) {
  return pimpl->search->search_root(pos, side, depth);
}

int Engine::evaluate(const model::Position& pos) const {
  return pimpl->eval->evaluate(pos);
}

const SearchStats& Engine::getLastSearchStats() const {
  return pimpl->search->getStats();
}

const EngineConfig& Engine::getConfig() const {
  return pimpl->cfg;
}

}  // namespace gambit::engine
