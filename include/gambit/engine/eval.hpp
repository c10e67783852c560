#pragma once
#include <memory>

#include "config.hpp"

namespace gambit {
namespace model {
class Position;
}

namespace engine {

// Einzelterme der Bewertung, alle aus Sicht von Weiss
struct EvalTerms {
  int material = 0;
  int pst = 0;
  int center = 0;
  int kingSafety = 0;
  int mobility = 0;
  int total() const { return material + pst + center + kingSafety + mobility; }
};

class Evaluator final {
 public:
  explicit Evaluator(const EngineConfig& cfg = {}) noexcept;
  ~Evaluator() noexcept;

  // Bewertung in cp aus Sicht von Weiss (positiv = gut fuer Weiss).
  int evaluate(const model::Position& pos) const;
  EvalTerms evaluateTerms(const model::Position& pos) const;

  Evaluator(const Evaluator&) = delete;
  Evaluator& operator=(const Evaluator&) = delete;
  Evaluator(Evaluator&&) = delete;
  Evaluator& operator=(Evaluator&&) = delete;

 private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

}  // namespace engine
}  // namespace gambit
