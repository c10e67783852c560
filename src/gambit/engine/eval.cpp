#include "gambit/engine/eval.hpp"

#include <vector>

#include "gambit/engine/eval_shared.hpp"
#include "gambit/model/move_generator.hpp"
#include "gambit/model/position.hpp"

using namespace gambit::core;
using namespace gambit::model;

namespace gambit::engine {

struct Evaluator::Impl {
  EngineConfig cfg;
  MoveGenerator mg;
};

Evaluator::Evaluator(const EngineConfig& cfg) noexcept : m_impl(std::make_unique<Impl>()) {
  m_impl->cfg = cfg;
}
Evaluator::~Evaluator() noexcept = default;

// =============================================================================
// Terms
// =============================================================================

static void material_and_pst(const Board& b, EvalTerms& t) {
  for (Square sq : BOARD_ORDER) {
    const auto p = b.getPiece(sq);
    if (!p) continue;
    const int sign = p->color == Color::White ? 1 : -1;
    t.material += sign * base_value[static_cast<int>(p->type)];
    t.pst += sign * pst(p->type, sq, p->color);
  }
}

static int center_control(const Position& pos, const EngineConfig& cfg) {
  int s = 0;
  for (Square sq : CENTER) {
    if (pos.isSquareAttacked(sq, Color::White)) s += cfg.centerBonus;
    if (pos.isSquareAttacked(sq, Color::Black)) s -= cfg.centerBonus;
  }
  for (Square sq : EXTENDED_CENTER) {
    if (pos.isSquareAttacked(sq, Color::White)) s += cfg.extendedCenterBonus;
    if (pos.isSquareAttacked(sq, Color::Black)) s -= cfg.extendedCenterBonus;
  }
  return s;
}

// Rochiert (c/g-Linie) wird belohnt, Koenig auf d/e der Grundreihe bestraft
static int king_side_score(const Board& b, Color c, const EngineConfig& cfg) {
  const Square k = b.findKing(c);
  if (k == NO_SQUARE || rank_of(k) != home_rank(c)) return 0;
  const int f = file_of(k);
  int s = 0;
  if (f == 6 || f == 2) s += cfg.castledKingBonus;
  if (f == 3 || f == 4) s -= cfg.centralKingPenalty;
  return s;
}

EvalTerms Evaluator::evaluateTerms(const model::Position& pos) const {
  const EngineConfig& cfg = m_impl->cfg;
  const Board& b = pos.getBoard();
  EvalTerms t;

  material_and_pst(b, t);
  t.center = center_control(pos, cfg);
  t.kingSafety = king_side_score(b, Color::White, cfg) - king_side_score(b, Color::Black, cfg);

  // Mobilitaet: legale Zuege beider Seiten, unabhaengig davon wer am Zug ist
  Position scratch = pos;
  std::vector<Move> moves;
  m_impl->mg.generateLegalMoves(scratch, Color::White, moves);
  const int white = static_cast<int>(moves.size());
  moves.clear();
  m_impl->mg.generateLegalMoves(scratch, Color::Black, moves);
  const int black = static_cast<int>(moves.size());
  t.mobility = (white - black) * cfg.mobilityWeight;

  return t;
}

int Evaluator::evaluate(const model::Position& pos) const {
  return evaluateTerms(pos).total();
}

}  // namespace gambit::engine
