#pragma once

#include <algorithm>
#include <vector>

#include "config.hpp"
#include "gambit/model/move.hpp"

namespace gambit::engine {

// Wert der geschlagenen Figur, 0 fuer ruhige Zuege. En passant zaehlt als Bauer.
inline int capture_value(const model::Move& m) {
  if (m.captured == core::PieceType::None) return 0;
  return base_value[static_cast<int>(m.captured)];
}

// Captures zuerst, hoeherer Opferwert vorne. Stabil, damit gleich bewertete Zuege
// in Generator-Reihenfolge bleiben.
inline void order_captures_first(std::vector<model::Move>& moves) {
  std::stable_sort(moves.begin(), moves.end(), [](const model::Move& a, const model::Move& b) {
    return capture_value(a) > capture_value(b);
  });
}

}  // namespace gambit::engine
