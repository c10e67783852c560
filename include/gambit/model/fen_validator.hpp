#pragma once

#include <string>

namespace gambit::model::fen {

// Structural validation of a FEN string: board layout (8 ranks of 8 files,
// known piece letters, exactly one king per side, no pawns on the back ranks),
// side to move, castling letters, en-passant square and the two counters.
// The counters may be omitted and then default to "0 1".
// Returns an empty string for a well-formed FEN, otherwise the first problem found.
std::string validationError(const std::string& fen);

inline bool isFenWellFormed(const std::string& fen) {
  return validationError(fen).empty();
}

}  // namespace gambit::model::fen
