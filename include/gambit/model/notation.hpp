#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/model_types.hpp"
#include "move.hpp"

namespace gambit::model {

// "e4" <-> square; NO_SQUARE / "-" for anything off the board
std::string squareToString(core::Square sq);
core::Square stringToSquare(std::string_view str);

// FEN letters: uppercase white, lowercase black
char pieceToChar(const Piece& p);
std::optional<Piece> pieceFromChar(char c);
char promotionChar(core::PieceType t);  // 'q', 'r', 'b', 'n' or 0

// Coordinate form, e.g. "e2e4", "e7e8q"
std::string moveToUci(const Move& m);

// Simplified algebraic notation as shown in the move list: piece letter,
// pawn captures prefixed with the origin file, 'x' for captures, "=Q" for
// promotions, "O-O"/"O-O-O" for castling. No disambiguation, no check marks.
std::string moveToNotation(const Move& m, core::PieceType mover,
                           core::PieceType promotion = core::PieceType::None);

}  // namespace gambit::model
