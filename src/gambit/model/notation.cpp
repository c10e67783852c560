#include "gambit/model/notation.hpp"

#include <cctype>

namespace gambit::model {

std::string squareToString(core::Square sq) {
  if (!is_valid(sq)) return "-";
  std::string out;
  out += static_cast<char>('a' + file_of(sq));
  out += static_cast<char>('1' + rank_of(sq));
  return out;
}

core::Square stringToSquare(std::string_view str) {
  if (str.size() != 2) return core::NO_SQUARE;
  const char f = str[0];
  const char r = str[1];
  if (f < 'a' || f > 'h' || r < '1' || r > '8') return core::NO_SQUARE;
  return make_square(f - 'a', r - '1');
}

char pieceToChar(const Piece& p) {
  char c = '?';
  switch (p.type) {
    case core::PieceType::Pawn:
      c = 'p';
      break;
    case core::PieceType::Knight:
      c = 'n';
      break;
    case core::PieceType::Bishop:
      c = 'b';
      break;
    case core::PieceType::Rook:
      c = 'r';
      break;
    case core::PieceType::Queen:
      c = 'q';
      break;
    case core::PieceType::King:
      c = 'k';
      break;
    default:
      return '?';
  }
  return p.color == core::Color::White ? static_cast<char>(std::toupper(c)) : c;
}

std::optional<Piece> pieceFromChar(char ch) {
  core::PieceType type;
  switch (std::tolower(static_cast<unsigned char>(ch))) {
    case 'k':
      type = core::PieceType::King;
      break;
    case 'p':
      type = core::PieceType::Pawn;
      break;
    case 'n':
      type = core::PieceType::Knight;
      break;
    case 'b':
      type = core::PieceType::Bishop;
      break;
    case 'r':
      type = core::PieceType::Rook;
      break;
    case 'q':
      type = core::PieceType::Queen;
      break;
    default:
      return std::nullopt;
  }
  const bool white = std::isupper(static_cast<unsigned char>(ch)) != 0;
  return Piece{type, white ? core::Color::White : core::Color::Black};
}

char promotionChar(core::PieceType t) {
  switch (t) {
    case core::PieceType::Queen:
      return 'q';
    case core::PieceType::Rook:
      return 'r';
    case core::PieceType::Bishop:
      return 'b';
    case core::PieceType::Knight:
      return 'n';
    default:
      return 0;
  }
}

std::string moveToUci(const Move& m) {
  std::string out = squareToString(m.from) + squareToString(m.to);
  if (const char pc = promotionChar(m.promotion)) out += pc;
  return out;
}

std::string moveToNotation(const Move& m, core::PieceType mover, core::PieceType promotion) {
  if (m.castle == CastleSide::KingSide) return "O-O";
  if (m.castle == CastleSide::QueenSide) return "O-O-O";

  std::string out;
  const bool pawn = mover == core::PieceType::Pawn;
  if (!pawn) out += pieceToChar(Piece{mover, core::Color::White});

  if (m.isCapture()) {
    if (pawn) out += static_cast<char>('a' + file_of(m.from));
    out += 'x';
  }
  out += squareToString(m.to);

  if (promotion == core::PieceType::None) promotion = m.promotion;
  if (promotion != core::PieceType::None) {
    out += '=';
    out += pieceToChar(Piece{promotion, core::Color::White});
  }
  return out;
}

}  // namespace gambit::model
