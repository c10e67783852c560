#include "gambit/model/fen.hpp"

#include <sstream>

#include "gambit/model/fen_validator.hpp"
#include "gambit/model/notation.hpp"

namespace gambit::model::fen {

// START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";
Position parse(const std::string& fen) {
  if (std::string err = validationError(fen); !err.empty())
    throw FenError("Invalid FEN '" + fen + "': " + err);

  std::istringstream iss(fen);
  std::string board, activeColor, castling, enPassant;
  std::string halfmoveClock = "0", fullmoveNumber = "1";
  iss >> board >> activeColor >> castling >> enPassant;
  if (!(iss >> halfmoveClock)) halfmoveClock = "0";
  if (!(iss >> fullmoveNumber)) fullmoveNumber = "1";

  Position pos;
  Board& b = pos.getBoard();
  GameState& st = pos.getState();

  // board
  int rank = 7;
  int file = 0;
  for (char ch : board) {
    if (ch == '/') {
      // Nächste Reihe
      --rank;
      file = 0;
    } else if (ch >= '1' && ch <= '8') {
      file += ch - '0';
    } else {
      const auto piece = pieceFromChar(ch);
      if (!piece) throw FenError("Invalid FEN character: " + std::string(1, ch));
      b.setPiece(make_square(file, rank), *piece);
      ++file;
    }
  }

  st.sideToMove = (activeColor == "w" ? core::Color::White : core::Color::Black);

  std::uint8_t rights = 0;
  if (castling.find('K') != std::string::npos) rights |= Castling::WK;
  if (castling.find('Q') != std::string::npos) rights |= Castling::WQ;
  if (castling.find('k') != std::string::npos) rights |= Castling::BK;
  if (castling.find('q') != std::string::npos) rights |= Castling::BQ;
  st.castlingRights = rights;

  st.enPassantSquare = (enPassant == "-") ? core::NO_SQUARE : stringToSquare(enPassant);

  st.halfmoveClock = static_cast<std::uint32_t>(std::stoul(halfmoveClock));
  st.fullmoveNumber = static_cast<std::uint32_t>(std::stoul(fullmoveNumber));

  // Der Gegner darf nicht im Schach stehen, sonst waere der Koenig schlagbar
  if (pos.inCheck(~st.sideToMove))
    throw FenError("Invalid FEN '" + fen + "': side not to move is in check");
  return pos;
}

std::string serialize(const Position& pos) {
  const Board& b = pos.getBoard();
  const GameState& st = pos.getState();
  std::string out;

  for (int row = 0; row < 8; ++row) {
    int empty = 0;
    for (int col = 0; col < 8; ++col) {
      const auto p = b.getPiece(square_at(row, col));
      if (!p) {
        ++empty;
        continue;
      }
      if (empty > 0) {
        out += static_cast<char>('0' + empty);
        empty = 0;
      }
      out += pieceToChar(*p);
    }
    if (empty > 0) out += static_cast<char>('0' + empty);
    if (row < 7) out += '/';
  }

  out += (st.sideToMove == core::Color::White) ? " w " : " b ";

  std::string castling;
  if (st.castlingRights & Castling::WK) castling += 'K';
  if (st.castlingRights & Castling::WQ) castling += 'Q';
  if (st.castlingRights & Castling::BK) castling += 'k';
  if (st.castlingRights & Castling::BQ) castling += 'q';
  out += castling.empty() ? "-" : castling;

  out += ' ';
  out += squareToString(st.enPassantSquare);
  out += ' ' + std::to_string(st.halfmoveClock);
  out += ' ' + std::to_string(st.fullmoveNumber);
  return out;
}

}  // namespace gambit::model::fen
