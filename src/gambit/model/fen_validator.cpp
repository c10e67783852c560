#include "gambit/model/fen_validator.hpp"

#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace gambit::model::fen {

namespace {

std::string boardError(const std::string &boardField) {
  int rankCount = 0;
  int whiteKings = 0;
  int blackKings = 0;
  std::size_t i = 0;
  while (i < boardField.size()) {
    int fileSum = 0;
    const bool backRank = rankCount == 0 || rankCount == 7;
    while (i < boardField.size() && boardField[i] != '/') {
      char c = boardField[i++];
      if (std::isdigit(static_cast<unsigned char>(c))) {
        int n = c - '0';
        if (n <= 0 || n > 8) return "bad empty-square count '" + std::string(1, c) + "'";
        fileSum += n;
      } else {
        switch (c) {
          case 'K':
            ++whiteKings;
            break;
          case 'k':
            ++blackKings;
            break;
          case 'p':
          case 'P':
            if (backRank) return "pawn on a back rank";
            break;
          case 'r':
          case 'n':
          case 'b':
          case 'q':
          case 'R':
          case 'N':
          case 'B':
          case 'Q':
            break;
          default:
            return "unknown piece letter '" + std::string(1, c) + "'";
        }
        ++fileSum;
      }
      if (fileSum > 8) return "rank " + std::to_string(8 - rankCount) + " is too long";
    }
    if (fileSum != 8) return "rank " + std::to_string(8 - rankCount) + " is too short";
    ++rankCount;
    if (i < boardField.size() && boardField[i] == '/') {
      ++i;
      if (i == boardField.size()) return "trailing '/'";
    }
  }
  if (rankCount != 8) return "expected 8 ranks, got " + std::to_string(rankCount);
  if (whiteKings != 1 || blackKings != 1) return "each side needs exactly one king";
  return {};
}

bool isCastlingFieldValid(const std::string &field) {
  if (field == "-") return true;
  const std::string allowed = "KQkq";
  std::size_t last = 0;
  for (std::size_t i = 0; i < field.size(); ++i) {
    const std::size_t pos = allowed.find(field[i]);
    if (pos == std::string::npos) return false;
    if (i > 0 && pos <= last) return false;  // duplicates or out of KQkq order
    last = pos;
  }
  return !field.empty();
}

bool isEnPassantFieldValid(const std::string &field) {
  if (field == "-") return true;
  if (field.size() != 2) return false;
  char file = field[0];
  char rank = field[1];
  if (file < 'a' || file > 'h') return false;
  return rank == '3' || rank == '6';
}

bool isNonNegativeInteger(const std::string &field) {
  if (field.empty() || field.size() > 9) return false;
  for (char c : field) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

}  // namespace

std::string validationError(const std::string &fen) {
  std::istringstream ss(fen);
  std::vector<std::string> fields;
  std::string tok;
  while (ss >> tok) fields.push_back(tok);
  if (fields.size() < 4 || fields.size() > 6)
    return "expected 4 to 6 fields, got " + std::to_string(fields.size());

  if (std::string err = boardError(fields[0]); !err.empty()) return err;

  if (!(fields[1] == "w" || fields[1] == "b")) return "side to move must be 'w' or 'b'";

  if (!isCastlingFieldValid(fields[2])) return "bad castling field '" + fields[2] + "'";

  if (!isEnPassantFieldValid(fields[3])) return "bad en-passant field '" + fields[3] + "'";

  if (fields.size() > 4 && !isNonNegativeInteger(fields[4])) return "bad halfmove clock";
  if (fields.size() > 5) {
    if (!isNonNegativeInteger(fields[5])) return "bad fullmove number";
    if (std::stoul(fields[5]) == 0) return "fullmove number starts at 1";
  }

  return {};
}

}  // namespace gambit::model::fen
