#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace gambit::engine {

enum class Difficulty : std::uint8_t { Easy, Medium, Hard };

struct EngineConfig {
  // Suchtiefe je Stufe (Halbzüge)
  int easyDepth = 2;
  int mediumDepth = 3;
  int hardDepth = 4;
  double easyRandomMoveChance = 0.3;  // Easy spielt ab und zu einen Zufallszug
  std::optional<std::uint32_t> randomSeed;  // unset => std::random_device

  // Eval-Gewichte
  int centerBonus = 8;
  int extendedCenterBonus = 3;
  int castledKingBonus = 40;
  int centralKingPenalty = 30;
  int mobilityWeight = 5;

  bool logSearch = true;

  int depthFor(Difficulty d) const {
    switch (d) {
      case Difficulty::Easy:
        return easyDepth;
      case Difficulty::Hard:
        return hardDepth;
      default:
        return mediumDepth;
    }
  }
};

// Pawn, Knight, Bishop, Rook, Queen, King
static const int base_value[6] = {100, 320, 330, 500, 900, 20000};
constexpr int MATE = 100000;
constexpr int INF = 1000000;

inline std::string toString(Difficulty d) {
  switch (d) {
    case Difficulty::Easy:
      return "easy";
    case Difficulty::Hard:
      return "hard";
    default:
      return "medium";
  }
}

inline std::optional<Difficulty> difficultyFromString(const std::string& s) {
  if (s == "easy") return Difficulty::Easy;
  if (s == "medium") return Difficulty::Medium;
  if (s == "hard") return Difficulty::Hard;
  return std::nullopt;
}

}  // namespace gambit::engine
