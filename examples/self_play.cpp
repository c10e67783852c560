#include <iostream>
#include <string>

#include "gambit/engine/bot_engine.hpp"
#include "gambit/model/chess_game.hpp"
#include "gambit/model/fen.hpp"

using namespace gambit;

// Plays one AI-vs-AI game: self_play [fen] [easy|medium|hard]
int main(int argc, char** argv) {
  const std::string fen = argc > 1 ? argv[1] : core::START_FEN;

  engine::EngineConfig cfg;
  cfg.logSearch = false;
  engine::BotEngine bot(engine::Difficulty::Easy, cfg);
  if (argc > 2) bot.setDifficulty(std::string(argv[2]));

  model::ChessGame game;
  try {
    game.newGame(core::OpponentKind::Ai, core::Color::White, fen);
  } catch (const model::FenError& e) {
    std::cerr << "[SelfPlay] " << e.what() << "\n";
    return 1;
  }

  constexpr int kMaxPlies = 300;
  for (int ply = 0; ply < kMaxPlies && !game.getStatus().gameOver; ++ply) {
    auto res = bot.findBestMove(game);
    if (!res.bestMove) break;
    game.doMove(*res.bestMove);
    const auto& rec = game.getHistory().back();
    if (rec.color == core::Color::White)
      std::cout << game.getGameState().fullmoveNumber << ". " << rec.notation;
    else
      std::cout << " " << rec.notation << "\n";
  }
  std::cout << "\n";

  const auto& st = game.getStatus();
  if (st.isCheckmate)
    std::cout << "Checkmate, " << (*st.winner == core::Color::White ? "white" : "black")
              << " wins\n";
  else if (st.isStalemate)
    std::cout << "Stalemate\n";
  else if (st.isDraw)
    std::cout << "Draw by fifty-move rule\n";
  else
    std::cout << "Stopped after " << kMaxPlies << " plies\n";
  std::cout << game.getFen() << "\n";
  return 0;
}
