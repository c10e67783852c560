#include <algorithm>
#include <cassert>
#include <memory>
#include <vector>

#include "gambit/engine/bot_engine.hpp"
#include "gambit/engine/eval.hpp"
#include "gambit/engine/move_order.hpp"
#include "gambit/engine/search.hpp"
#include "gambit/model/chess_game.hpp"
#include "gambit/model/fen.hpp"

using namespace gambit;

static core::Square sq(char file, int rank) {
  return model::make_square(file - 'a', rank - 1);
}

static engine::EngineConfig quietConfig() {
  engine::EngineConfig cfg;
  cfg.logSearch = false;
  cfg.randomSeed = 1234;
  return cfg;
}

int main() {
  const engine::EngineConfig cfg = quietConfig();
  auto eval = std::make_shared<engine::Evaluator>(cfg);

  // Evaluation
  {
    model::Position start = model::fen::parse(core::START_FEN);
    auto terms = eval->evaluateTerms(start);
    assert(terms.material == 0 && terms.pst == 0 && terms.mobility == 0);
    assert(eval->evaluate(start) == 0);

    // extra queen for white is worth a lot, for black the same amount the other way
    model::Position up = model::fen::parse("3qk3/8/8/8/8/8/8/3QK3 w - - 0 1");
    model::Position white = model::fen::parse("4k3/8/8/8/8/8/8/3QK3 w - - 0 1");
    model::Position black = model::fen::parse("3qk3/8/8/8/8/8/8/4K3 w - - 0 1");
    assert(eval->evaluate(up) == 0);
    assert(eval->evaluate(white) > 800);
    assert(eval->evaluate(black) == -eval->evaluate(white));

    // castled king beats a king in the centre
    model::Position castled = model::fen::parse("4k3/8/8/8/8/8/5PPP/6K1 w - - 0 1");
    model::Position central = model::fen::parse("4k3/8/8/8/8/8/5PPP/4K3 w - - 0 1");
    assert(eval->evaluateTerms(castled).kingSafety == 70);
    assert(eval->evaluateTerms(central).kingSafety == 0);
  }

  // Ordering: captures first by victim value, otherwise generator order
  {
    std::vector<model::Move> moves = {
        model::Move(sq('a', 2), sq('a', 3)),
        model::Move(sq('b', 2), sq('c', 3), core::PieceType::None, core::PieceType::Pawn),
        model::Move(sq('d', 1), sq('d', 8), core::PieceType::None, core::PieceType::Queen),
        model::Move(sq('h', 2), sq('h', 3)),
    };
    engine::order_captures_first(moves);
    assert(moves[0].to == sq('d', 8));
    assert(moves[1].to == sq('c', 3));
    assert(moves[2].to == sq('a', 3));
    assert(moves[3].to == sq('h', 3));
  }

  // Mate in one, both colours, depth 1 and 2
  {
    engine::Search search(eval);
    model::Position w = model::fen::parse("6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1");
    model::Position b = model::fen::parse("r5k1/8/8/8/8/8/5PPP/6K1 b - - 0 1");
    for (int depth : {1, 2}) {
      auto mw = search.search_root(w, core::Color::White, depth);
      assert(mw && mw->from == sq('a', 1) && mw->to == sq('a', 8));
      assert(search.getStats().bestScore == engine::MATE);
      auto mb = search.search_root(b, core::Color::Black, depth);
      assert(mb && mb->from == sq('a', 8) && mb->to == sq('a', 1));
      assert(search.getStats().bestScore == -engine::MATE);
    }
    // the caller's position is left alone
    assert(model::fen::serialize(w) == "6k1/5ppp/8/8/8/8/8/R5K1 w - - 0 1");
  }

  // Hanging queen gets taken
  {
    engine::Search search(eval);
    model::Position pos = model::fen::parse("4k3/8/8/3q4/8/8/8/3RK3 w - - 0 1");
    auto m = search.search_root(pos, core::Color::White, 2);
    assert(m && m->from == sq('d', 1) && m->to == sq('d', 5));
    assert(search.getStats().nodes > 0);
    assert(!search.getStats().topMoves.empty());
    assert(search.getStats().topMoves.front().first == *m);  // captures are searched first
  }

  // No legal move: nullopt, matching the rules engine
  {
    engine::BotEngine bot(engine::Difficulty::Hard, cfg);
    model::ChessGame game;
    game.setPosition("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
    assert(game.getStatus().isStalemate);
    assert(!bot.findBestMove(game).bestMove);

    game.setPosition("R5k1/5ppp/8/8/8/8/8/6K1 b - - 0 1");
    assert(game.getStatus().isCheckmate);
    assert(!bot.selectMove(game.getPosition(), core::Color::Black));
  }

  // Difficulty handling
  {
    engine::BotEngine bot(engine::Difficulty::Medium, cfg);
    assert(bot.getSearchDepth() == 3);
    assert(bot.setDifficulty("hard"));
    assert(bot.getDifficulty() == engine::Difficulty::Hard && bot.getSearchDepth() == 4);
    assert(!bot.setDifficulty("grandmaster"));
    assert(bot.getDifficulty() == engine::Difficulty::Hard);
    bot.setDifficulty(engine::Difficulty::Easy);
    assert(bot.getSearchDepth() == 2);
    assert(engine::toString(engine::Difficulty::Medium) == "medium");
    assert(!engine::difficultyFromString("Medium"));
  }

  // Determinism and purity
  {
    engine::BotEngine bot(engine::Difficulty::Medium, cfg);
    model::ChessGame game;
    for (const char* mv : {"e2e4", "e7e5", "g1f3"}) assert(game.doMoveUCI(mv));
    const std::string before = game.getFen();
    auto a = bot.findBestMove(game);
    auto b = bot.findBestMove(game);
    assert(a.bestMove && b.bestMove && *a.bestMove == *b.bestMove);
    assert(!a.randomMove);
    assert(a.stats.depth == 3);
    assert(game.getFen() == before);
    assert(game.getMove(a.bestMove->from, a.bestMove->to, a.bestMove->promotion));
  }

  // Easy tier random branch draws a legal move from the seeded generator
  {
    engine::EngineConfig always = cfg;
    always.easyRandomMoveChance = 1.0;
    engine::BotEngine first(engine::Difficulty::Easy, always);
    engine::BotEngine second(engine::Difficulty::Easy, always);
    model::ChessGame game;
    auto a = first.findBestMove(game);
    auto b = second.findBestMove(game);
    assert(a.randomMove && b.randomMove);
    assert(*a.bestMove == *b.bestMove);
    const auto legal = game.generateLegalMoves();
    assert(std::find(legal.begin(), legal.end(), *a.bestMove) != legal.end());

    // other tiers never roll
    engine::BotEngine medium(engine::Difficulty::Medium, always);
    assert(!medium.findBestMove(game).randomMove);
  }

  return 0;
}
