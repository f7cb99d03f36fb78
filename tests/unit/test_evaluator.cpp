#include <gtest/gtest.h>
#include "Connect4Game.hpp"
#include "Evaluator.hpp"
#include "GameUtils.hpp"
#include <random>

namespace {

Connect4Game fromMoves(const char* moves) {
    Connect4Game game;
    GameUtils::playMoves(game, GameUtils::parseGameString(moves));
    return game;
}

} // namespace

class HeuristicEvaluatorTest : public ::testing::Test {
protected:
    HeuristicEvaluator evaluator;
};

TEST_F(HeuristicEvaluatorTest, WindowCount) {
    EXPECT_EQ(HeuristicEvaluator::windows().size(),
              static_cast<size_t>(HeuristicEvaluator::NUM_WINDOWS));
    for (uint64_t window : HeuristicEvaluator::windows()) {
        EXPECT_EQ(BitBoard::popcount(window), 4);
    }
}

TEST_F(HeuristicEvaluatorTest, EmptyBoardIsZero) {
    Connect4Game game;
    EXPECT_EQ(evaluator.evaluate(game, Connect4Game::RED), 0);
    EXPECT_EQ(evaluator.evaluate(game, Connect4Game::YELLOW), 0);
}

TEST_F(HeuristicEvaluatorTest, CenterStoneScore) {
    // D1 lies in 4 horizontal, 1 vertical and 2 diagonal windows
    Connect4Game game = fromMoves("D");
    EXPECT_EQ(evaluator.scoreWindows(game, Connect4Game::RED), 7);
    EXPECT_EQ(evaluator.centerScore(game, Connect4Game::RED), HeuristicEvaluator::CENTER_WEIGHT);
    EXPECT_EQ(evaluator.evaluate(game, Connect4Game::RED), 10);
    EXPECT_EQ(evaluator.evaluate(game, Connect4Game::YELLOW), -10);
}

TEST_F(HeuristicEvaluatorTest, CenterBeatsEdge) {
    Connect4Game center = fromMoves("D");
    Connect4Game edge = fromMoves("A");
    EXPECT_GT(evaluator.evaluate(center, Connect4Game::RED),
              evaluator.evaluate(edge, Connect4Game::RED));
}

TEST_F(HeuristicEvaluatorTest, BlockedWindowsScoreNothing) {
    // Stacked D1 red, D2 yellow: the vertical windows through both are mixed
    Connect4Game game = fromMoves("DD");
    Connect4Game redOnly = fromMoves("D");
    EXPECT_LT(evaluator.scoreWindows(game, Connect4Game::RED),
              evaluator.scoreWindows(redOnly, Connect4Game::RED));
}

TEST_F(HeuristicEvaluatorTest, TerminalScores) {
    Connect4Game redWins = fromMoves("ABABABA");
    int expected = Evaluator::WIN_SCORE - 7;
    EXPECT_EQ(evaluator.evaluate(redWins, Connect4Game::RED), expected);
    EXPECT_EQ(evaluator.evaluate(redWins, Connect4Game::YELLOW), -expected);
    EXPECT_TRUE(Evaluator::isWinScore(expected));
    EXPECT_TRUE(Evaluator::isLossScore(-expected));

    Connect4Game draw = fromMoves("CAFEGABGDGAEAGFABFEEFFECEDAFDBCCGDDCDCBBGB");
    EXPECT_EQ(evaluator.evaluate(draw, Connect4Game::RED), 0);
    EXPECT_EQ(evaluator.evaluate(draw, Connect4Game::YELLOW), 0);
}

TEST_F(HeuristicEvaluatorTest, FasterWinScoresHigher) {
    Connect4Game fast = fromMoves("ABABABA");
    Connect4Game slow = fromMoves("ABABCBCB");
    ASSERT_TRUE(fast.checkWin(Connect4Game::RED));
    ASSERT_TRUE(slow.checkWin(Connect4Game::YELLOW));
    EXPECT_GT(evaluator.evaluate(fast, Connect4Game::RED),
              evaluator.evaluate(slow, Connect4Game::YELLOW));
}

TEST_F(HeuristicEvaluatorTest, HeuristicBoundedBelowWinScore) {
    std::mt19937 rng(99);
    for (int g = 0; g < 50; ++g) {
        Connect4Game game;
        while (!game.isGameOver()) {
            int score = evaluator.evaluate(game, game.getCurrentPlayer());
            EXPECT_FALSE(Evaluator::isWinScore(score));
            EXPECT_FALSE(Evaluator::isLossScore(score));
            game.applyMove(game.getRandomLegalMove(rng));
        }
    }
}

TEST_F(HeuristicEvaluatorTest, ZeroSumSymmetry) {
    std::mt19937 rng(2024);
    for (int g = 0; g < 100; ++g) {
        Connect4Game game;
        while (true) {
            EXPECT_EQ(evaluator.evaluate(game, Connect4Game::RED),
                      -evaluator.evaluate(game, Connect4Game::YELLOW));
            if (game.isGameOver()) break;
            game.applyMove(game.getRandomLegalMove(rng));
        }
    }
}

TEST_F(HeuristicEvaluatorTest, MirrorSymmetry) {
    std::mt19937 rng(7);
    for (int g = 0; g < 50; ++g) {
        Connect4Game game;
        for (int i = 0; i < 12 && !game.isGameOver(); ++i) {
            game.applyMove(game.getRandomLegalMove(rng));
        }
        Connect4Game mirror = game.mirrored();
        EXPECT_EQ(evaluator.evaluate(game, Connect4Game::RED),
                  evaluator.evaluate(mirror, Connect4Game::RED));
    }
}
