#include <gtest/gtest.h>
#include "Connect4Game.hpp"
#include "GameUtils.hpp"
#include "Match.hpp"
#include <iostream>

class CompleteGamesTest : public ::testing::Test {
protected:
    static Match::Config engineVsRandom(int depth, int games) {
        Match::Config config;
        config.player1.name = "AlphaBeta";
        config.player1.depth = depth;
        config.player2.name = "Random";
        config.player2.random = true;
        config.numGames = games;
        config.reportProgress = false;
        config.seed = 42;
        return config;
    }

    // Replays a record from scratch and checks it ends where the record says
    static void expectReplayable(const Match::GameRecord& record) {
        Connect4Game game;
        for (int column : record.moves) {
            ASSERT_FALSE(game.isGameOver());
            ASSERT_FALSE(game.isFull(column));
            game.applyMove(column);
        }
        ASSERT_TRUE(game.isGameOver());

        Connect4Game::Player player1Color = record.player1First ? Connect4Game::RED : Connect4Game::YELLOW;
        switch (record.outcome) {
        case Match::Outcome::PLAYER1_WIN:
            EXPECT_EQ(game.getWinner(), player1Color);
            break;
        case Match::Outcome::PLAYER2_WIN:
            EXPECT_EQ(game.getWinner(), Connect4Game::opponent(player1Color));
            break;
        case Match::Outcome::DRAW:
            EXPECT_TRUE(game.isDraw());
            break;
        }
    }
};

TEST_F(CompleteGamesTest, SingleGameEachColor) {
    Match match(engineVsRandom(3, 1));

    for (bool player1First : {true, false}) {
        Match::GameRecord record = match.playGame(player1First);
        EXPECT_EQ(record.player1First, player1First);
        EXPECT_GE(record.moves.size(), 7u);
        EXPECT_LE(record.moves.size(), static_cast<size_t>(Connect4Game::NUM_CELLS));
        EXPECT_GE(record.seconds, 0.0);
        expectReplayable(record);
    }
}

TEST_F(CompleteGamesTest, MatchAccountsForEveryGame) {
    Match match(engineVsRandom(3, 3));
    Match::MatchStats stats = match.run();

    EXPECT_EQ(stats.games(), 3);
    EXPECT_EQ(stats.wins + stats.losses + stats.draws, 3);
    EXPECT_GE(stats.winRatio(), 0.0);
    EXPECT_LE(stats.winRatio(), 1.0);
    EXPECT_GE(stats.totalSeconds, 0.0);
    match.printSummary(stats);
}

TEST_F(CompleteGamesTest, EngineVersusEngine) {
    Match::Config config;
    config.player1.name = "Depth4";
    config.player1.depth = 4;
    config.player2.name = "Depth2";
    config.player2.depth = 2;
    config.numGames = 2;
    config.reportProgress = false;
    config.seed = 7;
    Match match(config);

    Match::GameRecord first = match.playGame(true);
    Match::GameRecord second = match.playGame(true);
    expectReplayable(first);

    // Both engines are deterministic, so the game repeats move for move
    EXPECT_EQ(first.moves, second.moves);
    EXPECT_EQ(first.outcome, second.outcome);

    std::cout << "Depth 4 vs depth 2: " << first.moves.size() << " moves, "
              << (first.outcome == Match::Outcome::PLAYER1_WIN ? "depth 4 wins"
                  : first.outcome == Match::Outcome::PLAYER2_WIN ? "depth 2 wins" : "draw")
              << std::endl;
}

TEST_F(CompleteGamesTest, TimeLimitedPlayersFinish) {
    Match::Config config = engineVsRandom(12, 1);
    config.player1.timeLimitMs = 20;
    Match match(config);

    Match::GameRecord record = match.playGame(false);
    expectReplayable(record);
}
