#include <gtest/gtest.h>
#include "Connect4Game.hpp"
#include "MoveGenerator.hpp"
#include <vector>

TEST(MoveGeneratorTest, EmptyBoardCenterOut) {
    Connect4Game game;
    std::vector<int> expected = {3, 2, 4, 1, 5, 0, 6};
    EXPECT_EQ(game.legalMoves().toVector(), expected);
    EXPECT_EQ(game.legalMoves().count(), 7);
    EXPECT_FALSE(game.legalMoves().empty());
}

TEST(MoveGeneratorTest, SkipsFullColumns) {
    Connect4Game game;
    for (int i = 0; i < Connect4Game::HEIGHT; ++i) game.applyMove(3);
    for (int i = 0; i < Connect4Game::HEIGHT; ++i) game.applyMove(0);

    std::vector<int> expected = {2, 4, 1, 5, 6};
    EXPECT_EQ(game.legalMoves().toVector(), expected);
    for (int col : game.legalMoves()) {
        EXPECT_FALSE(game.isFull(col));
    }
}

TEST(MoveGeneratorTest, Restartable) {
    Connect4Game game;
    game.applyMove(3);
    MoveGenerator moves = game.legalMoves();

    std::vector<int> first(moves.begin(), moves.end());
    std::vector<int> second(moves.begin(), moves.end());
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), 7u);
}

TEST(MoveGeneratorTest, LazyAgainstCurrentBoard) {
    Connect4Game game;
    for (int i = 0; i < Connect4Game::HEIGHT - 1; ++i) game.applyMove(2);

    MoveGenerator moves = game.legalMoves();
    auto it = moves.begin();
    EXPECT_EQ(*it, 3);

    // Column 2 fills up before the iterator reaches it
    game.applyMove(2);
    ++it;
    EXPECT_EQ(*it, 4);
}

TEST(MoveGeneratorTest, FullBoardIsEmpty) {
    Connect4Game game;
    for (int col = 0; col < Connect4Game::WIDTH; ++col) {
        for (int row = 0; row < Connect4Game::HEIGHT; ++row) {
            game.applyMove(col);
        }
    }
    EXPECT_TRUE(game.legalMoves().empty());
    EXPECT_EQ(game.legalMoves().count(), 0);
    EXPECT_TRUE(game.legalMoves().begin() == game.legalMoves().end());
}
