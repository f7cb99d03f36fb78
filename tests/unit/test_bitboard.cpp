#include <gtest/gtest.h>
#include "BitBoard.hpp"

class BitBoardTest : public ::testing::Test {
protected:
    BitBoard board;
};

TEST_F(BitBoardTest, EmptyBoardTest) {
    for (int col = 0; col < BitBoard::WIDTH; ++col) {
        for (int row = 0; row < BitBoard::HEIGHT; ++row) {
            EXPECT_FALSE(board.getBit(col, row));
        }
    }
    EXPECT_TRUE(board.empty());
    EXPECT_EQ(board.count(), 0);
}

TEST_F(BitBoardTest, SetAndClearBit) {
    board.setBit(3, 2);
    EXPECT_TRUE(board.getBit(3, 2));
    EXPECT_EQ(board.count(), 1);
    EXPECT_EQ(board.raw(), 1ULL << (3 * BitBoard::COLUMN_BITS + 2));

    board.clearBit(3, 2);
    EXPECT_FALSE(board.getBit(3, 2));
    EXPECT_TRUE(board.empty());
}

TEST_F(BitBoardTest, OutOfBoundsIgnored) {
    board.setBit(-1, 0);
    board.setBit(7, 0);
    board.setBit(0, 6);  // sentinel row
    EXPECT_TRUE(board.empty());
    EXPECT_FALSE(board.getBit(0, 6));
    EXPECT_FALSE(board.getBit(9, 9));
}

TEST_F(BitBoardTest, VerticalFour) {
    for (int row = 0; row < 3; ++row) board.setBit(2, row);
    EXPECT_FALSE(board.hasFour());
    board.setBit(2, 3);
    EXPECT_TRUE(board.hasFour());
}

TEST_F(BitBoardTest, HorizontalFour) {
    board.setBit(3, 4);
    board.setBit(4, 4);
    board.setBit(5, 4);
    EXPECT_FALSE(board.hasFour());
    board.setBit(6, 4);
    EXPECT_TRUE(board.hasFour());
}

TEST_F(BitBoardTest, DiagonalFours) {
    // "/" rising to the right
    BitBoard rising;
    rising.setBit(0, 0);
    rising.setBit(1, 1);
    rising.setBit(2, 2);
    rising.setBit(3, 3);
    EXPECT_TRUE(rising.hasFour());

    // "\" falling to the right
    BitBoard falling;
    falling.setBit(3, 5);
    falling.setBit(4, 4);
    falling.setBit(5, 3);
    falling.setBit(6, 2);
    EXPECT_TRUE(falling.hasFour());
}

TEST_F(BitBoardTest, NoWrapBetweenColumns) {
    // Top three of column A plus bottom of column B are adjacent bit indices
    // apart from the sentinel, and must not count as a vertical four
    board.setBit(0, 3);
    board.setBit(0, 4);
    board.setBit(0, 5);
    board.setBit(1, 0);
    EXPECT_FALSE(board.hasFour());

    // Falling diagonal that would continue across the bottom edge
    BitBoard diag;
    diag.setBit(0, 2);
    diag.setBit(1, 1);
    diag.setBit(2, 0);
    diag.setBit(3, 5);
    EXPECT_FALSE(diag.hasFour());
}

TEST_F(BitBoardTest, Mirrored) {
    board.setBit(0, 0);
    board.setBit(1, 3);
    board.setBit(3, 5);

    BitBoard mirror = board.mirrored();
    EXPECT_TRUE(mirror.getBit(6, 0));
    EXPECT_TRUE(mirror.getBit(5, 3));
    EXPECT_TRUE(mirror.getBit(3, 5));
    EXPECT_EQ(mirror.count(), 3);
    EXPECT_EQ(mirror.mirrored(), board);
}

TEST_F(BitBoardTest, MaskHelpers) {
    EXPECT_EQ(BitBoard::bottomMask(2), BitBoard::cellMask(2, 0));
    EXPECT_EQ(BitBoard::popcount(BitBoard::columnMask(4)), BitBoard::HEIGHT);
    EXPECT_EQ(BitBoard::columnMask(4) & BitBoard::cellMask(4, 6), 0ULL);
}

TEST_F(BitBoardTest, Popcount) {
    EXPECT_EQ(BitBoard::popcount(0), 0);
    EXPECT_EQ(BitBoard::popcount(~0ULL), 64);
    EXPECT_EQ(BitBoard::popcount(BitBoard::cellMask(0, 0) | BitBoard::cellMask(6, 5)), 2);
}
