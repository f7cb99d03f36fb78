#ifndef CONNECT4GAME_HPP
#define CONNECT4GAME_HPP

#include "BitBoard.hpp"
#include "MoveGenerator.hpp"
#include <array>
#include <cstdint>
#include <random>
#include <vector>

class Connect4Game {
public:
    static constexpr int WIDTH = BitBoard::WIDTH;
    static constexpr int HEIGHT = BitBoard::HEIGHT;
    static constexpr int NUM_CELLS = WIDTH * HEIGHT;
    static constexpr int NO_MOVE = -1;

    enum Player {
        NONE = 0,
        RED = 1,     // moves first
        YELLOW = 2
    };

    static Player opponent(Player p) { return p == RED ? YELLOW : RED; }

private:
    BitBoard redStones;
    BitBoard yellowStones;
    std::array<int, WIDTH> heights;
    int moveCount;

    // Columns in the order they were played, for undo
    std::vector<int> moveHistory;

    uint64_t encodeKey(const BitBoard& red, const BitBoard& mask) const;

public:
    Connect4Game();

    // Core game functions
    void reset();
    void applyMove(int column);       // throws InvalidColumnError / ColumnFullError
    void undoMove(int column);        // throws InvalidUndoError
    void undoMove();                  // undo last move, throws InvalidUndoError

    // Game state queries
    Player getCurrentPlayer() const { return (moveCount % 2 == 0) ? RED : YELLOW; }
    bool checkWin(Player player) const;
    bool isDraw() const;
    bool isFull(int column) const;    // true for a column off the board
    bool isGameOver() const;
    Player getWinner() const;
    bool isLegalMove(int column) const;
    MoveGenerator legalMoves() const { return MoveGenerator(*this); }
    int getRandomLegalMove(std::mt19937& rng) const;

    // State access
    int getMoveCount() const { return moveCount; }
    int getHeight(int column) const;  // throws InvalidColumnError
    Player getStoneAt(int column, int row) const;
    const BitBoard& getStones(Player player) const {
        return player == RED ? redStones : yellowStones;
    }
    int getLastMove() const {
        return moveHistory.empty() ? NO_MOVE : moveHistory.back();
    }
    const std::vector<int>& getHistory() const { return moveHistory; }
    bool canUndo() const { return !moveHistory.empty(); }

    // Position keys. getKey() is an exact encoding (distinct positions never
    // share a key); the canonical key is the smaller of a position's key and
    // the key of its left-right mirror.
    uint64_t getKey() const;
    uint64_t getMirrorKey() const;
    uint64_t getCanonicalKey() const;
    bool isMirrorCanonical() const { return getMirrorKey() < getKey(); }
    static int mirrorColumn(int column) { return WIDTH - 1 - column; }

    // Same stones with columns reflected. History is reflected too.
    Connect4Game mirrored() const;

    bool operator==(const Connect4Game& other) const;
    bool operator!=(const Connect4Game& other) const { return !(*this == other); }

    // Debug
    void print() const;
};

#endif // CONNECT4GAME_HPP
