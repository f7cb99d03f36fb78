#include "Connect4Game.hpp"
#include "Errors.hpp"
#include "GameUtils.hpp"
#include <string>

Connect4Game::Connect4Game() {
    reset();
}

void Connect4Game::reset() {
    redStones.clear();
    yellowStones.clear();
    heights.fill(0);
    moveCount = 0;
    moveHistory.clear();
    moveHistory.reserve(NUM_CELLS); // Pre-allocate for performance
}

void Connect4Game::applyMove(int column) {
    if (column < 0 || column >= WIDTH) {
        throw InvalidColumnError(column);
    }
    if (heights[column] >= HEIGHT) {
        throw ColumnFullError(column);
    }

    // Place stone in the lowest empty row
    if (getCurrentPlayer() == RED) {
        redStones.setBit(column, heights[column]);
    } else {
        yellowStones.setBit(column, heights[column]);
    }
    heights[column]++;

    moveHistory.push_back(column);
    moveCount++;
}

void Connect4Game::undoMove(int column) {
    if (column < 0 || column >= WIDTH) {
        throw InvalidColumnError(column);
    }
    if (heights[column] == 0) {
        throw InvalidUndoError("no move was applied to column " + std::to_string(column));
    }
    if (moveHistory.empty() || moveHistory.back() != column) {
        throw InvalidUndoError("column " + std::to_string(column) + " is not the most recent move");
    }

    moveHistory.pop_back();
    moveCount--;
    heights[column]--;

    // The player who made the move is the one to move again after undo
    if (getCurrentPlayer() == RED) {
        redStones.clearBit(column, heights[column]);
    } else {
        yellowStones.clearBit(column, heights[column]);
    }
}

void Connect4Game::undoMove() {
    if (moveHistory.empty()) {
        throw InvalidUndoError("no move to undo");
    }
    undoMove(moveHistory.back());
}

bool Connect4Game::checkWin(Player player) const {
    if (player == RED) {
        return redStones.hasFour();
    }
    if (player == YELLOW) {
        return yellowStones.hasFour();
    }
    return false;
}

bool Connect4Game::isDraw() const {
    return moveCount == NUM_CELLS && !checkWin(RED) && !checkWin(YELLOW);
}

bool Connect4Game::isFull(int column) const {
    if (column < 0 || column >= WIDTH) {
        return true;
    }
    return heights[column] >= HEIGHT;
}

bool Connect4Game::isGameOver() const {
    return moveCount == NUM_CELLS || checkWin(RED) || checkWin(YELLOW);
}

Connect4Game::Player Connect4Game::getWinner() const {
    if (checkWin(RED)) return RED;
    if (checkWin(YELLOW)) return YELLOW;
    return NONE;
}

bool Connect4Game::isLegalMove(int column) const {
    return column >= 0 && column < WIDTH && !isFull(column) && !isGameOver();
}

int Connect4Game::getRandomLegalMove(std::mt19937& rng) const {
    std::vector<int> moves = legalMoves().toVector();
    if (moves.empty()) {
        return NO_MOVE;
    }
    std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
    return moves[dist(rng)];
}

int Connect4Game::getHeight(int column) const {
    if (column < 0 || column >= WIDTH) {
        throw InvalidColumnError(column);
    }
    return heights[column];
}

Connect4Game::Player Connect4Game::getStoneAt(int column, int row) const {
    if (redStones.getBit(column, row)) return RED;
    if (yellowStones.getBit(column, row)) return YELLOW;
    return NONE;
}

// mask + bottom carries each column's filled bits into a single marker bit
// one above the top stone; adding the red stones below it never carries.
uint64_t Connect4Game::encodeKey(const BitBoard& red, const BitBoard& mask) const {
    uint64_t bottom = 0;
    for (int col = 0; col < WIDTH; col++) {
        bottom |= BitBoard::bottomMask(col);
    }
    return mask.raw() + bottom + red.raw();
}

uint64_t Connect4Game::getKey() const {
    return encodeKey(redStones, redStones | yellowStones);
}

uint64_t Connect4Game::getMirrorKey() const {
    return encodeKey(redStones.mirrored(), (redStones | yellowStones).mirrored());
}

uint64_t Connect4Game::getCanonicalKey() const {
    uint64_t key = getKey();
    uint64_t mirrorKey = getMirrorKey();
    return mirrorKey < key ? mirrorKey : key;
}

Connect4Game Connect4Game::mirrored() const {
    Connect4Game result;
    for (int column : moveHistory) {
        result.applyMove(mirrorColumn(column));
    }
    return result;
}

bool Connect4Game::operator==(const Connect4Game& other) const {
    return redStones == other.redStones
        && yellowStones == other.yellowStones
        && heights == other.heights
        && moveCount == other.moveCount
        && moveHistory == other.moveHistory;
}

void Connect4Game::print() const {
    GameUtils::printBoard(*this, getLastMove());
}
