#include "MoveGenerator.hpp"
#include "Connect4Game.hpp"

MoveGenerator::Iterator::Iterator(const Connect4Game* game, int slot)
    : game_(game), slot_(slot) {
    skipFull();
}

void MoveGenerator::Iterator::skipFull() {
    while (slot_ < NUM_COLUMNS && game_->isFull(ORDER[slot_])) {
        slot_++;
    }
}

MoveGenerator::Iterator& MoveGenerator::Iterator::operator++() {
    if (slot_ < NUM_COLUMNS) {
        slot_++;
        skipFull();
    }
    return *this;
}

MoveGenerator::Iterator MoveGenerator::Iterator::operator++(int) {
    Iterator previous = *this;
    ++(*this);
    return previous;
}

int MoveGenerator::count() const {
    int n = 0;
    for (auto it = begin(); it != end(); ++it) {
        n++;
    }
    return n;
}

std::vector<int> MoveGenerator::toVector() const {
    std::vector<int> moves;
    moves.reserve(NUM_COLUMNS);
    for (int col : *this) {
        moves.push_back(col);
    }
    return moves;
}
