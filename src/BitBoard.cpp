#include "BitBoard.hpp"

void BitBoard::setBit(int col, int row) {
    // Check bounds
    if (col < 0 || col >= WIDTH || row < 0 || row >= HEIGHT) {
        return;
    }
    bits |= cellMask(col, row);
}

void BitBoard::clearBit(int col, int row) {
    if (col < 0 || col >= WIDTH || row < 0 || row >= HEIGHT) {
        return;
    }
    bits &= ~cellMask(col, row);
}

bool BitBoard::getBit(int col, int row) const {
    // Return false for out of bounds
    if (col < 0 || col >= WIDTH || row < 0 || row >= HEIGHT) {
        return false;
    }
    return (bits >> toIndex(col, row)) & 1;
}

bool BitBoard::hasFour() const {
    // Shift distances: 1 = vertical, COLUMN_BITS = horizontal,
    // COLUMN_BITS - 1 = diagonal "\", COLUMN_BITS + 1 = diagonal "/"
    static const int shifts[4] = {1, COLUMN_BITS, COLUMN_BITS - 1, COLUMN_BITS + 1};

    for (int shift : shifts) {
        uint64_t pairs = bits & (bits >> shift);
        if (pairs & (pairs >> (2 * shift))) {
            return true;
        }
    }
    return false;
}

BitBoard BitBoard::mirrored() const {
    uint64_t result = 0;
    for (int col = 0; col < WIDTH; col++) {
        uint64_t column = (bits >> (col * COLUMN_BITS)) & ((1ULL << COLUMN_BITS) - 1);
        result |= column << ((WIDTH - 1 - col) * COLUMN_BITS);
    }
    return BitBoard(result);
}
