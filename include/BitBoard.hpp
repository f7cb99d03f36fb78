#ifndef BITBOARD_HPP
#define BITBOARD_HPP

#include <bitset>
#include <cstdint>

// One player's stones on a 7x6 board, column-major.
// Bit index of (col, row) is col * COLUMN_BITS + row. Row 6 of each column is
// a sentinel that always stays 0, so shifts never carry into the next column.
class BitBoard {
public:
    static constexpr int WIDTH = 7;
    static constexpr int HEIGHT = 6;
    static constexpr int COLUMN_BITS = HEIGHT + 1;

private:
    uint64_t bits;

    static int toIndex(int col, int row) {
        return col * COLUMN_BITS + row;
    }

public:
    BitBoard() : bits(0) {}
    explicit BitBoard(uint64_t raw) : bits(raw) {}

    // Core operations
    void setBit(int col, int row);
    void clearBit(int col, int row);
    bool getBit(int col, int row) const;
    void clear() { bits = 0; }

    uint64_t raw() const { return bits; }
    int count() const { return popcount(bits); }
    bool empty() const { return bits == 0; }

    // True if four set bits line up vertically, horizontally or diagonally
    bool hasFour() const;

    // Column c swapped with column WIDTH - 1 - c
    BitBoard mirrored() const;

    static int popcount(uint64_t mask) {
        return static_cast<int>(std::bitset<64>(mask).count());
    }

    static uint64_t columnMask(int col) {
        return ((1ULL << HEIGHT) - 1) << (col * COLUMN_BITS);
    }
    static uint64_t bottomMask(int col) {
        return 1ULL << (col * COLUMN_BITS);
    }
    static uint64_t cellMask(int col, int row) {
        return 1ULL << toIndex(col, row);
    }

    BitBoard operator|(const BitBoard& other) const { return BitBoard(bits | other.bits); }
    BitBoard operator&(const BitBoard& other) const { return BitBoard(bits & other.bits); }
    bool operator==(const BitBoard& other) const { return bits == other.bits; }
    bool operator!=(const BitBoard& other) const { return bits != other.bits; }
};

#endif // BITBOARD_HPP
