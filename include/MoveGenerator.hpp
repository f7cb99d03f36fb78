#ifndef MOVE_GENERATOR_HPP
#define MOVE_GENERATOR_HPP

#include <array>
#include <cstddef>
#include <iterator>
#include <vector>

class Connect4Game;

// Lazy range over the legal columns of a board, center column first.
// Full columns are skipped while iterating, so the range reflects the board at
// the time each step is taken. begin() can be called again to restart.
class MoveGenerator {
public:
    static constexpr int NUM_COLUMNS = 7;
    static constexpr std::array<int, NUM_COLUMNS> ORDER = {3, 2, 4, 1, 5, 0, 6};

    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = int;
        using difference_type = std::ptrdiff_t;
        using pointer = const int*;
        using reference = int;

        Iterator() : game_(nullptr), slot_(NUM_COLUMNS) {}
        Iterator(const Connect4Game* game, int slot);

        int operator*() const { return ORDER[slot_]; }
        Iterator& operator++();
        Iterator operator++(int);
        bool operator==(const Iterator& other) const { return slot_ == other.slot_; }
        bool operator!=(const Iterator& other) const { return slot_ != other.slot_; }

    private:
        void skipFull();

        const Connect4Game* game_;
        int slot_;  // index into ORDER, NUM_COLUMNS means end
    };

    explicit MoveGenerator(const Connect4Game& game) : game_(&game) {}

    Iterator begin() const { return Iterator(game_, 0); }
    Iterator end() const { return Iterator(game_, NUM_COLUMNS); }

    bool empty() const { return begin() == end(); }
    int count() const;
    std::vector<int> toVector() const;

private:
    const Connect4Game* game_;
};

#endif // MOVE_GENERATOR_HPP
