#ifndef TRANSPOSITION_TABLE_HPP
#define TRANSPOSITION_TABLE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// Fixed-size position cache for the alpha-beta search.
// Keys are canonical position keys (see Connect4Game::getCanonicalKey); a key
// of 0 never occurs for a real position, so age 0 marks an empty slot.
class TranspositionTable {
  public:
    enum EntryType : uint8_t { EXACT = 0, LOWER_BOUND = 1, UPPER_BOUND = 2 };

    struct Entry {
        uint64_t key = 0;
        int32_t score = 0;
        EntryType type = EXACT;
        uint8_t depth = 0;
        int8_t bestMove = -1;
        uint16_t age = 0;
    };

    static constexpr size_t DEFAULT_SIZE = 1 << 20; // ~1M entries (~24 MB)

    explicit TranspositionTable(size_t sizeInEntries = DEFAULT_SIZE)
        : generation_(1), hits_(0), misses_(0), stores_(0) {
        // Round up to power of two
        size_t sz = 1;
        while (sz < sizeInEntries)
            sz <<= 1;
        table_.resize(sz);
        mask_ = sz - 1;
        shift_ = 64;
        while (sz > 1) {
            sz >>= 1;
            --shift_;
        }
    }

    // Entry stored under key, or nullptr on miss
    const Entry *get(uint64_t key) const {
        const Entry &e = table_[indexOf(key)];
        if (e.age != 0 && e.key == key) {
            ++hits_;
            return &e;
        }
        ++misses_;
        return nullptr;
    }

    // Like get(), but an entry searched shallower than minDepth is a miss
    const Entry *probe(uint64_t key, int minDepth) const {
        const Entry *e = get(key);
        if (e && e->depth < minDepth) {
            --hits_;
            ++misses_;
            return nullptr;
        }
        return e;
    }

    void put(uint64_t key, const Entry &entry) {
        Entry &e = table_[indexOf(key)];
        // Replace if: empty, same key, older generation, or not deeper
        if (e.age == 0 || e.key == key || e.age < generation_ || e.depth <= entry.depth) {
            e = entry;
            e.key = key;
            e.age = generation_;
            ++stores_;
        }
    }

    void store(uint64_t key, int score, EntryType type, int depth, int bestMove) {
        Entry entry;
        entry.score = score;
        entry.type = type;
        entry.depth = static_cast<uint8_t>(depth);
        entry.bestMove = static_cast<int8_t>(bestMove);
        put(key, entry);
    }

    void newGeneration() {
        if (generation_ == UINT16_MAX) {
            clear();
            return;
        }
        ++generation_;
    }

    void clear() {
        generation_ = 1;
        for (auto &e : table_) {
            e = Entry{};
        }
        hits_ = 0;
        misses_ = 0;
        stores_ = 0;
    }

    // Statistics
    size_t getHits() const { return hits_; }
    size_t getMisses() const { return misses_; }
    size_t getStores() const { return stores_; }
    size_t getSize() const { return table_.size(); }
    double getHitRate() const {
        size_t total = hits_ + misses_;
        return total > 0 ? static_cast<double>(hits_) / total : 0.0;
    }
    size_t getMemoryUsage() const { return table_.size() * sizeof(Entry); }

  private:
    // Fibonacci hashing spreads the structured position keys over the slots
    size_t indexOf(uint64_t key) const {
        if (shift_ >= 64)
            return 0;
        return static_cast<size_t>((key * 0x9E3779B97F4A7C15ULL) >> shift_) & mask_;
    }

    std::vector<Entry> table_;
    size_t mask_;
    int shift_;
    uint16_t generation_;

    mutable size_t hits_;
    mutable size_t misses_;
    size_t stores_;
};

#endif // TRANSPOSITION_TABLE_HPP
