#ifndef ALPHABETA_HPP
#define ALPHABETA_HPP

#include "Connect4Game.hpp"
#include "Evaluator.hpp"
#include "TranspositionTable.hpp"
#include <chrono>
#include <cstdint>
#include <vector>

// ============================================================================
// Depth-limited negamax with alpha-beta pruning and a transposition table
// ============================================================================

class AlphaBeta {
public:
    static constexpr int INF = Evaluator::WIN_SCORE + 1;
    static constexpr int MAX_DEPTH = Connect4Game::NUM_CELLS;

    // Configuration parameters
    struct Config {
        int maxDepth = 5;              // Search depth in plies, the strength knob
        size_t ttSize = TranspositionTable::DEFAULT_SIZE; // TT entries
        bool useTT = true;             // Enable transposition table
        bool usePruning = true;        // false = plain minimax, for verification
        int timeLimitMs = 0;           // > 0 enables iterative deepening under a budget
        Evaluator* evaluator = nullptr; // nullptr = built-in HeuristicEvaluator
        bool verbose = false;          // print stats after every search

        static Config easy() { return fromDifficulty(2); }
        static Config medium() { return fromDifficulty(5); }
        static Config hard() { return fromDifficulty(8); }
        static Config fromDifficulty(int depth) {
            Config config;
            config.maxDepth = depth;
            return config;
        }
    };

    struct SearchResult {
        int move = Connect4Game::NO_MOVE;  // NO_MOVE if the position is already decided
        int score = 0;                     // from the side to move's point of view
        int depth = 0;                     // deepest completed iteration
        uint64_t nodes = 0;
    };

    struct MoveScore {
        int move;
        int score;
    };

    AlphaBeta();
    explicit AlphaBeta(const Config& config);

    // Non-copyable: evaluator_ may point at defaultEvaluator_
    AlphaBeta(const AlphaBeta&) = delete;
    AlphaBeta& operator=(const AlphaBeta&) = delete;

    // Main search interface: searches a copy of game at config.maxDepth
    SearchResult search(const Connect4Game& game);

    // Search game in place at the given depth and window. The maximizing
    // player is the side to move; the board is restored before returning.
    SearchResult search(Connect4Game& game, int depth, int alpha, int beta);

    // Best column for the side to move; throws NoLegalMoveError if the game is over
    int bestMove(const Connect4Game& game);

    // Exact score of every legal move at the given depth, in move-generator order
    std::vector<MoveScore> rankMoves(const Connect4Game& game, int depth);

    // Statistics and debugging
    uint64_t getNodes() const { return nodes_; }
    uint64_t getCutoffs() const { return cutoffs_; }
    size_t getTTHits() const { return tt_.getHits(); }
    size_t getTTMisses() const { return tt_.getMisses(); }
    double getTTHitRate() const { return tt_.getHitRate(); }
    const TranspositionTable& getTT() const { return tt_; }
    void clearTT() { tt_.clear(); }
    void printStats() const;

    // Configuration
    void setConfig(const Config& config);
    const Config& getConfig() const { return config_; }

private:
    int negamax(Connect4Game& game, int depth, int alpha, int beta);
    SearchResult searchRoot(Connect4Game& game, int depth, int alpha, int beta);

    // Legal moves with the cached best move first. Returns the count.
    int orderMoves(const Connect4Game& game, int firstMove, int moves[Connect4Game::WIDTH]) const;

    void storeEntry(const Connect4Game& game, int depth, int score, int alpha, int beta, int bestMove);
    bool timeUp() const;

    // Member variables
    Config config_;
    HeuristicEvaluator defaultEvaluator_;
    Evaluator* evaluator_;
    TranspositionTable tt_;

    // Time budget
    bool deadlineActive_ = false;
    bool aborted_ = false;
    std::chrono::steady_clock::time_point deadline_;

    // Statistics
    uint64_t nodes_ = 0;
    uint64_t cutoffs_ = 0;
    int lastDepth_ = 0;
    double lastSearchTime_ = 0.0;
};

#endif // ALPHABETA_HPP
