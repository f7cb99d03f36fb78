#include "AlphaBeta.hpp"
#include "Errors.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void validateDepth(int depth) {
    if (depth < 1 || depth > AlphaBeta::MAX_DEPTH) {
        throw std::invalid_argument("search depth must be in [1, " +
                                    std::to_string(AlphaBeta::MAX_DEPTH) + "], got " +
                                    std::to_string(depth));
    }
}

// Nodes between clock reads when a time budget is set
constexpr uint64_t TIME_CHECK_INTERVAL = 1024;

} // namespace

AlphaBeta::AlphaBeta() : AlphaBeta(Config()) {}

AlphaBeta::AlphaBeta(const Config& config)
    : config_(config)
    , evaluator_(config.evaluator ? config.evaluator : &defaultEvaluator_)
    , tt_(config.useTT ? config.ttSize : 1) {
    validateDepth(config.maxDepth);
}

void AlphaBeta::setConfig(const Config& config) {
    validateDepth(config.maxDepth);
    bool resize = config.useTT && (!config_.useTT || config.ttSize != config_.ttSize);
    config_ = config;
    evaluator_ = config.evaluator ? config.evaluator : &defaultEvaluator_;
    if (resize) {
        tt_ = TranspositionTable(config.ttSize);
    }
}

// ============================================================================
// Public search entry points
// ============================================================================

AlphaBeta::SearchResult AlphaBeta::search(const Connect4Game& game) {
    PROFILE_SCOPE("AlphaBeta::search");
    auto start = std::chrono::steady_clock::now();

    Connect4Game board = game;
    nodes_ = 0;
    cutoffs_ = 0;
    aborted_ = false;
    deadlineActive_ = false;
    tt_.newGeneration();

    SearchResult result;
    if (config_.timeLimitMs > 0) {
        deadline_ = start + std::chrono::milliseconds(config_.timeLimitMs);
        for (int depth = 1; depth <= config_.maxDepth; depth++) {
            // Depth 1 always completes so there is a move to return
            deadlineActive_ = depth > 1;
            SearchResult iteration = searchRoot(board, depth, -INF, INF);
            if (aborted_) {
                break;
            }
            result = iteration;
            if (result.move == Connect4Game::NO_MOVE ||
                Evaluator::isWinScore(result.score) || Evaluator::isLossScore(result.score)) {
                break;
            }
        }
        deadlineActive_ = false;
        aborted_ = false;
    } else {
        result = searchRoot(board, config_.maxDepth, -INF, INF);
    }
    result.nodes = nodes_;

    lastDepth_ = result.depth;
    lastSearchTime_ = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (config_.verbose) {
        printStats();
    }
    return result;
}

AlphaBeta::SearchResult AlphaBeta::search(Connect4Game& game, int depth, int alpha, int beta) {
    validateDepth(depth);
    nodes_ = 0;
    cutoffs_ = 0;
    aborted_ = false;
    deadlineActive_ = false;
    SearchResult result = searchRoot(game, depth, alpha, beta);
    result.nodes = nodes_;
    return result;
}

int AlphaBeta::bestMove(const Connect4Game& game) {
    if (game.isGameOver()) {
        throw NoLegalMoveError();
    }
    SearchResult result = search(game);
    if (result.move == Connect4Game::NO_MOVE) {
        throw NoLegalMoveError();
    }
    return result.move;
}

std::vector<AlphaBeta::MoveScore> AlphaBeta::rankMoves(const Connect4Game& game, int depth) {
    validateDepth(depth);
    aborted_ = false;
    deadlineActive_ = false;

    std::vector<MoveScore> ranked;
    if (game.isGameOver()) {
        return ranked;
    }

    Connect4Game board = game;
    for (int col : game.legalMoves()) {
        board.applyMove(col);
        int score = -negamax(board, depth - 1, -INF, INF);
        board.undoMove(col);
        ranked.push_back({col, score});
    }
    return ranked;
}

// ============================================================================
// Search internals
// ============================================================================

AlphaBeta::SearchResult AlphaBeta::searchRoot(Connect4Game& game, int depth, int alpha, int beta) {
    SearchResult result;

    // Decided positions have no move to make
    int terminal = 0;
    if (Evaluator::terminalValue(game, game.getCurrentPlayer(), terminal)) {
        result.score = terminal;
        return result;
    }

    int cachedMove = Connect4Game::NO_MOVE;
    if (config_.useTT) {
        const TranspositionTable::Entry* entry = tt_.get(game.getCanonicalKey());
        if (entry && entry->bestMove != Connect4Game::NO_MOVE) {
            cachedMove = game.isMirrorCanonical() ? Connect4Game::mirrorColumn(entry->bestMove)
                                                  : entry->bestMove;
        }
    }

    int moves[Connect4Game::WIDTH];
    int count = orderMoves(game, cachedMove, moves);

    int alphaOrig = alpha;
    int best = -INF;
    int bestMove = Connect4Game::NO_MOVE;
    for (int i = 0; i < count; i++) {
        int col = moves[i];
        game.applyMove(col);
        int score = config_.usePruning ? -negamax(game, depth - 1, -beta, -alpha)
                                       : -negamax(game, depth - 1, -INF, INF);
        game.undoMove(col);
        if (aborted_) {
            return result;
        }

        if (score > best) {
            best = score;
            bestMove = col;
        }
        if (config_.usePruning) {
            alpha = std::max(alpha, best);
            if (alpha >= beta) {
                cutoffs_++;
                break;
            }
        }
    }

    storeEntry(game, depth, best, alphaOrig, beta, bestMove);

    result.move = bestMove;
    result.score = best;
    result.depth = depth;
    return result;
}

int AlphaBeta::negamax(Connect4Game& game, int depth, int alpha, int beta) {
    nodes_++;
    if (deadlineActive_ && (nodes_ % TIME_CHECK_INTERVAL) == 0 && timeUp()) {
        aborted_ = true;
    }
    if (aborted_) {
        return 0;
    }

    Connect4Game::Player toMove = game.getCurrentPlayer();

    // Terminal check first: decided positions get their exact score
    int score = 0;
    if (Evaluator::terminalValue(game, toMove, score)) {
        return score;
    }

    if (depth == 0) {
        return evaluator_->evaluate(game, toMove);
    }

    int cachedMove = Connect4Game::NO_MOVE;
    if (config_.useTT) {
        const TranspositionTable::Entry* entry = tt_.get(game.getCanonicalKey());
        if (entry) {
            if (entry->bestMove != Connect4Game::NO_MOVE) {
                cachedMove = game.isMirrorCanonical() ? Connect4Game::mirrorColumn(entry->bestMove)
                                                      : entry->bestMove;
            }
            if (entry->depth >= depth) {
                if (entry->type == TranspositionTable::EXACT) {
                    return entry->score;
                }
                if (config_.usePruning) {
                    if (entry->type == TranspositionTable::LOWER_BOUND && entry->score >= beta) {
                        return entry->score;
                    }
                    if (entry->type == TranspositionTable::UPPER_BOUND && entry->score <= alpha) {
                        return entry->score;
                    }
                }
            }
        }
    }

    int moves[Connect4Game::WIDTH];
    int count = orderMoves(game, cachedMove, moves);

    int alphaOrig = alpha;
    int best = -INF;
    int bestMove = Connect4Game::NO_MOVE;
    for (int i = 0; i < count; i++) {
        int col = moves[i];
        game.applyMove(col);
        int childScore = config_.usePruning ? -negamax(game, depth - 1, -beta, -alpha)
                                            : -negamax(game, depth - 1, -INF, INF);
        game.undoMove(col);
        if (aborted_) {
            return 0;
        }

        if (childScore > best) {
            best = childScore;
            bestMove = col;
        }
        if (config_.usePruning) {
            alpha = std::max(alpha, best);
            if (alpha >= beta) {
                cutoffs_++;
                break;
            }
        }
    }

    storeEntry(game, depth, best, alphaOrig, beta, bestMove);
    return best;
}

int AlphaBeta::orderMoves(const Connect4Game& game, int firstMove, int moves[Connect4Game::WIDTH]) const {
    int count = 0;
    bool hasFirst = firstMove != Connect4Game::NO_MOVE && !game.isFull(firstMove);
    if (hasFirst) {
        moves[count++] = firstMove;
    }
    for (int col : game.legalMoves()) {
        if (hasFirst && col == firstMove) {
            continue;
        }
        moves[count++] = col;
    }
    return count;
}

void AlphaBeta::storeEntry(const Connect4Game& game, int depth, int score, int alpha, int beta, int bestMove) {
    if (!config_.useTT) {
        return;
    }

    TranspositionTable::EntryType type = TranspositionTable::EXACT;
    if (config_.usePruning) {
        if (score <= alpha) {
            type = TranspositionTable::UPPER_BOUND;
        } else if (score >= beta) {
            type = TranspositionTable::LOWER_BOUND;
        }
    }

    // Best move is kept in the orientation of the canonical key
    if (bestMove != Connect4Game::NO_MOVE && game.isMirrorCanonical()) {
        bestMove = Connect4Game::mirrorColumn(bestMove);
    }
    tt_.store(game.getCanonicalKey(), score, type, depth, bestMove);
}

bool AlphaBeta::timeUp() const {
    return std::chrono::steady_clock::now() >= deadline_;
}

void AlphaBeta::printStats() const {
    std::cout << "\n=== AlphaBeta Statistics ===\n";
    std::cout << "Depth reached: " << lastDepth_ << " / " << config_.maxDepth << "\n";
    std::cout << "Nodes searched: " << GameUtils::formatWithCommas(nodes_) << "\n";
    std::cout << "Cutoffs: " << GameUtils::formatWithCommas(cutoffs_) << "\n";
    std::cout << "Search time: " << std::fixed << std::setprecision(3) << lastSearchTime_ << "s\n";
    if (lastSearchTime_ > 0.0) {
        std::cout << "Nodes/second: " << std::fixed << std::setprecision(0)
                  << (nodes_ / lastSearchTime_) << "\n";
    }
    if (config_.useTT) {
        std::cout << "TT hit rate: " << std::fixed << std::setprecision(1)
                  << (tt_.getHitRate() * 100.0) << "% ("
                  << GameUtils::formatWithCommas(tt_.getHits()) << " hits, "
                  << GameUtils::formatWithCommas(tt_.getStores()) << " stores, "
                  << (tt_.getMemoryUsage() / (1024 * 1024)) << " MB)\n";
    }
    std::cout << "============================\n\n";
}
