#include "Evaluator.hpp"
#include "Profiler.hpp"

// ============================================================================
// Base Evaluator - terminal scoring
// ============================================================================
bool Evaluator::terminalValue(const Connect4Game& game, Connect4Game::Player perspective, int& score) {
    Connect4Game::Player winner = game.getWinner();
    if (winner != Connect4Game::NONE) {
        score = (winner == perspective) ? terminalScore(game) : -terminalScore(game);
        return true;
    }
    if (game.getMoveCount() == Connect4Game::NUM_CELLS) {
        score = 0;
        return true;
    }
    return false;
}

// ============================================================================
// HeuristicEvaluator Implementation
// ============================================================================

const std::vector<uint64_t>& HeuristicEvaluator::windows() {
    static const std::vector<uint64_t> all = [] {
        std::vector<uint64_t> result;
        result.reserve(NUM_WINDOWS);

        // (dc, dr): horizontal, vertical, diagonal "/", diagonal "\"
        static const int dirs[4][2] = {{1, 0}, {0, 1}, {1, 1}, {1, -1}};

        for (const auto& dir : dirs) {
            for (int col = 0; col < Connect4Game::WIDTH; col++) {
                for (int row = 0; row < Connect4Game::HEIGHT; row++) {
                    int endCol = col + 3 * dir[0];
                    int endRow = row + 3 * dir[1];
                    if (endCol < 0 || endCol >= Connect4Game::WIDTH ||
                        endRow < 0 || endRow >= Connect4Game::HEIGHT) {
                        continue;
                    }
                    uint64_t mask = 0;
                    for (int i = 0; i < 4; i++) {
                        mask |= BitBoard::cellMask(col + i * dir[0], row + i * dir[1]);
                    }
                    result.push_back(mask);
                }
            }
        }
        return result;
    }();
    return all;
}

int HeuristicEvaluator::evaluate(const Connect4Game& game, Connect4Game::Player perspective) {
    PROFILE_SCOPE("HeuristicEvaluator::evaluate");
    int score = 0;
    if (terminalValue(game, perspective, score)) {
        return score;
    }
    return scoreWindows(game, perspective) + centerScore(game, perspective);
}

int HeuristicEvaluator::scoreWindows(const Connect4Game& game, Connect4Game::Player perspective) const {
    uint64_t mine = game.getStones(perspective).raw();
    uint64_t theirs = game.getStones(Connect4Game::opponent(perspective)).raw();

    int score = 0;
    for (uint64_t window : windows()) {
        int myCount = BitBoard::popcount(window & mine);
        int theirCount = BitBoard::popcount(window & theirs);

        // Mixed windows can never become four in a row for either side
        if (theirCount == 0 && myCount > 0 && myCount < 4) {
            score += WINDOW_WEIGHTS[myCount];
        } else if (myCount == 0 && theirCount > 0 && theirCount < 4) {
            score -= WINDOW_WEIGHTS[theirCount];
        }
    }
    return score;
}

int HeuristicEvaluator::centerScore(const Connect4Game& game, Connect4Game::Player perspective) const {
    uint64_t center = BitBoard::columnMask(CENTER_COLUMN);
    int mine = BitBoard::popcount(game.getStones(perspective).raw() & center);
    int theirs = BitBoard::popcount(game.getStones(Connect4Game::opponent(perspective)).raw() & center);
    return CENTER_WEIGHT * (mine - theirs);
}
