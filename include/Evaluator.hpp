#ifndef EVALUATOR_HPP
#define EVALUATOR_HPP

#include "Connect4Game.hpp"
#include <array>
#include <cstdint>
#include <vector>

// Abstract interface for position evaluation
class Evaluator {
public:
    static constexpr int WIN_SCORE = 1000000;

    virtual ~Evaluator() = default;

    // Score of the position from perspective's point of view.
    // Won/lost positions return +/-terminalScore(), a full board returns 0.
    virtual int evaluate(const Connect4Game& game, Connect4Game::Player perspective) = 0;

    // Faster wins score higher: a win with fewer stones on the board is worth more
    static int terminalScore(const Connect4Game& game) {
        return WIN_SCORE - game.getMoveCount();
    }

    // Returns true and sets score when the position is decided
    static bool terminalValue(const Connect4Game& game, Connect4Game::Player perspective, int& score);

    static bool isWinScore(int score) { return score > WIN_SCORE - 2 * Connect4Game::NUM_CELLS; }
    static bool isLossScore(int score) { return score < -WIN_SCORE + 2 * Connect4Game::NUM_CELLS; }
};

// Open-window heuristic
class HeuristicEvaluator : public Evaluator {
public:
    // Weight of a window holding n stones of one player and none of the other
    static constexpr std::array<int, 4> WINDOW_WEIGHTS = {0, 1, 3, 9};
    static constexpr int CENTER_WEIGHT = 3;
    static constexpr int CENTER_COLUMN = Connect4Game::WIDTH / 2;
    static constexpr int NUM_WINDOWS = 69;

    HeuristicEvaluator() = default;
    ~HeuristicEvaluator() override = default;

    int evaluate(const Connect4Game& game, Connect4Game::Player perspective) override;

    int scoreWindows(const Connect4Game& game, Connect4Game::Player perspective) const;
    int centerScore(const Connect4Game& game, Connect4Game::Player perspective) const;

    // Every horizontal, vertical and diagonal run of four cells
    static const std::vector<uint64_t>& windows();
};

#endif // EVALUATOR_HPP
