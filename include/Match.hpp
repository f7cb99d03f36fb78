#ifndef MATCH_HPP
#define MATCH_HPP

#include "AlphaBeta.hpp"
#include "Connect4Game.hpp"
#include <memory>
#include <random>
#include <string>
#include <vector>

// ============================================================================
// AI-vs-AI games, run strictly alternately in one thread
// ============================================================================

class Match {
public:
    struct PlayerConfig {
        std::string name = "AlphaBeta";
        int depth = 5;
        bool random = false;   // uniform random legal moves instead of searching
        int timeLimitMs = 0;
    };

    struct Config {
        PlayerConfig player1;
        PlayerConfig player2;
        int numGames = 100;
        bool printing = false;        // print the final board of each game
        bool verbose = false;         // print the board after every move
        bool reportProgress = true;   // "Game n / N complete"
        unsigned int seed = 0;        // 0 = seed from std::random_device

        Config() { player2.depth = 1; }
    };

    enum class Outcome { PLAYER1_WIN, PLAYER2_WIN, DRAW };

    struct GameRecord {
        Outcome outcome = Outcome::DRAW;
        bool player1First = true;     // player 1 played Red
        std::vector<int> moves;
        double seconds = 0.0;
    };

    // Results from player 1's point of view
    struct MatchStats {
        int wins = 0;
        int losses = 0;
        int draws = 0;
        double totalSeconds = 0.0;

        int games() const { return wins + losses + draws; }
        double winRatio() const { return games() > 0 ? static_cast<double>(wins) / games() : 0.0; }
        double averageSeconds() const { return games() > 0 ? totalSeconds / games() : 0.0; }
    };

    Match();
    explicit Match(const Config& config);

    // One complete game. Throws Connect4Error if an engine produces an illegal move.
    GameRecord playGame(bool player1First);

    // config.numGames games, random starting player each time
    MatchStats run();

    void printSummary(const MatchStats& stats) const;
    const Config& getConfig() const { return config_; }

private:
    int chooseMove(int playerIndex, const Connect4Game& game);
    const PlayerConfig& playerConfig(int playerIndex) const {
        return playerIndex == 0 ? config_.player1 : config_.player2;
    }

    Config config_;
    std::unique_ptr<AlphaBeta> engines_[2];  // nullptr for random players
    std::mt19937 rng_;
};

#endif // MATCH_HPP
