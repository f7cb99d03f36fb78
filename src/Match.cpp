#include "Match.hpp"
#include "Errors.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>

Match::Match() : Match(Config()) {}

Match::Match(const Config& config)
    : config_(config)
    , rng_(config.seed != 0 ? config.seed : std::random_device{}()) {
    for (int i = 0; i < 2; i++) {
        const PlayerConfig& player = playerConfig(i);
        if (player.random) {
            continue;
        }
        AlphaBeta::Config engineConfig = AlphaBeta::Config::fromDifficulty(player.depth);
        engineConfig.timeLimitMs = player.timeLimitMs;
        engines_[i] = std::make_unique<AlphaBeta>(engineConfig);
    }
}

int Match::chooseMove(int playerIndex, const Connect4Game& game) {
    PROFILE_SCOPE("Match::chooseMove");
    if (!engines_[playerIndex]) {
        int column = game.getRandomLegalMove(rng_);
        if (column == Connect4Game::NO_MOVE) {
            throw NoLegalMoveError();
        }
        return column;
    }
    return engines_[playerIndex]->bestMove(game);
}

Match::GameRecord Match::playGame(bool player1First) {
    GameRecord record;
    record.player1First = player1First;

    // Cached scores from the previous game were searched from other roots
    for (auto& engine : engines_) {
        if (engine) {
            engine->clearTT();
        }
    }

    auto start = std::chrono::steady_clock::now();
    Connect4Game game;
    while (!game.isGameOver()) {
        bool redToMove = game.getCurrentPlayer() == Connect4Game::RED;
        int playerIndex = (redToMove == player1First) ? 0 : 1;

        int column = chooseMove(playerIndex, game);
        game.applyMove(column);
        record.moves.push_back(column);

        if (config_.verbose) {
            std::cout << playerConfig(playerIndex).name << " plays "
                      << GameUtils::displayMove(column) << "\n";
            GameUtils::printBoard(game, column);
            std::cout << "\n";
        }
    }
    record.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    Connect4Game::Player player1Color = player1First ? Connect4Game::RED : Connect4Game::YELLOW;
    Connect4Game::Player winner = game.getWinner();
    if (winner == Connect4Game::NONE) {
        record.outcome = Outcome::DRAW;
    } else if (winner == player1Color) {
        record.outcome = Outcome::PLAYER1_WIN;
    } else {
        record.outcome = Outcome::PLAYER2_WIN;
    }

    if (config_.printing) {
        GameUtils::printGameState(game);
    }
    return record;
}

Match::MatchStats Match::run() {
    MatchStats stats;
    std::bernoulli_distribution coin(0.5);

    if (config_.reportProgress) {
        std::cout << "Simulating " << config_.numGames << " games" << std::endl;
    }

    for (int i = 0; i < config_.numGames; i++) {
        GameRecord record = playGame(coin(rng_));
        switch (record.outcome) {
        case Outcome::PLAYER1_WIN:
            stats.wins++;
            break;
        case Outcome::PLAYER2_WIN:
            stats.losses++;
            break;
        case Outcome::DRAW:
            stats.draws++;
            break;
        }
        stats.totalSeconds += record.seconds;

        if (config_.reportProgress) {
            std::cout << "Game " << stats.games() << " / " << config_.numGames << " complete" << std::endl;
        }
    }
    return stats;
}

void Match::printSummary(const MatchStats& stats) const {
    std::cout << "\n=== Match Summary ===\n";
    std::cout << "Player 1: " << config_.player1.name;
    if (!config_.player1.random) std::cout << " (depth " << config_.player1.depth << ")";
    std::cout << "\nPlayer 2: " << config_.player2.name;
    if (!config_.player2.random) std::cout << " (depth " << config_.player2.depth << ")";
    std::cout << "\n";
    std::cout << "Win ratio: " << stats.wins << " / " << stats.games() << " = "
              << std::fixed << std::setprecision(3) << stats.winRatio() << "\n";
    std::cout << "Losses: " << stats.losses << "\n";
    std::cout << "Draws: " << stats.draws << "\n";
    std::cout << "Average time per game: " << std::fixed << std::setprecision(3)
              << stats.averageSeconds() << " s\n";
    std::cout << "=====================\n\n";
}
