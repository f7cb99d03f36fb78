#include "AlphaBeta.hpp"
#include "Connect4Game.hpp"
#include "Errors.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

// How to run: ./play [red] [yellow]
// Each player is easy, medium, hard or a search depth.
int main(int argc, char* argv[]) {
    AlphaBeta::Config redConfig = AlphaBeta::Config::medium();
    AlphaBeta::Config yellowConfig = AlphaBeta::Config::fromDifficulty(3);
    try {
        if (argc >= 2) redConfig = GameUtils::parseDifficulty(argv[1]);
        if (argc >= 3) yellowConfig = GameUtils::parseDifficulty(argv[2]);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid difficulty: " << e.what() << "\n";
        std::cerr << "Usage: " << argv[0] << " [easy|medium|hard|depth] [easy|medium|hard|depth]\n";
        return 2;
    }
    const int redDepth = redConfig.maxDepth;
    const int yellowDepth = yellowConfig.maxDepth;

    std::cout << "Playing Connect 4..." << std::endl;

    try {
        AlphaBeta redPlayer(redConfig);
        AlphaBeta yellowPlayer(yellowConfig);

        double redTotalTime = 0.0;
        double yellowTotalTime = 0.0;
        std::string moves;

        Connect4Game game;
        while (!game.isGameOver()) {
            GameUtils::printGameState(game);
            auto t0 = std::chrono::steady_clock::now();

            int column;
            if (game.getCurrentPlayer() == Connect4Game::RED) {
                std::cout << "Red's turn (depth " << redDepth << ")" << std::endl;
                column = redPlayer.bestMove(game);
                double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
                redTotalTime += elapsed;
                std::cout << "  move time: " << elapsed << "s\n";
            } else {
                std::cout << "Yellow's turn (depth " << yellowDepth << ")" << std::endl;
                column = yellowPlayer.bestMove(game);
                double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
                yellowTotalTime += elapsed;
                std::cout << "  move time: " << elapsed << "s\n";
            }

            std::cout << "Selected move: " << GameUtils::displayMove(column) << "\n";
            moves += GameUtils::displayMove(column);
            game.applyMove(column);
        }

        GameUtils::printGameState(game);
        std::cout << "Moves: " << moves << "\n\n";

        Connect4Game::Player winner = game.getWinner();
        if (winner == Connect4Game::NONE) {
            std::cout << "Draw\n";
        } else {
            std::cout << "Winner: " << GameUtils::playerName(winner) << "\n";
        }
        std::cout << "Red total time: " << redTotalTime << "s\n";
        std::cout << "Yellow total time: " << yellowTotalTime << "s\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 2;
    } catch (const Connect4Error& e) {
        std::cerr << "Internal error: " << e.what() << "\n";
        return 1;
    }

    Profiler::instance().printReport();
    return 0;
}
