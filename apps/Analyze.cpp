#include "AlphaBeta.hpp"
#include "Connect4Game.hpp"
#include "Errors.hpp"
#include "GameUtils.hpp"
#include "Profiler.hpp"
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

// How to run: ./analyze "D D C E" 7
int main(int argc, char* argv[]) {
    const char* gameDataStr = (argc >= 2) ? argv[1] : "";

    Connect4Game game;
    int depth = 7;
    try {
        if (argc >= 3) depth = std::stoi(argv[2]);

        // Columns come from the user, so check them before touching the board
        std::vector<int> moves = GameUtils::parseGameString(gameDataStr);
        for (size_t i = 0; i < moves.size(); i++) {
            if (!game.isLegalMove(moves[i])) {
                throw std::invalid_argument("move " + std::to_string(i + 1) + " (" +
                                            GameUtils::displayMove(moves[i]) + ") is not legal");
            }
            game.applyMove(moves[i]);
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid input: " << e.what() << "\n";
        std::cerr << "Usage: " << argv[0] << " \"<moves A-G>\" [depth]\n";
        return 2;
    }

    std::cout << "Depth: " << depth << std::endl;
    GameUtils::printGameState(game);
    if (game.isGameOver()) {
        std::cout << "Game over, no move to make.\n";
        return 0;
    }

    try {
        AlphaBeta engine(AlphaBeta::Config::fromDifficulty(depth));
        GameUtils::runSearchAndReport(engine, game);
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
