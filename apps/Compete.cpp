#include "Errors.hpp"
#include "Match.hpp"
#include "Profiler.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

// How to run: ./compete [p1Depth] [p2Depth] [numGames] [p2Random 0|1] [seed]
// Player 1 is always a searching engine; player 2 searches or plays randomly.
int main(int argc, char* argv[]) {
    Match::Config config;
    config.player1.name = "AlphaBeta";
    config.player1.depth = 5;
    config.player2.name = "AlphaBeta";
    config.player2.depth = 1;
    config.numGames = 100;

    try {
        if (argc >= 2) config.player1.depth = std::stoi(argv[1]);
        if (argc >= 3) config.player2.depth = std::stoi(argv[2]);
        if (argc >= 4) config.numGames = std::stoi(argv[3]);
        if (argc >= 5) config.player2.random = std::stoi(argv[4]) != 0;
        if (argc >= 6) config.seed = static_cast<unsigned int>(std::stoul(argv[5]));
        if (config.numGames < 1) {
            throw std::invalid_argument("numGames must be positive");
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        std::cerr << "Usage: " << argv[0] << " [p1Depth] [p2Depth] [numGames] [p2Random 0|1] [seed]\n";
        return 2;
    }
    if (config.player2.random) {
        config.player2.name = "Random";
    }

    try {
        Match match(config);
        Match::MatchStats stats = match.run();
        match.printSummary(stats);
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
