#ifndef GAMEUTILS_HPP
#define GAMEUTILS_HPP

#include "AlphaBeta.hpp"
#include <cstdint>
#include <string>
#include <vector>

// Forward declarations
class Connect4Game;

class GameUtils {
public:
    // Move parsing/display. Columns are "A".."G" (or "1".."7").
    // parseMove returns Connect4Game::NO_MOVE for anything else.
    static int parseMove(const char* move);
    static std::string displayMove(int column);

    // "D D C E", "DDCE" and "4435" all give {3, 3, 2, 4}.
    // Throws std::invalid_argument on a character that is not a column.
    static std::vector<int> parseGameString(const char* gameStr);

    // Replays columns onto game; rule violations propagate as Connect4Error
    static void playMoves(Connect4Game& game, const std::vector<int>& columns);

    // Board printing
    static void printBoard(const Connect4Game& game, int lastMove = -1);
    static void printGameState(const Connect4Game& game);
    static void printMoveScores(const std::vector<AlphaBeta::MoveScore>& scores);
    static std::string playerName(int player);

    // "easy", "medium", "hard" or a plain depth such as "6".
    // Throws std::invalid_argument for anything else.
    static AlphaBeta::Config parseDifficulty(const char* text);

    // Number formatting
    static std::string formatWithCommas(uint64_t value);

    // Search utilities
    static int runSearchAndReport(AlphaBeta& engine, const Connect4Game& game);
};

#endif // GAMEUTILS_HPP
