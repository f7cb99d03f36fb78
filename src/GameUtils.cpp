#include "GameUtils.hpp"
#include "Connect4Game.hpp"
#include "Evaluator.hpp"
#include <cctype>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

const char* const HIGHLIGHT = "\033[31m";
const char* const RESET = "\033[0m";

int columnFromChar(char c) {
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (upper >= 'A' && upper < 'A' + Connect4Game::WIDTH) {
        return upper - 'A';
    }
    if (c >= '1' && c < '1' + Connect4Game::WIDTH) {
        return c - '1';
    }
    return Connect4Game::NO_MOVE;
}

} // namespace

int GameUtils::parseMove(const char* move) {
    if (move == nullptr || std::strlen(move) != 1) {
        return Connect4Game::NO_MOVE;
    }
    return columnFromChar(move[0]);
}

std::string GameUtils::displayMove(int column) {
    if (column < 0 || column >= Connect4Game::WIDTH) {
        return "--";
    }
    return std::string(1, static_cast<char>('A' + column));
}

std::vector<int> GameUtils::parseGameString(const char* gameStr) {
    std::vector<int> columns;
    for (const char* p = gameStr; *p != '\0'; ++p) {
        if (std::isspace(static_cast<unsigned char>(*p)) || *p == ',') {
            continue;
        }
        int column = columnFromChar(*p);
        if (column == Connect4Game::NO_MOVE) {
            throw std::invalid_argument(std::string("invalid column '") + *p + "'");
        }
        columns.push_back(column);
    }
    return columns;
}

void GameUtils::playMoves(Connect4Game& game, const std::vector<int>& columns) {
    for (int column : columns) {
        game.applyMove(column);
    }
}

void GameUtils::printBoard(const Connect4Game& game, int lastMove) {
    int lastRow = (lastMove >= 0 && lastMove < Connect4Game::WIDTH)
                      ? game.getHeight(lastMove) - 1
                      : -1;

    for (int row = Connect4Game::HEIGHT - 1; row >= 0; row--) {
        std::cout << (row + 1) << ": ";
        for (int col = 0; col < Connect4Game::WIDTH; col++) {
            Connect4Game::Player stone = game.getStoneAt(col, row);
            const char* symbol = (stone == Connect4Game::RED) ? "X"
                               : (stone == Connect4Game::YELLOW) ? "O" : ".";
            if (col == lastMove && row == lastRow) {
                std::cout << HIGHLIGHT << symbol << RESET << " ";
            } else {
                std::cout << symbol << " ";
            }
        }
        std::cout << "\n";
    }

    std::cout << "   ";
    for (int col = 0; col < Connect4Game::WIDTH; col++) {
        std::cout << displayMove(col) << " ";
    }
    std::cout << "\n";
}

void GameUtils::printGameState(const Connect4Game& game) {
    printBoard(game, game.getLastMove());

    Connect4Game::Player winner = game.getWinner();
    if (winner != Connect4Game::NONE) {
        std::cout << "Winner: " << playerName(winner) << "\n";
    } else if (game.isDraw()) {
        std::cout << "Draw\n";
    } else {
        std::cout << "Move " << (game.getMoveCount() + 1) << ", current player: "
                  << playerName(game.getCurrentPlayer()) << "\n";
    }
}

void GameUtils::printMoveScores(const std::vector<AlphaBeta::MoveScore>& scores) {
    if (scores.empty()) {
        std::cout << "No moves to rank.\n";
        return;
    }

    std::cout << "\n=== Move Scores ===\n";
    std::cout << std::setw(6) << "Move" << std::setw(12) << "Score" << "  Outcome\n";
    std::cout << std::string(32, '-') << "\n";
    for (const auto& entry : scores) {
        const char* outcome = Evaluator::isWinScore(entry.score) ? "win"
                            : Evaluator::isLossScore(entry.score) ? "loss" : "";
        std::cout << std::setw(6) << displayMove(entry.move)
                  << std::setw(12) << entry.score << "  " << outcome << "\n";
    }
    std::cout << "===================\n\n";
}

std::string GameUtils::playerName(int player) {
    switch (player) {
    case Connect4Game::RED:
        return "Red (X)";
    case Connect4Game::YELLOW:
        return "Yellow (O)";
    default:
        return "None";
    }
}

AlphaBeta::Config GameUtils::parseDifficulty(const char* text) {
    std::string name = text ? text : "";
    if (name == "easy") return AlphaBeta::Config::easy();
    if (name == "medium") return AlphaBeta::Config::medium();
    if (name == "hard") return AlphaBeta::Config::hard();

    size_t used = 0;
    int depth = 0;
    try {
        depth = std::stoi(name, &used);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("depth out of range: " + name);
    }
    if (used != name.size() || depth < 1 || depth > AlphaBeta::MAX_DEPTH) {
        throw std::invalid_argument("expected easy, medium, hard or a depth in [1, " +
                                    std::to_string(AlphaBeta::MAX_DEPTH) + "], got \"" + name + "\"");
    }
    return AlphaBeta::Config::fromDifficulty(depth);
}

std::string GameUtils::formatWithCommas(uint64_t value) {
    std::string num = std::to_string(value);
    std::string result;
    int count = 0;
    for (int i = static_cast<int>(num.length()) - 1; i >= 0; --i) {
        if (count > 0 && count % 3 == 0) result = ',' + result;
        result = num[i] + result;
        ++count;
    }
    return result;
}

int GameUtils::runSearchAndReport(AlphaBeta& engine, const Connect4Game& game) {
    int depth = engine.getConfig().maxDepth;
    printMoveScores(engine.rankMoves(game, depth));

    AlphaBeta::SearchResult result = engine.search(game);
    engine.printStats();
    std::cout << "Engine selected move: " << displayMove(result.move)
              << " (score " << result.score << ", depth " << result.depth << ")" << std::endl;
    return result.move;
}
