#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Base class for rule and contract violations raised by the engine.
// The search never expects to see one; drivers catch them and exit non-zero.
class Connect4Error : public std::logic_error {
public:
    explicit Connect4Error(const std::string& what) : std::logic_error(what) {}
};

// Column index outside [0, WIDTH)
class InvalidColumnError : public Connect4Error {
public:
    explicit InvalidColumnError(int column)
        : Connect4Error("invalid column " + std::to_string(column)), column_(column) {}
    int column() const { return column_; }

private:
    int column_;
};

class ColumnFullError : public Connect4Error {
public:
    explicit ColumnFullError(int column)
        : Connect4Error("column " + std::to_string(column) + " is full"), column_(column) {}
    int column() const { return column_; }

private:
    int column_;
};

// make/unmake out of sync
class InvalidUndoError : public Connect4Error {
public:
    explicit InvalidUndoError(const std::string& what) : Connect4Error(what) {}
};

// Asked for a move on a board that is already won or full
class NoLegalMoveError : public Connect4Error {
public:
    NoLegalMoveError() : Connect4Error("game over, no move to make") {}
};

#endif // ERRORS_HPP
