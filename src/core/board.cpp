// src/core/board.cpp
#include "quorum/core/board.h"
#include <sstream>
#include <stdexcept>

namespace quorum {
namespace core {

namespace {

const std::array<Square, 4> WHITE_HOME = {{Square(0, 0), Square(0, 1), Square(1, 0), Square(1, 1)}};
const std::array<Square, 4> BLACK_HOME = {{Square(7, 7), Square(7, 6), Square(6, 7), Square(6, 6)}};
const std::array<Square, 4> OBJECTIVES = {{Square(3, 3), Square(3, 4), Square(4, 3), Square(4, 4)}};

// Each side fills the triangle of ten squares in its own corner
constexpr int CORNER_TRIANGLE = 3;

} // namespace

Board::Board() {
    cells_.fill(std::nullopt);
}

Board Board::initialLayout() {
    Board board;
    for (int rank = 0; rank < BOARD_SIZE; rank++) {
        for (int file = 0; file < BOARD_SIZE; file++) {
            if (file + rank <= CORNER_TRIANGLE) {
                board.set(Square(file, rank), Color::WHITE);
            } else if ((BOARD_SIZE - 1 - file) + (BOARD_SIZE - 1 - rank) <= CORNER_TRIANGLE) {
                board.set(Square(file, rank), Color::BLACK);
            }
        }
    }
    return board;
}

int Board::checkedIndex(const Square& square) {
    if (!geometry::inBounds(square)) {
        throw std::out_of_range("Square " + square.toString() + " is off the board");
    }
    return square.index();
}

std::optional<Color> Board::stoneAt(const Square& square) const {
    return cells_[checkedIndex(square)];
}

void Board::set(const Square& square, std::optional<Color> stone) {
    cells_[checkedIndex(square)] = stone;
}

std::vector<Square> Board::emptyHomeSquares(Color color) const {
    std::vector<Square> empty;
    for (const Square& square : homeSquares(color)) {
        if (isEmpty(square)) {
            empty.push_back(square);
        }
    }
    return empty;
}

bool Board::isObjectiveOwnedBy(Color color) const {
    for (const Square& square : OBJECTIVES) {
        if (stoneAt(square) != color) {
            return false;
        }
    }
    return true;
}

std::vector<Square> Board::squaresOf(Color color) const {
    std::vector<Square> squares;
    for (int file = 0; file < BOARD_SIZE; file++) {
        for (int rank = 0; rank < BOARD_SIZE; rank++) {
            if (cells_[Square(file, rank).index()] == color) {
                squares.emplace_back(file, rank);
            }
        }
    }
    return squares;
}

int Board::countStones(Color color) const {
    int count = 0;
    for (const auto& cell : cells_) {
        if (cell == color) {
            count++;
        }
    }
    return count;
}

std::string Board::toString() const {
    std::stringstream ss;

    ss << "  a b c d e f g h" << std::endl;
    for (int rank = BOARD_SIZE - 1; rank >= 0; rank--) {
        ss << (rank + 1);
        for (int file = 0; file < BOARD_SIZE; file++) {
            const auto& cell = cells_[Square(file, rank).index()];
            char glyph = '.';
            if (cell == Color::BLACK) {
                glyph = 'x';
            } else if (cell == Color::WHITE) {
                glyph = 'o';
            }
            ss << ' ' << glyph;
        }
        ss << ' ' << (rank + 1) << std::endl;
    }
    ss << "  a b c d e f g h" << std::endl;

    return ss.str();
}

const std::array<Square, 4>& Board::homeSquares(Color color) {
    return color == Color::WHITE ? WHITE_HOME : BLACK_HOME;
}

const std::array<Square, 4>& Board::objectiveSquares() {
    return OBJECTIVES;
}

} // namespace core
} // namespace quorum
