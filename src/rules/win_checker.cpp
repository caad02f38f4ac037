// src/rules/win_checker.cpp
#include "quorum/rules/win_checker.h"

namespace quorum {
namespace rules {

bool WinChecker::isWinner(const core::GameState& state, core::Color color) {
    return isWinner(state.board(), color);
}

bool WinChecker::isWinner(const core::Board& board, core::Color color) {
    return board.isObjectiveOwnedBy(color);
}

int WinChecker::objectiveBalance(const core::Board& board) {
    int balance = 0;
    for (const auto& square : core::Board::objectiveSquares()) {
        auto stone = board.stoneAt(square);
        if (stone == core::Color::WHITE) {
            balance++;
        } else if (stone == core::Color::BLACK) {
            balance--;
        }
    }
    return balance;
}

} // namespace rules
} // namespace quorum
