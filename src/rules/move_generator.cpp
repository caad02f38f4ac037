// src/rules/move_generator.cpp
#include "quorum/rules/move_generator.h"
#include <algorithm>

namespace quorum {
namespace rules {

using core::Board;
using core::Color;
using core::GameState;
using core::IllegalPlayReason;
using core::Movement;
using core::Placement;
using core::Play;
using core::Square;

std::optional<IllegalPlayReason> MoveGenerator::checkMovement(
    const Board& board, Color mover, const Movement& movement) {

    for (const Square& square : {movement.active, movement.center}) {
        if (!core::geometry::inBounds(square) || board.stoneAt(square) != mover) {
            return IllegalPlayReason::OWNERSHIP;
        }
    }

    if (!core::geometry::adjacent(movement.active, movement.center)) {
        return IllegalPlayReason::DISTANCE;
    }

    Square target = movement.target();
    if (!core::geometry::inBounds(target) || !board.isEmpty(target)) {
        return IllegalPlayReason::SPACE;
    }

    return std::nullopt;
}

std::optional<IllegalPlayReason> MoveGenerator::checkPlacement(
    const Board& board, Color mover, const Placement& placement) {

    std::vector<Square> required = board.emptyHomeSquares(mover);
    std::vector<Square> offered = placement.squares;
    std::sort(required.begin(), required.end());
    std::sort(offered.begin(), offered.end());

    if (required.empty() || offered != required) {
        return IllegalPlayReason::HOME_OCCUPANCY;
    }
    return std::nullopt;
}

std::vector<Movement> MoveGenerator::legalMovements(const Board& board, Color mover) {
    std::vector<Movement> movements;

    // squaresOf() and NEIGHBOR_OFFSETS are both in (file, rank) order
    for (const Square& active : board.squaresOf(mover)) {
        for (const auto& offset : core::NEIGHBOR_OFFSETS) {
            Movement movement{active, core::geometry::step(active, offset)};
            if (!checkMovement(board, mover, movement)) {
                movements.push_back(movement);
            }
        }
    }

    return movements;
}

std::vector<Movement> MoveGenerator::legalMovements(const GameState& state) {
    if (state.isTerminal()) {
        return {};
    }
    return legalMovements(state.board(), state.currentPlayer());
}

std::optional<Placement> MoveGenerator::legalPlacement(const Board& board, Color mover) {
    std::vector<Square> empty = board.emptyHomeSquares(mover);
    if (empty.empty()) {
        return std::nullopt;
    }
    return Placement{empty};
}

std::optional<Placement> MoveGenerator::legalPlacement(const GameState& state) {
    if (state.isTerminal()) {
        return std::nullopt;
    }
    return legalPlacement(state.board(), state.currentPlayer());
}

bool MoveGenerator::hasAnyLegalPlay(const Board& board, Color mover) {
    return legalPlacement(board, mover).has_value() || !legalMovements(board, mover).empty();
}

bool MoveGenerator::hasAnyLegalPlay(const GameState& state) {
    if (state.isTerminal()) {
        return false;
    }
    return hasAnyLegalPlay(state.board(), state.currentPlayer());
}

std::vector<Play> MoveGenerator::legalPlays(const GameState& state) {
    std::vector<Play> plays;
    for (const Movement& movement : legalMovements(state)) {
        plays.emplace_back(movement);
    }
    if (auto placement = legalPlacement(state)) {
        plays.emplace_back(*placement);
    }
    return plays;
}

} // namespace rules
} // namespace quorum
