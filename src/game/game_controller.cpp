// src/game/game_controller.cpp
#include "quorum/game/game_controller.h"
#include "quorum/rules/move_generator.h"
#include "quorum/rules/effect_resolver.h"
#include "quorum/rules/win_checker.h"
#include <spdlog/spdlog.h>

namespace quorum {
namespace game {

using core::Board;
using core::Color;
using core::GameResult;
using core::GameState;
using core::IllegalPlayReason;
using core::Movement;
using core::Placement;
using core::Play;

GameController::GameController(const config::EngineConfig& config)
    : config_(config) {
}

GameState GameController::initialState() const {
    return GameState();
}

void GameController::validate(const GameState& state, const Play& play) const {
    std::optional<IllegalPlayReason> reason;

    if (state.isTerminal()) {
        reason = IllegalPlayReason::GAME_OVER;
    } else if (const auto* movement = std::get_if<Movement>(&play)) {
        reason = rules::MoveGenerator::checkMovement(state.board(), state.currentPlayer(), *movement);
    } else {
        reason = rules::MoveGenerator::checkPlacement(
            state.board(), state.currentPlayer(), std::get<Placement>(play));
    }

    if (reason) {
        std::string notation = core::toNotation(play);
        std::string message = "Illegal play " + notation + " by " +
                              core::colorName(state.currentPlayer()) + ": " +
                              core::reasonToString(*reason);
        spdlog::warn("GameController: {}", message);
        throw core::IllegalPlayException(message, *reason, notation);
    }
}

GameState GameController::apply(const GameState& state, const Play& play) const {
    validate(state, play);

    Board board = state.board();
    const Color mover = state.currentPlayer();
    const int ply = state.ply() + 1;
    bool check_win = true;

    if (const auto* movement = std::get_if<Movement>(&play)) {
        rules::Relocation relocation{movement->active, movement->target()};
        board.set(relocation.from, std::nullopt);
        board.set(relocation.to, mover);
        rules::EffectResolver::resolve(board, mover, relocation);
    } else {
        for (const auto& square : std::get<Placement>(play).squares) {
            board.set(square, mover);
        }
        check_win = config_.check_win_after_placement;
    }

    spdlog::debug("GameController: ply {} {} plays {}", ply, core::colorName(mover), core::toNotation(play));

    if (check_win && rules::WinChecker::isWinner(board, mover)) {
        spdlog::info("GameController: {} wins by quorum after ply {}", core::colorName(mover), ply);
        return GameState(board, core::opponent(mover), core::winFor(mover), ply, play);
    }

    return handOver(board, mover, ply, play);
}

GameState GameController::handOver(const Board& board, Color mover, int ply, const Play& play) const {
    const Color next = core::opponent(mover);

    if (rules::MoveGenerator::hasAnyLegalPlay(board, next)) {
        return GameState(board, next, GameResult::ONGOING, ply, play);
    }

    if (config_.no_play_policy == config::NoPlayPolicy::LOSE) {
        spdlog::info("GameController: {} has no legal play and loses", core::colorName(next));
        return GameState(board, next, core::winFor(mover), ply, play);
    }

    if (rules::MoveGenerator::hasAnyLegalPlay(board, mover)) {
        spdlog::info("GameController: {} has no legal play and passes", core::colorName(next));
        return GameState(board, mover, GameResult::ONGOING, ply, play, next);
    }

    spdlog::info("GameController: neither player has a legal play, game drawn");
    return GameState(board, next, GameResult::DRAW, ply, play);
}

} // namespace game
} // namespace quorum
