// src/core/game_state.cpp
#include "quorum/core/game_state.h"
#include <sstream>
#include <utility>

namespace quorum {
namespace core {

GameState::GameState()
    : board_(Board::initialLayout()),
      to_move_(Color::WHITE),
      result_(GameResult::ONGOING),
      ply_(0) {
}

GameState::GameState(const Board& board, Color to_move, GameResult result, int ply,
                     std::optional<Play> last_play, std::optional<Color> passed_color)
    : board_(board),
      to_move_(to_move),
      result_(result),
      ply_(ply),
      last_play_(std::move(last_play)),
      passed_color_(passed_color) {
}

std::string GameState::toString() const {
    std::stringstream ss;
    ss << board_.toString();

    if (isTerminal()) {
        if (auto color = winner()) {
            ss << colorName(*color) << " wins by quorum";
        } else {
            ss << "Draw";
        }
        ss << " (" << resultToString(result_) << ")" << std::endl;
    } else {
        ss << colorName(to_move_) << " to move" << std::endl;
    }

    ss << "Move: " << moveNumber() << " (ply " << ply_ << ")" << std::endl;
    if (last_play_) {
        ss << "Last move: " << toNotation(*last_play_) << std::endl;
    }

    return ss.str();
}

bool GameState::operator==(const GameState& other) const {
    return board_ == other.board_ &&
           to_move_ == other.to_move_ &&
           result_ == other.result_ &&
           ply_ == other.ply_ &&
           last_play_ == other.last_play_ &&
           passed_color_ == other.passed_color_;
}

} // namespace core
} // namespace quorum
