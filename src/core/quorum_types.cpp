// src/core/quorum_types.cpp
#include "quorum/core/quorum_types.h"

namespace quorum {
namespace core {

std::string resultToString(GameResult result) {
    switch (result) {
        case GameResult::WHITE_WINS: return "1-0";
        case GameResult::BLACK_WINS: return "0-1";
        case GameResult::DRAW: return "1/2-1/2";
        case GameResult::ONGOING: return "*";
    }
    return "*";
}

std::string reasonToString(IllegalPlayReason reason) {
    switch (reason) {
        case IllegalPlayReason::GAME_OVER: return "the game is over";
        case IllegalPlayReason::OWNERSHIP: return "active and center must both hold the mover's stones";
        case IllegalPlayReason::DISTANCE: return "active and center must be adjacent";
        case IllegalPlayReason::SPACE: return "target must be an empty square on the board";
        case IllegalPlayReason::HOME_OCCUPANCY: return "placement must fill exactly the empty home squares";
    }
    return "unknown";
}

} // namespace core
} // namespace quorum
