// include/quorum/rules/win_checker.h
#ifndef QUORUM_WIN_CHECKER_H
#define QUORUM_WIN_CHECKER_H

#include "quorum/core/quorum_types.h"
#include "quorum/core/board.h"
#include "quorum/core/game_state.h"

namespace quorum {
namespace rules {

/**
 * @brief Quorum win condition: all four objective squares held by one color
 */
class WinChecker {
public:
    static bool isWinner(const core::GameState& state, core::Color color);
    static bool isWinner(const core::Board& board, core::Color color);

    /**
     * @brief Objective squares held by White minus those held by Black
     *
     * Ranges from -4 to 4; either extreme is a win.
     */
    static int objectiveBalance(const core::Board& board);
};

} // namespace rules
} // namespace quorum

#endif // QUORUM_WIN_CHECKER_H
