// include/quorum/rules/move_generator.h
#ifndef QUORUM_MOVE_GENERATOR_H
#define QUORUM_MOVE_GENERATOR_H

#include <vector>
#include <optional>

#include "quorum/core/quorum_types.h"
#include "quorum/core/board.h"
#include "quorum/core/play.h"
#include "quorum/core/game_state.h"

namespace quorum {
namespace rules {

/**
 * @brief Enumerates and checks movements and placements
 *
 * The GameState overloads return nothing for a finished game. The Board
 * overloads ignore the result and only look at the stones.
 */
class MoveGenerator {
public:
    /**
     * @brief Every legal movement of the player to move
     *
     * @param state Current state
     * @return Movements ordered lexicographically by (active, center)
     */
    static std::vector<core::Movement> legalMovements(const core::GameState& state);
    static std::vector<core::Movement> legalMovements(const core::Board& board, core::Color mover);

    /**
     * @brief Placement over all empty home squares of the player to move
     *
     * @param state Current state
     * @return The placement, or empty if every home square is occupied
     */
    static std::optional<core::Placement> legalPlacement(const core::GameState& state);
    static std::optional<core::Placement> legalPlacement(const core::Board& board, core::Color mover);

    static bool hasAnyLegalPlay(const core::GameState& state);
    static bool hasAnyLegalPlay(const core::Board& board, core::Color mover);

    /**
     * @brief All legal plays: movements first, then the placement if any
     */
    static std::vector<core::Play> legalPlays(const core::GameState& state);

    /**
     * @brief First rule a movement breaks
     *
     * Checks ownership, then distance, then space. This is the same filter
     * legalMovements() applies.
     *
     * @return The failed rule, or empty if the movement is legal
     */
    static std::optional<core::IllegalPlayReason> checkMovement(
        const core::Board& board, core::Color mover, const core::Movement& movement);

    /**
     * @brief Rule a placement breaks, if any
     *
     * The square set must equal the empty home set (in any order) and be non-empty.
     */
    static std::optional<core::IllegalPlayReason> checkPlacement(
        const core::Board& board, core::Color mover, const core::Placement& placement);
};

} // namespace rules
} // namespace quorum

#endif // QUORUM_MOVE_GENERATOR_H
