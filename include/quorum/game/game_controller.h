// include/quorum/game/game_controller.h
#ifndef QUORUM_GAME_CONTROLLER_H
#define QUORUM_GAME_CONTROLLER_H

#include "quorum/core/game_state.h"
#include "quorum/core/play.h"
#include "quorum/config/engine_config.h"

namespace quorum {
namespace game {

/**
 * @brief Applies one full ply to a game state
 *
 * Validation, relocation or placement, effects, win check and turn
 * hand-over. States are never modified in place.
 */
class GameController {
public:
    explicit GameController(const config::EngineConfig& config = config::EngineConfig());

    /**
     * @brief Starting position with White to move
     */
    core::GameState initialState() const;

    /**
     * @brief Apply a play and return the resulting state
     *
     * @param state State to play from, left unchanged
     * @param play The play to make
     * @return New state
     * @throws core::IllegalPlayException if the play is not legal in state
     */
    core::GameState apply(const core::GameState& state, const core::Play& play) const;

    const config::EngineConfig& getConfig() const { return config_; }

private:
    config::EngineConfig config_;

    void validate(const core::GameState& state, const core::Play& play) const;

    /**
     * @brief Decide who moves next once the mover's play is complete
     */
    core::GameState handOver(const core::Board& board, core::Color mover,
                             int ply, const core::Play& play) const;
};

} // namespace game
} // namespace quorum

#endif // QUORUM_GAME_CONTROLLER_H
