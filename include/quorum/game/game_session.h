// include/quorum/game/game_session.h
#ifndef QUORUM_GAME_SESSION_H
#define QUORUM_GAME_SESSION_H

#include <string>
#include <vector>

#include "quorum/core/game_state.h"
#include "quorum/core/play.h"
#include "quorum/game/game_controller.h"

namespace quorum {
namespace game {

/**
 * @brief Mutable game wrapper over the pure controller
 *
 * Keeps every state reached so far, which gives undo and the move
 * history for free.
 */
class GameSession {
public:
    explicit GameSession(const config::EngineConfig& config = config::EngineConfig());

    /**
     * @brief Session starting from an arbitrary position
     */
    explicit GameSession(const core::GameState& start,
                         const config::EngineConfig& config = config::EngineConfig());

    const core::GameState& state() const { return states_.back(); }
    const GameController& controller() const { return controller_; }

    /**
     * @brief Make a play
     *
     * @throws core::IllegalPlayException if the play is illegal; the session is unchanged
     */
    const core::GameState& play(const core::Play& play);

    /**
     * @brief Make a play given in notation ("b1-d3", "++")
     *
     * @throws core::NotationException if the text is malformed
     * @throws core::IllegalPlayException if the play is illegal
     */
    const core::GameState& play(const std::string& notation);

    /**
     * @brief Take back the last play
     *
     * @return true if a play was undone, false at the starting position
     */
    bool undo();

    /**
     * @brief Back to the position the session started from
     */
    void reset();

    /**
     * @brief Plays made so far, oldest first
     */
    std::vector<core::Play> history() const;

    /**
     * @brief Numbered move list, two plies per line
     *
     * Skipped turns are written "--" and the result is appended once the
     * game is over.
     */
    std::string scoresheet() const;

private:
    GameController controller_;
    std::vector<core::GameState> states_;
};

} // namespace game
} // namespace quorum

#endif // QUORUM_GAME_SESSION_H
