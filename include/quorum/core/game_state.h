// include/quorum/core/game_state.h
#ifndef QUORUM_GAME_STATE_H
#define QUORUM_GAME_STATE_H

#include <string>
#include <optional>

#include "quorum/core/quorum_types.h"
#include "quorum/core/board.h"
#include "quorum/core/play.h"

namespace quorum {
namespace core {

/**
 * @brief Immutable snapshot of a game: board, side to move and result
 *
 * States are values. The controller derives each new state from a copy
 * of the previous one and never modifies its input.
 */
class GameState {
public:
    /**
     * @brief Starting position with White to move
     */
    GameState();

    /**
     * @brief Arbitrary position, mainly for analysis and tests
     *
     * @param board Board contents
     * @param to_move Color to move
     * @param result Result, ONGOING for a game in progress
     * @param ply Number of plays already made
     * @param last_play Play that produced this position
     * @param passed_color Color whose turn was skipped on the way here
     */
    GameState(const Board& board, Color to_move,
              GameResult result = GameResult::ONGOING, int ply = 0,
              std::optional<Play> last_play = std::nullopt,
              std::optional<Color> passed_color = std::nullopt);

    const Board& board() const { return board_; }
    Color currentPlayer() const { return to_move_; }
    GameResult result() const { return result_; }
    bool isTerminal() const { return result_ != GameResult::ONGOING; }
    std::optional<Color> winner() const { return winnerOf(result_); }

    int ply() const { return ply_; }
    int moveNumber() const { return ply_ / 2 + 1; }
    const std::optional<Play>& lastPlay() const { return last_play_; }

    /**
     * @brief Color whose turn was skipped by the transition into this state
     */
    std::optional<Color> passedColor() const { return passed_color_; }

    std::optional<Color> stoneAt(const Square& square) const { return board_.stoneAt(square); }
    bool isObjectiveOwnedBy(Color color) const { return board_.isObjectiveOwnedBy(color); }

    /**
     * @brief Board dump followed by the side to move or the result
     */
    std::string toString() const;

    bool operator==(const GameState& other) const;
    bool operator!=(const GameState& other) const { return !(*this == other); }

private:
    Board board_;
    Color to_move_;
    GameResult result_;
    int ply_;
    std::optional<Play> last_play_;
    std::optional<Color> passed_color_;
};

} // namespace core
} // namespace quorum

#endif // QUORUM_GAME_STATE_H
