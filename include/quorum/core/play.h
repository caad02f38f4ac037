// include/quorum/core/play.h
#ifndef QUORUM_PLAY_H
#define QUORUM_PLAY_H

#include <string>
#include <vector>
#include <variant>
#include <optional>

#include "quorum/core/board.h"
#include "quorum/core/geometry.h"

namespace quorum {
namespace core {

/**
 * @brief Relocation of the active stone by reflection through the center stone
 */
struct Movement {
    Square active;
    Square center;

    Square target() const { return geometry::reflect(active, center); }
};

inline bool operator==(const Movement& a, const Movement& b) {
    return a.active == b.active && a.center == b.center;
}

/**
 * @brief New stones on every listed home square
 */
struct Placement {
    std::vector<Square> squares;
};

inline bool operator==(const Placement& a, const Placement& b) {
    return a.squares == b.squares;
}

using Play = std::variant<Movement, Placement>;

inline bool isMovement(const Play& play) { return std::holds_alternative<Movement>(play); }
inline bool isPlacement(const Play& play) { return std::holds_alternative<Placement>(play); }

/**
 * @brief Text form of a play: "b1-d3" (origin-target) or "++"
 */
std::string toNotation(const Play& play);

/**
 * @brief Parse play text against a board
 *
 * Movements are written origin-target with an optional '-' separator;
 * the center is the midpoint. Placements are written "+" or "++" and take
 * their squares from the mover's empty home squares on the given board.
 *
 * @param text Play text
 * @param board Board the play will be made on
 * @param mover Color making the play
 * @return The play, or empty if the text is malformed
 */
std::optional<Play> parsePlay(const std::string& text, const Board& board, Color mover);

} // namespace core
} // namespace quorum

#endif // QUORUM_PLAY_H
