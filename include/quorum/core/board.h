// include/quorum/core/board.h
#ifndef QUORUM_BOARD_H
#define QUORUM_BOARD_H

#include <array>
#include <vector>
#include <string>
#include <optional>

#include "quorum/core/quorum_types.h"
#include "quorum/core/geometry.h"

namespace quorum {
namespace core {

/**
 * @brief The 8x8 grid of optional stones
 *
 * Pure data holder with mutation primitives. Legality is checked by
 * the rules layer, never here.
 */
class Board {
public:
    /**
     * @brief Empty board
     */
    Board();

    /**
     * @brief Board with the fixed starting layout
     */
    static Board initialLayout();

    /**
     * @brief Stone on a square
     *
     * @throws std::out_of_range if the square is off the board
     */
    std::optional<Color> stoneAt(const Square& square) const;

    /**
     * @brief Put a stone on a square, or clear it with std::nullopt
     *
     * @throws std::out_of_range if the square is off the board
     */
    void set(const Square& square, std::optional<Color> stone);

    bool isEmpty(const Square& square) const { return !stoneAt(square).has_value(); }

    /**
     * @brief Home squares of a color holding no stone, in home order
     */
    std::vector<Square> emptyHomeSquares(Color color) const;

    /**
     * @brief True iff all four objective squares hold this color's stones
     */
    bool isObjectiveOwnedBy(Color color) const;

    /**
     * @brief All squares holding a stone of this color, ordered by (file, rank)
     */
    std::vector<Square> squaresOf(Color color) const;

    int countStones(Color color) const;

    /**
     * @brief Text dump, rank 8 on top: 'x' Black, 'o' White, '.' empty
     */
    std::string toString() const;

    bool operator==(const Board& other) const { return cells_ == other.cells_; }
    bool operator!=(const Board& other) const { return !(*this == other); }

    static const std::array<Square, 4>& homeSquares(Color color);
    static const std::array<Square, 4>& objectiveSquares();

private:
    std::array<std::optional<Color>, NUM_SQUARES> cells_;

    static int checkedIndex(const Square& square);
};

} // namespace core
} // namespace quorum

#endif // QUORUM_BOARD_H
