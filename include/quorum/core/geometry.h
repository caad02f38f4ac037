// include/quorum/core/geometry.h
#ifndef QUORUM_GEOMETRY_H
#define QUORUM_GEOMETRY_H

#include <array>
#include <string>
#include <optional>

namespace quorum {
namespace core {

constexpr int BOARD_SIZE = 8;
constexpr int NUM_SQUARES = BOARD_SIZE * BOARD_SIZE;

/**
 * @brief A board coordinate. File 0..7 is a..h, rank 0..7 is 1..8.
 *
 * Squares are plain values and may lie off the board; use inBounds()
 * before handing one to the Board.
 */
struct Square {
    int file = 0;
    int rank = 0;

    Square() = default;
    Square(int f, int r) : file(f), rank(r) {}

    /**
     * @brief Index into a flat 64-entry array (rank-major)
     */
    int index() const { return rank * BOARD_SIZE + file; }

    static Square fromIndex(int index) { return Square(index % BOARD_SIZE, index / BOARD_SIZE); }

    /**
     * @brief Two-character label such as "e3"
     *
     * Off-board coordinates are written as "<file,rank>".
     */
    std::string toString() const;

    /**
     * @brief Parse a two-character label
     *
     * @param text Label with a file letter a-h (either case) and a rank digit 1-8
     * @return The square, or empty if the text is malformed
     */
    static std::optional<Square> fromString(const std::string& text);
};

inline bool operator==(const Square& a, const Square& b) {
    return a.file == b.file && a.rank == b.rank;
}

inline bool operator!=(const Square& a, const Square& b) {
    return !(a == b);
}

// Lexicographic by (file, rank)
inline bool operator<(const Square& a, const Square& b) {
    return a.file != b.file ? a.file < b.file : a.rank < b.rank;
}

/**
 * @brief Unit step between two adjacent squares
 */
struct Offset {
    int df = 0;
    int dr = 0;
};

inline bool operator==(const Offset& a, const Offset& b) {
    return a.df == b.df && a.dr == b.dr;
}

/**
 * @brief The eight neighbour offsets, ordered lexicographically by (df, dr)
 */
extern const std::array<Offset, 8> NEIGHBOR_OFFSETS;

namespace geometry {

bool inBounds(const Square& p);

/**
 * @brief Chebyshev distance 1; a square is not adjacent to itself
 */
bool adjacent(const Square& p, const Square& q);

/**
 * @brief Reflection of active through center: center + (center - active)
 *
 * No bounds check is done here.
 */
Square reflect(const Square& active, const Square& center);

/**
 * @brief Unit offset from one square towards an adjacent one
 *
 * Only meaningful for adjacent squares.
 */
Offset direction(const Square& from, const Square& to);

/**
 * @brief Square reached after stepping `steps` times along an offset
 */
Square step(const Square& from, const Offset& offset, int steps = 1);

} // namespace geometry

} // namespace core
} // namespace quorum

#endif // QUORUM_GEOMETRY_H
