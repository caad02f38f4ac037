// src/core/geometry.cpp
#include "quorum/core/geometry.h"
#include <cctype>
#include <cstdlib>

namespace quorum {
namespace core {

const std::array<Offset, 8> NEIGHBOR_OFFSETS = {{
    {-1, -1}, {-1, 0}, {-1, 1},
    { 0, -1},          { 0, 1},
    { 1, -1}, { 1, 0}, { 1, 1}
}};

std::string Square::toString() const {
    if (!geometry::inBounds(*this)) {
        return "<" + std::to_string(file) + "," + std::to_string(rank) + ">";
    }

    std::string label;
    label += static_cast<char>('a' + file);
    label += static_cast<char>('1' + rank);
    return label;
}

std::optional<Square> Square::fromString(const std::string& text) {
    if (text.size() != 2) {
        return std::nullopt;
    }

    char f = static_cast<char>(std::tolower(static_cast<unsigned char>(text[0])));
    char r = text[1];
    if (f < 'a' || f > 'h' || r < '1' || r > '8') {
        return std::nullopt;
    }

    return Square(f - 'a', r - '1');
}

namespace geometry {

bool inBounds(const Square& p) {
    return p.file >= 0 && p.file < BOARD_SIZE && p.rank >= 0 && p.rank < BOARD_SIZE;
}

bool adjacent(const Square& p, const Square& q) {
    int df = std::abs(p.file - q.file);
    int dr = std::abs(p.rank - q.rank);
    return df <= 1 && dr <= 1 && (df != 0 || dr != 0);
}

Square reflect(const Square& active, const Square& center) {
    return Square(2 * center.file - active.file, 2 * center.rank - active.rank);
}

Offset direction(const Square& from, const Square& to) {
    auto clamp = [](int delta) { return (delta > 0) - (delta < 0); };
    return Offset{clamp(to.file - from.file), clamp(to.rank - from.rank)};
}

Square step(const Square& from, const Offset& offset, int steps) {
    return Square(from.file + offset.df * steps, from.rank + offset.dr * steps);
}

} // namespace geometry

} // namespace core
} // namespace quorum
