// src/rules/effect_resolver.cpp
#include "quorum/rules/effect_resolver.h"
#include <spdlog/spdlog.h>
#include <sstream>

namespace quorum {
namespace rules {

using core::Board;
using core::Color;
using core::Square;

namespace {

std::string joinSquares(const std::vector<Square>& squares) {
    std::stringstream ss;
    for (size_t i = 0; i < squares.size(); i++) {
        if (i > 0) ss << ",";
        ss << squares[i].toString();
    }
    return squares.empty() ? "-" : ss.str();
}

} // namespace

bool EffectResolver::isSurrounded(const Board& board, const Square& square) {
    for (const auto& offset : core::NEIGHBOR_OFFSETS) {
        Square neighbor = core::geometry::step(square, offset);
        if (core::geometry::inBounds(neighbor) && board.isEmpty(neighbor)) {
            return false;
        }
    }
    return true;
}

EffectSet EffectResolver::compute(const Board& snapshot, Color mover, const Relocation& relocation) {
    EffectSet effects;
    const Color enemy = core::opponent(mover);
    const Square& target = relocation.to;

    for (const auto& offset : core::NEIGHBOR_OFFSETS) {
        Square neighbor = core::geometry::step(target, offset);
        if (!core::geometry::inBounds(neighbor) || snapshot.stoneAt(neighbor) != enemy) {
            continue;
        }

        if (isSurrounded(snapshot, neighbor)) {
            effects.suffocated.push_back(neighbor);
        }

        // Straight run mover-enemy-mover with no gap
        Square beyond = core::geometry::step(target, offset, 2);
        if (core::geometry::inBounds(beyond) && snapshot.stoneAt(beyond) == mover) {
            effects.converted.push_back(neighbor);
        }
    }

    return effects;
}

void EffectResolver::apply(Board& board, Color mover, const EffectSet& effects) {
    for (const Square& square : effects.suffocated) {
        board.set(square, std::nullopt);
    }
    for (const Square& square : effects.converted) {
        board.set(square, mover);
    }
}

EffectSet EffectResolver::resolve(Board& board, Color mover, const Relocation& relocation) {
    const Board snapshot = board;
    EffectSet effects = compute(snapshot, mover, relocation);

    if (!effects.empty()) {
        spdlog::debug("EffectResolver: {} {}->{} suffocates [{}] converts [{}]",
                      core::colorName(mover),
                      relocation.from.toString(), relocation.to.toString(),
                      joinSquares(effects.suffocated), joinSquares(effects.converted));
    }

    apply(board, mover, effects);
    return effects;
}

} // namespace rules
} // namespace quorum
