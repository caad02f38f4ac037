// include/quorum/rules/effect_resolver.h
#ifndef QUORUM_EFFECT_RESOLVER_H
#define QUORUM_EFFECT_RESOLVER_H

#include <vector>

#include "quorum/core/quorum_types.h"
#include "quorum/core/board.h"
#include "quorum/core/geometry.h"

namespace quorum {
namespace rules {

/**
 * @brief Where the active stone came from and where it landed
 */
struct Relocation {
    core::Square from;
    core::Square to;
};

/**
 * @brief Opponent stones removed and recolored by one movement
 */
struct EffectSet {
    std::vector<core::Square> suffocated;
    std::vector<core::Square> converted;

    bool empty() const { return suffocated.empty() && converted.empty(); }
};

/**
 * @brief Suffocation and conversion around a moved stone
 *
 * Both sets are computed from one frozen board taken after the relocation
 * and before any effect is applied, so neither set depends on the other.
 * Only opponent stones adjacent to the landing square are ever affected.
 */
class EffectResolver {
public:
    /**
     * @brief Compute both effect sets without touching the board
     *
     * @param snapshot Board after the relocation
     * @param mover Color that moved
     * @param relocation The active stone's move
     * @return Suffocated and converted squares, each in neighbour order
     */
    static EffectSet compute(const core::Board& snapshot, core::Color mover,
                             const Relocation& relocation);

    /**
     * @brief Apply precomputed effects: remove suffocated stones, then
     * replace converted ones with mover stones
     */
    static void apply(core::Board& board, core::Color mover, const EffectSet& effects);

    /**
     * @brief compute() on a copy of the board, then apply() to it
     *
     * @return The effects that were applied
     */
    static EffectSet resolve(core::Board& board, core::Color mover, const Relocation& relocation);

    /**
     * @brief True iff no in-bounds neighbour of the square is empty
     */
    static bool isSurrounded(const core::Board& board, const core::Square& square);
};

} // namespace rules
} // namespace quorum

#endif // QUORUM_EFFECT_RESOLVER_H
