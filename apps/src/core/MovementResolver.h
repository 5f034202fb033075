#pragma once

#include "Action.h"
#include "WorldData.h"

#include <random>
#include <vector>

namespace EcoSim {

/**
 * Phase 1 of a step: movement, obstacle collisions and foraging.
 *
 * Agents are processed in ascending id order against the shared food list, so an
 * earlier agent can consume a unit (and trigger its respawn) before a later agent
 * reaches the same cell.
 */
class MovementResolver {
public:
    struct Stats {
        int moves = 0;
        int collisions = 0;
        int collected = 0;
    };

    /**
     * Clears every agent's signal, then applies codes 0-4. Social codes leave the
     * agent and its reward untouched in this phase.
     *
     * @param rewards Per-agent rewards for this step; written (not accumulated) for
     *                agents with a movement action.
     * @param rng Engine used to respawn consumed food.
     */
    Stats resolve(
        WorldData& data,
        const std::vector<Action>& actions,
        std::vector<double>& rewards,
        std::mt19937& rng) const;

private:
    // Removes one food entry at cell and appends a fresh random one. Returns false
    // when the cell holds no food.
    bool consumeFoodAt(WorldData& data, Vector2i cell, std::mt19937& rng) const;
};

} // namespace EcoSim
