#pragma once

#include "WorldData.h"

#include <cstddef>
#include <vector>

namespace EcoSim {

using Observation = std::vector<float>;

/**
 * Builds the fixed 40-wide per-agent observation vector.
 *
 * Layout (0-based offsets):
 *   [0..1]   position x, y (raw grid coordinates)
 *   [2]      health / 100
 *   [3]      food inventory (raw count)
 *   [4..5]   dx, dy to nearest food cell (0, 0 when there is no food)
 *   [6..8]   personality one-hot: cooperative, aggressive, neutral
 *   [9]      1 if allied
 *   [10..12] neighbors within radius 3: total, cooperative, aggressive
 *   [13..15] any radius-3 neighbor signalling help, food, danger
 *   [16..24] 3x3 obstacle window, dx major then dy, centered on the agent
 *   [25..39] reserved, always zero
 *
 * Read-only over WorldData, so agents may be encoded in parallel.
 */
class FeatureEncoder {
public:
    static constexpr size_t kObservationSize = 40;

    static constexpr size_t kPositionOffset = 0;
    static constexpr size_t kHealthOffset = 2;
    static constexpr size_t kInventoryOffset = 3;
    static constexpr size_t kNearestFoodOffset = 4;
    static constexpr size_t kPersonalityOffset = 6;
    static constexpr size_t kAllianceOffset = 9;
    static constexpr size_t kNeighborOffset = 10;
    static constexpr size_t kSignalOffset = 13;
    static constexpr size_t kObstacleWindowOffset = 16;
    static constexpr size_t kReservedOffset = 25;
    static constexpr size_t kReservedSize = 15;

    // One observation per agent, in id order.
    static std::vector<Observation> encode(const WorldData& data);

    static Observation encodeAgent(const WorldData& data, const Agent& agent);

    // Offset from the agent to the closest food cell. Ties keep the earliest entry.
    static Vector2i nearestFoodDelta(const WorldData& data, Vector2i origin);
};

} // namespace EcoSim
