#pragma once

#include "Vector2i.h"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <vector>
#include <zpp_bits.h>

namespace EcoSim {

struct WorldData;

/**
 * @brief Read-only copy of the world for display and telemetry.
 *
 * Per-agent fields are parallel arrays indexed by agent id. Obstacles are in
 * sorted (x, then y) order. Binary encoding uses zpp_bits; JSON encoding keeps the
 * field names display clients expect ("agents", "food", "alliances", ...).
 */
struct WorldSnapshot {
    int32_t gridSize = 0;
    std::vector<Vector2i> positions;
    std::vector<Vector2i> food;
    std::vector<Vector2i> obstacles;
    std::vector<int32_t> scores;
    std::vector<double> health;
    std::vector<uint8_t> personalities; // Personality::EnumType values.
    std::vector<int32_t> alliances;     // Alliance id, -1 when unallied.
    std::vector<int32_t> foodInventory;
    std::vector<uint8_t> signals; // CommunicationSignal values.
    int32_t step = 0;
    double survivalRate = 0.0;
    int32_t cooperationEvents = 0;
    int32_t theftEvents = 0;
    int32_t numAlliances = 0;
    double avgHealth = 0.0;

    using serialize = zpp::bits::members<16>;

    static WorldSnapshot capture(const WorldData& data);
};

void to_json(nlohmann::json& j, const WorldSnapshot& snapshot);
void from_json(const nlohmann::json& j, WorldSnapshot& snapshot);

// zpp_bits encoding. decode throws std::system_error on malformed input.
std::vector<std::byte> encodeSnapshot(const WorldSnapshot& snapshot);
WorldSnapshot decodeSnapshot(const std::vector<std::byte>& bytes);

} // namespace EcoSim
