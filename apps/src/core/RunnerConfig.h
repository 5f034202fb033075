#pragma once

#include "WorldConfig.h"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace EcoSim {

struct PolicyConfig {
    std::string kind = "random";
};

/**
 * Episode driver settings, loaded from ecosim.json. Empty paths disable the
 * corresponding output (history stays in memory, telemetry is not written).
 */
struct RunnerConfig {
    int episodes = 50;
    std::optional<uint32_t> seed;
    int telemetryInterval = 10;
    int progressInterval = 100;
    size_t historyCapacity = 100;
    std::string historyPath;
    std::string telemetryPath;
    std::string telemetryFormat = "json";
    PolicyConfig policy;
    WorldConfig world;

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

void from_json(const nlohmann::json& j, PolicyConfig& config);
void to_json(nlohmann::json& j, const PolicyConfig& config);
void from_json(const nlohmann::json& j, RunnerConfig& config);
void to_json(nlohmann::json& j, const RunnerConfig& config);

} // namespace EcoSim
