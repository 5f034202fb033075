#include "RunnerConfig.h"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace EcoSim {

void RunnerConfig::validate() const
{
    if (episodes <= 0) {
        throw std::invalid_argument("episodes must be > 0, got " + std::to_string(episodes));
    }
    if (telemetryInterval <= 0) {
        throw std::invalid_argument(
            "telemetryInterval must be > 0, got " + std::to_string(telemetryInterval));
    }
    if (progressInterval <= 0) {
        throw std::invalid_argument(
            "progressInterval must be > 0, got " + std::to_string(progressInterval));
    }
    if (historyCapacity == 0) {
        throw std::invalid_argument("historyCapacity must be > 0");
    }
    if (telemetryFormat != "json" && telemetryFormat != "binary") {
        throw std::invalid_argument(
            "telemetryFormat must be 'json' or 'binary', got '" + telemetryFormat + "'");
    }
    if (policy.kind != "random") {
        throw std::invalid_argument("Unknown policy kind '" + policy.kind + "'");
    }
    world.validate();
}

void from_json(const nlohmann::json& j, PolicyConfig& config)
{
    config.kind = j.value("kind", PolicyConfig{}.kind);
}

void to_json(nlohmann::json& j, const PolicyConfig& config)
{
    j = nlohmann::json{ { "kind", config.kind } };
}

void from_json(const nlohmann::json& j, RunnerConfig& config)
{
    const RunnerConfig defaults;
    config.episodes = j.value("episodes", defaults.episodes);
    if (j.contains("seed") && !j.at("seed").is_null()) {
        config.seed = j.at("seed").get<uint32_t>();
    }
    else {
        config.seed.reset();
    }
    config.telemetryInterval = j.value("telemetry_interval", defaults.telemetryInterval);
    config.progressInterval = j.value("progress_interval", defaults.progressInterval);
    config.historyCapacity = j.value("history_capacity", defaults.historyCapacity);
    config.historyPath = j.value("history_path", defaults.historyPath);
    config.telemetryPath = j.value("telemetry_path", defaults.telemetryPath);
    config.telemetryFormat = j.value("telemetry_format", defaults.telemetryFormat);
    config.policy = j.value("policy", defaults.policy);
    config.world = j.value("world", defaults.world);
}

void to_json(nlohmann::json& j, const RunnerConfig& config)
{
    j = nlohmann::json{
        { "episodes", config.episodes },
        { "seed", config.seed ? nlohmann::json(*config.seed) : nlohmann::json(nullptr) },
        { "telemetry_interval", config.telemetryInterval },
        { "progress_interval", config.progressInterval },
        { "history_capacity", config.historyCapacity },
        { "history_path", config.historyPath },
        { "telemetry_path", config.telemetryPath },
        { "telemetry_format", config.telemetryFormat },
        { "policy", config.policy },
        { "world", config.world },
    };
}

} // namespace EcoSim
