#pragma once

#include "FeatureEncoder.h"
#include "MetricsAggregator.h"
#include "MovementResolver.h"
#include "SocialResolver.h"
#include "WorldConfig.h"
#include "WorldData.h"
#include "WorldSnapshot.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <vector>

namespace EcoSim {

struct ResetResult {
    std::vector<Observation> observations;
    nlohmann::json info = nlohmann::json::object(); // Always empty.
};

struct StepResult {
    std::vector<Observation> observations;
    std::vector<double> rewards;
    bool terminated = false;
    bool truncated = false; // Never set; episodes only end at maxSteps.
    StepInfo info;
};

/**
 * Discrete-time grid world of foraging, socially interacting agents.
 *
 * Driven externally: reset() once, then step() until terminated. Each step runs
 * movement (phase 1), social interactions (phase 2), alliance bonus and health
 * decay, then encodes observations and metrics. Phases are strictly sequential and
 * id-ordered; a fixed seed and action sequence always reproduce the same trajectory.
 *
 * Not thread-safe. reset/step must not be called concurrently.
 */
class World {
public:
    // Throws std::invalid_argument if the config is invalid.
    explicit World(const WorldConfig& config);

    // =================================================================
    // EPISODE CONTROL
    // =================================================================

    // Rebuilds all agents, food, obstacles and alliances. Without a seed a fresh one
    // is drawn from std::random_device.
    ResetResult reset(std::optional<uint32_t> seed = std::nullopt);

    /**
     * Advances one step.
     *
     * @param actions One code in [0, 8] per agent, indexed by agent id.
     * @throws std::invalid_argument on wrong length or out-of-range code.
     * @throws std::logic_error before the first reset() or after termination.
     * Validation happens before any state changes.
     */
    StepResult step(const std::vector<int>& actions);

    bool isTerminated() const;
    bool hasEpisode() const { return hasEpisode_; }

    // =================================================================
    // QUERIES
    // =================================================================

    std::vector<Observation> observe() const;
    WorldSnapshot snapshot() const;
    StepInfo currentInfo() const;
    std::vector<Personality::EnumType> personalities() const;

    const WorldConfig& getConfig() const { return config_; }
    uint32_t getSeed() const { return seed_; }

    // Direct state access. Intended for scenario setup in tests and tools; the
    // step phases are the only mutation path during normal runs.
    WorldData& getData() { return data_; }
    const WorldData& getData() const { return data_; }

private:
    std::vector<Action> validateActions(const std::vector<int>& actions) const;

    WorldConfig config_;
    WorldData data_;
    std::mt19937 rng_;
    uint32_t seed_ = 0;
    bool hasEpisode_ = false;

    MovementResolver movementResolver_;
    SocialResolver socialResolver_;
};

} // namespace EcoSim
