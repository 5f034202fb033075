#pragma once

#include "SimulationRules.h"
#include <nlohmann/json_fwd.hpp>

namespace EcoSim {

/**
 * Construction parameters for a World. Missing JSON keys keep their defaults.
 */
struct WorldConfig {
    int gridSize = 20;
    int numAgents = 100;
    int numFood = 30;
    int numObstacles = 50;
    int maxSteps = Rules::kDefaultMaxSteps;

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

void from_json(const nlohmann::json& j, WorldConfig& config);
void to_json(nlohmann::json& j, const WorldConfig& config);

} // namespace EcoSim
