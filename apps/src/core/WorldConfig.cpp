#include "WorldConfig.h"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace EcoSim {

void WorldConfig::validate() const
{
    if (gridSize <= 0) {
        throw std::invalid_argument("gridSize must be > 0, got " + std::to_string(gridSize));
    }
    if (numAgents <= 0) {
        throw std::invalid_argument("numAgents must be > 0, got " + std::to_string(numAgents));
    }
    if (numFood < 0) {
        throw std::invalid_argument("numFood must be >= 0, got " + std::to_string(numFood));
    }
    if (numObstacles < 0) {
        throw std::invalid_argument(
            "numObstacles must be >= 0, got " + std::to_string(numObstacles));
    }
    if (maxSteps <= 0) {
        throw std::invalid_argument("maxSteps must be > 0, got " + std::to_string(maxSteps));
    }
}

void from_json(const nlohmann::json& j, WorldConfig& config)
{
    const WorldConfig defaults;
    config.gridSize = j.value("grid_size", defaults.gridSize);
    config.numAgents = j.value("num_agents", defaults.numAgents);
    config.numFood = j.value("num_food", defaults.numFood);
    config.numObstacles = j.value("num_obstacles", defaults.numObstacles);
    config.maxSteps = j.value("max_steps", defaults.maxSteps);
}

void to_json(nlohmann::json& j, const WorldConfig& config)
{
    j = nlohmann::json{
        { "grid_size", config.gridSize },
        { "num_agents", config.numAgents },
        { "num_food", config.numFood },
        { "num_obstacles", config.numObstacles },
        { "max_steps", config.maxSteps },
    };
}

} // namespace EcoSim
