#include "FeatureEncoder.h"

#include "Assert.h"
#include "LoggingChannels.h"
#include "SimulationRules.h"
#include "SpatialQuery.h"

namespace EcoSim {

std::vector<Observation> FeatureEncoder::encode(const WorldData& data)
{
    std::vector<Observation> observations;
    observations.reserve(data.agents.size());

    for (const Agent& agent : data.agents) {
        observations.push_back(encodeAgent(data, agent));
    }

    LOG_TRACE(Encoder, "Encoded {} observations at step {}", observations.size(), data.step);
    return observations;
}

Vector2i FeatureEncoder::nearestFoodDelta(const WorldData& data, Vector2i origin)
{
    if (data.food.empty()) {
        return Vector2i{ 0, 0 };
    }

    Vector2i best = data.food.front() - origin;
    for (const Vector2i& cell : data.food) {
        const Vector2i delta = cell - origin;
        if (delta.lengthSquared() < best.lengthSquared()) {
            best = delta;
        }
    }
    return best;
}

Observation FeatureEncoder::encodeAgent(const WorldData& data, const Agent& agent)
{
    Observation obs;
    obs.reserve(kObservationSize);

    obs.push_back(static_cast<float>(agent.position.x));
    obs.push_back(static_cast<float>(agent.position.y));

    obs.push_back(static_cast<float>(agent.health / Rules::kMaxHealth));
    obs.push_back(static_cast<float>(agent.foodInventory));

    const Vector2i food = nearestFoodDelta(data, agent.position);
    obs.push_back(static_cast<float>(food.x));
    obs.push_back(static_cast<float>(food.y));

    for (Personality::EnumType type : Personality::getAllTypes()) {
        obs.push_back(agent.personality == type ? 1.0f : 0.0f);
    }

    obs.push_back(agent.isAllied() ? 1.0f : 0.0f);

    const std::vector<int> nearby =
        SpatialQuery::neighborsWithin(data.agents, agent.id, Rules::kObservationRadius);
    int cooperative = 0;
    int aggressive = 0;
    bool help = false;
    bool foodSignal = false;
    bool danger = false;
    for (int id : nearby) {
        const Agent& other = data.agents[id];
        if (other.personality == Personality::EnumType::Cooperative) ++cooperative;
        if (other.personality == Personality::EnumType::Aggressive) ++aggressive;
        help = help || other.signal == CommunicationSignal::Help;
        foodSignal = foodSignal || other.signal == CommunicationSignal::Food;
        danger = danger || other.signal == CommunicationSignal::Danger;
    }
    obs.push_back(static_cast<float>(nearby.size()));
    obs.push_back(static_cast<float>(cooperative));
    obs.push_back(static_cast<float>(aggressive));

    obs.push_back(help ? 1.0f : 0.0f);
    obs.push_back(foodSignal ? 1.0f : 0.0f);
    obs.push_back(danger ? 1.0f : 0.0f);

    for (int dx = -1; dx <= 1; ++dx) {
        for (int dy = -1; dy <= 1; ++dy) {
            const Vector2i cell = agent.position + Vector2i{ dx, dy };
            obs.push_back(data.isObstacle(cell) ? 1.0f : 0.0f);
        }
    }

    obs.insert(obs.end(), kReservedSize, 0.0f);

    ECOSIM_ASSERT(
        obs.size() == kObservationSize,
        "Observation has {} features, expected {}",
        obs.size(),
        kObservationSize);
    return obs;
}

} // namespace EcoSim
