#include "WorldSnapshot.h"

#include "MetricsAggregator.h"
#include "WorldData.h"

#include <nlohmann/json.hpp>

namespace EcoSim {

WorldSnapshot WorldSnapshot::capture(const WorldData& data)
{
    WorldSnapshot snapshot;
    snapshot.gridSize = data.gridSize;
    snapshot.food = data.food;
    snapshot.obstacles.assign(data.obstacles.begin(), data.obstacles.end());

    const size_t count = data.agents.size();
    snapshot.positions.reserve(count);
    snapshot.scores.reserve(count);
    snapshot.health.reserve(count);
    snapshot.personalities.reserve(count);
    snapshot.alliances.reserve(count);
    snapshot.foodInventory.reserve(count);
    snapshot.signals.reserve(count);

    for (const Agent& agent : data.agents) {
        snapshot.positions.push_back(agent.position);
        snapshot.scores.push_back(agent.score);
        snapshot.health.push_back(agent.health);
        snapshot.personalities.push_back(static_cast<uint8_t>(agent.personality));
        snapshot.alliances.push_back(agent.isAllied() ? agent.allianceId->get() : -1);
        snapshot.foodInventory.push_back(agent.foodInventory);
        snapshot.signals.push_back(static_cast<uint8_t>(agent.signal));
    }

    const StepInfo info = MetricsAggregator::compute(data);
    snapshot.step = data.step;
    snapshot.survivalRate = info.survivalRate;
    snapshot.cooperationEvents = info.cooperationEvents;
    snapshot.theftEvents = info.theftEvents;
    snapshot.numAlliances = info.numAlliances;
    snapshot.avgHealth = info.avgHealth;

    return snapshot;
}

void to_json(nlohmann::json& j, const WorldSnapshot& snapshot)
{
    j = nlohmann::json{
        { "grid_size", snapshot.gridSize },
        { "agents", snapshot.positions },
        { "food", snapshot.food },
        { "obstacles", snapshot.obstacles },
        { "scores", snapshot.scores },
        { "health", snapshot.health },
        { "personalities", snapshot.personalities },
        { "alliances", snapshot.alliances },
        { "food_inventory", snapshot.foodInventory },
        { "communication", snapshot.signals },
        { "steps", snapshot.step },
        { "survival_rate", snapshot.survivalRate },
        { "cooperation_events", snapshot.cooperationEvents },
        { "theft_events", snapshot.theftEvents },
        { "num_alliances", snapshot.numAlliances },
        { "avg_health", snapshot.avgHealth },
    };
}

void from_json(const nlohmann::json& j, WorldSnapshot& snapshot)
{
    j.at("grid_size").get_to(snapshot.gridSize);
    j.at("agents").get_to(snapshot.positions);
    j.at("food").get_to(snapshot.food);
    j.at("obstacles").get_to(snapshot.obstacles);
    j.at("scores").get_to(snapshot.scores);
    j.at("health").get_to(snapshot.health);
    j.at("personalities").get_to(snapshot.personalities);
    j.at("alliances").get_to(snapshot.alliances);
    j.at("food_inventory").get_to(snapshot.foodInventory);
    j.at("communication").get_to(snapshot.signals);
    j.at("steps").get_to(snapshot.step);
    j.at("survival_rate").get_to(snapshot.survivalRate);
    j.at("cooperation_events").get_to(snapshot.cooperationEvents);
    j.at("theft_events").get_to(snapshot.theftEvents);
    j.at("num_alliances").get_to(snapshot.numAlliances);
    j.at("avg_health").get_to(snapshot.avgHealth);
}

std::vector<std::byte> encodeSnapshot(const WorldSnapshot& snapshot)
{
    std::vector<std::byte> bytes;
    zpp::bits::out out(bytes);
    out(snapshot).or_throw();
    return bytes;
}

WorldSnapshot decodeSnapshot(const std::vector<std::byte>& bytes)
{
    WorldSnapshot snapshot;
    zpp::bits::in in(bytes);
    in(snapshot).or_throw();
    return snapshot;
}

} // namespace EcoSim
