#include "MovementResolver.h"

#include "LoggingChannels.h"
#include "SimulationRules.h"

#include <algorithm>

namespace EcoSim {

MovementResolver::Stats MovementResolver::resolve(
    WorldData& data,
    const std::vector<Action>& actions,
    std::vector<double>& rewards,
    std::mt19937& rng) const
{
    Stats stats;

    for (Agent& agent : data.agents) {
        agent.signal = CommunicationSignal::None;

        const Action action = actions[agent.id];
        if (!isMovement(action)) {
            continue;
        }

        const Vector2i target = data.clampToGrid(agent.position + movementDelta(action));

        if (data.isObstacle(target)) {
            agent.health = std::max(0.0, agent.health - Rules::kObstacleDamage);
            rewards[agent.id] = Rules::kObstaclePenalty;
            ++stats.collisions;
            LOG_TRACE(Movement, "Agent {} bumped obstacle at {}", agent.id, target);
            continue;
        }

        agent.position = target;
        rewards[agent.id] = Rules::kStepCost;
        ++stats.moves;

        if (consumeFoodAt(data, target, rng)) {
            agent.foodInventory += 1;
            agent.score += 1;
            agent.health = std::min(Rules::kMaxHealth, agent.health + Rules::kFoodHeal);
            rewards[agent.id] = Rules::kFoodReward;
            ++stats.collected;
            LOG_TRACE(
                Movement,
                "Agent {} collected food at {} (inventory {})",
                agent.id,
                target,
                agent.foodInventory);
        }
    }

    return stats;
}

bool MovementResolver::consumeFoodAt(WorldData& data, Vector2i cell, std::mt19937& rng) const
{
    auto it = std::find(data.food.begin(), data.food.end(), cell);
    if (it == data.food.end()) {
        return false;
    }

    data.food.erase(it);
    data.food.push_back(randomGridCell(rng, data.gridSize));
    return true;
}

} // namespace EcoSim
