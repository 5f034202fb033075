#include "World.h"

#include "Assert.h"
#include "LoggingChannels.h"

#include <array>
#include <stdexcept>
#include <string>

namespace EcoSim {

World::World(const WorldConfig& config) : config_(config)
{
    config_.validate();
    data_.gridSize = config_.gridSize;

    LOG_INFO(
        World,
        "World created: grid {}x{}, {} agents, {} food, {} obstacles, {} steps",
        config_.gridSize,
        config_.gridSize,
        config_.numAgents,
        config_.numFood,
        config_.numObstacles,
        config_.maxSteps);
}

ResetResult World::reset(std::optional<uint32_t> seed)
{
    seed_ = seed.has_value() ? seed.value() : std::random_device{}();
    rng_.seed(seed_);

    data_ = WorldData{};
    data_.gridSize = config_.gridSize;

    std::discrete_distribution<int> personalityDist(
        Personality::kSpawnWeights.begin(), Personality::kSpawnWeights.end());

    data_.agents.reserve(config_.numAgents);
    for (int i = 0; i < config_.numAgents; ++i) {
        Agent agent;
        agent.id = i;
        agent.personality = static_cast<Personality::EnumType>(personalityDist(rng_));
        agent.position = randomGridCell(rng_, config_.gridSize);
        data_.agents.push_back(agent);
    }

    data_.food.reserve(config_.numFood);
    for (int i = 0; i < config_.numFood; ++i) {
        data_.food.push_back(randomGridCell(rng_, config_.gridSize));
    }

    for (int i = 0; i < config_.numObstacles; ++i) {
        data_.obstacles.insert(randomGridCell(rng_, config_.gridSize));
    }

    hasEpisode_ = true;

    std::array<int, Personality::kCount> counts{};
    for (const Agent& agent : data_.agents) {
        ++counts[static_cast<int>(agent.personality)];
    }
    LOG_INFO(
        World,
        "Reset with seed {}: {} cooperative, {} aggressive, {} neutral, {} obstacle cells",
        seed_,
        counts[0],
        counts[1],
        counts[2],
        data_.obstacles.size());

    return ResetResult{ .observations = observe() };
}

std::vector<Action> World::validateActions(const std::vector<int>& actions) const
{
    if (!hasEpisode_) {
        throw std::logic_error("step() called before reset()");
    }
    if (isTerminated()) {
        throw std::logic_error(
            "Episode already terminated at step " + std::to_string(data_.step)
            + "; call reset() first");
    }
    if (actions.size() != data_.agents.size()) {
        throw std::invalid_argument(
            "Expected " + std::to_string(data_.agents.size()) + " actions, got "
            + std::to_string(actions.size()));
    }

    std::vector<Action> parsed;
    parsed.reserve(actions.size());
    for (size_t i = 0; i < actions.size(); ++i) {
        const auto action = actionFromCode(actions[i]);
        if (!action.has_value()) {
            throw std::invalid_argument(
                "Action " + std::to_string(actions[i]) + " for agent " + std::to_string(i)
                + " is outside [0, 8]");
        }
        parsed.push_back(action.value());
    }
    return parsed;
}

StepResult World::step(const std::vector<int>& actionCodes)
{
    const std::vector<Action> actions = validateActions(actionCodes);

    StepResult result;
    result.rewards.assign(data_.agents.size(), 0.0);
    const size_t foodBefore = data_.food.size();

    const auto movement = movementResolver_.resolve(data_, actions, result.rewards, rng_);
    const auto social = socialResolver_.resolve(data_, actions, result.rewards);
    socialResolver_.applyUpkeep(data_);

    ECOSIM_ASSERT(
        data_.alliances.isConsistent(data_.agents), "Alliance membership is out of sync");
    ECOSIM_ASSERT(data_.food.size() == foodBefore, "Every consumed food unit must respawn");

    data_.step += 1;

    result.terminated = isTerminated();
    result.truncated = false;
    result.observations = observe();
    result.info = MetricsAggregator::compute(data_);

    LOG_DEBUG(
        World,
        "Step {}: {} moves, {} collisions, {} collected, {} shares, {} thefts, "
        "{} alliances (+{} joins), {} signals",
        data_.step,
        movement.moves,
        movement.collisions,
        movement.collected,
        social.shares,
        social.thefts,
        social.alliancesCreated,
        social.alliancesJoined,
        social.signals);

    if (result.terminated) {
        LOG_INFO(
            World,
            "Episode terminated at step {} (survival {:.1f}%, {} alliances)",
            data_.step,
            result.info.survivalRate * 100.0,
            result.info.numAlliances);
    }

    return result;
}

bool World::isTerminated() const
{
    return data_.step >= config_.maxSteps;
}

std::vector<Observation> World::observe() const
{
    return FeatureEncoder::encode(data_);
}

WorldSnapshot World::snapshot() const
{
    return WorldSnapshot::capture(data_);
}

StepInfo World::currentInfo() const
{
    return MetricsAggregator::compute(data_);
}

std::vector<Personality::EnumType> World::personalities() const
{
    std::vector<Personality::EnumType> result;
    result.reserve(data_.agents.size());
    for (const Agent& agent : data_.agents) {
        result.push_back(agent.personality);
    }
    return result;
}

} // namespace EcoSim
