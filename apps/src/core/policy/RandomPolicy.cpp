#include "RandomPolicy.h"

#include "core/LoggingChannels.h"

#include <stdexcept>

namespace EcoSim {

// Weights are indexed by action code 0-8.
RandomPolicy::RandomPolicy(uint32_t seed)
    : rng_(seed),
      cooperative_({ 0.20, 0.15, 0.15, 0.15, 0.15, 0.10, 0.0, 0.05, 0.05 }),
      aggressive_({ 0.10, 0.20, 0.20, 0.20, 0.20, 0.0, 0.10, 0.0, 0.0 }),
      neutral_({ 0.20, 0.20, 0.20, 0.20, 0.20, 0.0, 0.0, 0.0, 0.0 })
{
    LOG_DEBUG(Policy, "RandomPolicy seeded with {}", seed);
}

int RandomPolicy::sample(Personality::EnumType personality)
{
    switch (personality) {
        case Personality::EnumType::Cooperative:
            return cooperative_(rng_);
        case Personality::EnumType::Aggressive:
            return aggressive_(rng_);
        case Personality::EnumType::Neutral:
            return neutral_(rng_);
    }
    return 0;
}

std::vector<int> RandomPolicy::selectActions(
    const std::vector<Observation>& observations,
    const std::vector<Personality::EnumType>& personalities)
{
    if (observations.size() != personalities.size()) {
        throw std::invalid_argument("RandomPolicy: observation and personality counts differ");
    }

    std::vector<int> actions;
    actions.reserve(personalities.size());
    for (Personality::EnumType personality : personalities) {
        actions.push_back(sample(personality));
    }
    return actions;
}

} // namespace EcoSim
