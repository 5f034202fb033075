#pragma once

#include "AgentPolicy.h"

#include <cstdint>
#include <random>

namespace EcoSim {

/**
 * Seeded exploration policy with a per-personality action bias.
 *
 *   Cooperative: Stay .20, moves .15 each, Share .10, FormAlliance .05, SignalHelp .05
 *   Aggressive:  Stay .10, moves .20 each, Steal .10
 *   Neutral:     uniform over Stay and the four moves
 */
class RandomPolicy : public AgentPolicy {
public:
    explicit RandomPolicy(uint32_t seed);

    std::vector<int> selectActions(
        const std::vector<Observation>& observations,
        const std::vector<Personality::EnumType>& personalities) override;

    std::string name() const override { return "random"; }

    int sample(Personality::EnumType personality);

private:
    std::mt19937 rng_;
    std::discrete_distribution<int> cooperative_;
    std::discrete_distribution<int> aggressive_;
    std::discrete_distribution<int> neutral_;
};

} // namespace EcoSim
