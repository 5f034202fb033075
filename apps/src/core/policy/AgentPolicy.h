#pragma once

#include "core/FeatureEncoder.h"
#include "core/Personality.h"

#include <string>
#include <vector>

namespace EcoSim {

/**
 * Decision component: maps the observation batch to one action code per agent.
 *
 * Called once per step by the driver. The engine treats it as a pure function of
 * its inputs and never calls it itself.
 */
class AgentPolicy {
public:
    virtual ~AgentPolicy() = default;

    virtual std::vector<int> selectActions(
        const std::vector<Observation>& observations,
        const std::vector<Personality::EnumType>& personalities) = 0;

    // Label recorded in telemetry and episode history.
    virtual std::string name() const = 0;

    // Probability of acting at random; 1.0 for purely random policies.
    virtual double explorationRate() const { return 1.0; }
};

} // namespace EcoSim
