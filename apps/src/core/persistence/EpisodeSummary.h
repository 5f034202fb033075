#pragma once

#include "core/MetricsAggregator.h"

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <zpp_bits.h>

namespace EcoSim {

/**
 * End-of-episode record. JSON is flat: the final step info keys sit beside
 * episode, total_reward, agent_type and timestamp.
 */
struct EpisodeSummary {
    int episode = 0; // 1-based.
    double totalReward = 0.0;
    StepInfo finalInfo;
    std::string agentType;
    std::string timestamp; // ISO-8601, UTC.

    using serialize = zpp::bits::members<5>;

    static EpisodeSummary fromFinalStep(
        int episode, double totalReward, const StepInfo& info, const std::string& agentType);
};

// Current UTC time as YYYY-MM-DDTHH:MM:SSZ.
std::string currentIsoTimestamp();

void to_json(nlohmann::json& j, const EpisodeSummary& summary);
void from_json(const nlohmann::json& j, EpisodeSummary& summary);

} // namespace EcoSim
