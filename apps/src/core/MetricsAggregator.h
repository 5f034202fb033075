#pragma once

#include "WorldData.h"

#include <nlohmann/json_fwd.hpp>
#include <zpp_bits.h>

namespace EcoSim {

struct PersonalityScores {
    double cooperative = 0.0;
    double aggressive = 0.0;
    double neutral = 0.0;

    using serialize = zpp::bits::members<3>;
};

/**
 * Summary statistics attached to every step result.
 */
struct StepInfo {
    int step = 0;
    double survivalRate = 0.0; // Fraction of agents with score > 0.
    double avgScore = 0.0;
    int totalFoodCollected = 0; // Sum of scores.
    int cooperationEvents = 0;
    int theftEvents = 0;
    int allianceFormations = 0;
    int numAlliances = 0;
    double avgHealth = 0.0;
    PersonalityScores personalityScores; // Empty groups report 0.0.

    using serialize = zpp::bits::members<10>;
};

class MetricsAggregator {
public:
    static StepInfo compute(const WorldData& data);

    // Mean score of one personality group; 0.0 when the group has no agents.
    static double meanScore(const WorldData& data, Personality::EnumType personality);
};

void to_json(nlohmann::json& j, const PersonalityScores& scores);
void from_json(const nlohmann::json& j, PersonalityScores& scores);
void to_json(nlohmann::json& j, const StepInfo& info);
void from_json(const nlohmann::json& j, StepInfo& info);

} // namespace EcoSim
