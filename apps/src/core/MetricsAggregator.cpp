#include "MetricsAggregator.h"

#include "LoggingChannels.h"

#include <nlohmann/json.hpp>

namespace EcoSim {

StepInfo MetricsAggregator::compute(const WorldData& data)
{
    StepInfo info;
    info.step = data.step;
    info.cooperationEvents = data.counters.cooperationEvents;
    info.theftEvents = data.counters.theftEvents;
    info.allianceFormations = data.counters.allianceFormations;
    info.numAlliances = static_cast<int>(data.alliances.size());

    if (data.agents.empty()) {
        return info;
    }

    int scored = 0;
    int totalScore = 0;
    double totalHealth = 0.0;
    for (const Agent& agent : data.agents) {
        if (agent.score > 0) ++scored;
        totalScore += agent.score;
        totalHealth += agent.health;
    }

    const double count = static_cast<double>(data.agents.size());
    info.survivalRate = scored / count;
    info.avgScore = totalScore / count;
    info.totalFoodCollected = totalScore;
    info.avgHealth = totalHealth / count;

    info.personalityScores.cooperative = meanScore(data, Personality::EnumType::Cooperative);
    info.personalityScores.aggressive = meanScore(data, Personality::EnumType::Aggressive);
    info.personalityScores.neutral = meanScore(data, Personality::EnumType::Neutral);

    LOG_TRACE(
        Metrics,
        "Step {}: survival {:.3f}, avg score {:.3f}, avg health {:.2f}",
        info.step,
        info.survivalRate,
        info.avgScore,
        info.avgHealth);
    return info;
}

double MetricsAggregator::meanScore(const WorldData& data, Personality::EnumType personality)
{
    int members = 0;
    int total = 0;
    for (const Agent& agent : data.agents) {
        if (agent.personality == personality) {
            ++members;
            total += agent.score;
        }
    }
    return members == 0 ? 0.0 : static_cast<double>(total) / members;
}

void to_json(nlohmann::json& j, const PersonalityScores& scores)
{
    j = nlohmann::json{
        { "cooperative", scores.cooperative },
        { "aggressive", scores.aggressive },
        { "neutral", scores.neutral },
    };
}

void from_json(const nlohmann::json& j, PersonalityScores& scores)
{
    scores.cooperative = j.value("cooperative", 0.0);
    scores.aggressive = j.value("aggressive", 0.0);
    scores.neutral = j.value("neutral", 0.0);
}

void to_json(nlohmann::json& j, const StepInfo& info)
{
    j = nlohmann::json{
        { "step", info.step },
        { "survival_rate", info.survivalRate },
        { "avg_score", info.avgScore },
        { "total_food_collected", info.totalFoodCollected },
        { "cooperation_events", info.cooperationEvents },
        { "theft_events", info.theftEvents },
        { "alliance_formations", info.allianceFormations },
        { "num_alliances", info.numAlliances },
        { "avg_health", info.avgHealth },
        { "personality_scores", info.personalityScores },
    };
}

void from_json(const nlohmann::json& j, StepInfo& info)
{
    info.step = j.value("step", 0);
    info.survivalRate = j.value("survival_rate", 0.0);
    info.avgScore = j.value("avg_score", 0.0);
    info.totalFoodCollected = j.value("total_food_collected", 0);
    info.cooperationEvents = j.value("cooperation_events", 0);
    info.theftEvents = j.value("theft_events", 0);
    info.allianceFormations = j.value("alliance_formations", 0);
    info.numAlliances = j.value("num_alliances", 0);
    info.avgHealth = j.value("avg_health", 0.0);
    if (j.contains("personality_scores")) {
        info.personalityScores = j.at("personality_scores").get<PersonalityScores>();
    }
}

} // namespace EcoSim
