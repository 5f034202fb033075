#include "EpisodeSummary.h"

#include <array>
#include <chrono>
#include <ctime>
#include <nlohmann/json.hpp>

namespace EcoSim {

EpisodeSummary EpisodeSummary::fromFinalStep(
    int episode, double totalReward, const StepInfo& info, const std::string& agentType)
{
    return EpisodeSummary{
        .episode = episode,
        .totalReward = totalReward,
        .finalInfo = info,
        .agentType = agentType,
        .timestamp = currentIsoTimestamp(),
    };
}

std::string currentIsoTimestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);

    std::array<char, 32> buffer{};
    const size_t written = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer.data(), written);
}

void to_json(nlohmann::json& j, const EpisodeSummary& summary)
{
    j = summary.finalInfo;
    j["episode"] = summary.episode;
    j["total_reward"] = summary.totalReward;
    j["agent_type"] = summary.agentType;
    j["timestamp"] = summary.timestamp;
}

void from_json(const nlohmann::json& j, EpisodeSummary& summary)
{
    summary.finalInfo = j.get<StepInfo>();
    summary.episode = j.at("episode").get<int>();
    summary.totalReward = j.value("total_reward", 0.0);
    summary.agentType = j.value("agent_type", std::string{});
    summary.timestamp = j.value("timestamp", std::string{});
}

} // namespace EcoSim
