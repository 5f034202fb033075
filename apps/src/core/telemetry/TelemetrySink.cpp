#include "TelemetrySink.h"

#include "core/LoggingChannels.h"

#include <nlohmann/json.hpp>

namespace EcoSim {

void to_json(nlohmann::json& j, const EpisodeMetadata& meta)
{
    j = nlohmann::json{
        { "episode", meta.episode },
        { "step", meta.step },
        { "max_steps", meta.maxSteps },
        { "progress", meta.progress },
        { "total_reward", meta.totalReward },
        { "agent_type", meta.agentType },
        { "epsilon", meta.explorationRate },
    };
}

void from_json(const nlohmann::json& j, EpisodeMetadata& meta)
{
    meta.episode = j.value("episode", 0);
    meta.step = j.value("step", 0);
    meta.maxSteps = j.value("max_steps", 0);
    meta.progress = j.value("progress", 0.0);
    meta.totalReward = j.value("total_reward", 0.0);
    meta.agentType = j.value("agent_type", std::string{});
    meta.explorationRate = j.value("epsilon", 0.0);
}

void to_json(nlohmann::json& j, const EpisodeStartEvent& event)
{
    j = nlohmann::json{
        { "event", "episode_start" },
        { "episode", event.episode },
        { "total_episodes", event.totalEpisodes },
        { "seed", event.seed },
        { "personalities",
          { { "cooperative", event.cooperative },
            { "aggressive", event.aggressive },
            { "neutral", event.neutral } } },
    };
}

void from_json(const nlohmann::json& j, EpisodeStartEvent& event)
{
    event.episode = j.value("episode", 0);
    event.totalEpisodes = j.value("total_episodes", 0);
    event.seed = j.value("seed", uint32_t{ 0 });
    const auto personalities = j.value("personalities", nlohmann::json::object());
    event.cooperative = personalities.value("cooperative", 0);
    event.aggressive = personalities.value("aggressive", 0);
    event.neutral = personalities.value("neutral", 0);
}

TelemetryPublisher::TelemetryPublisher(std::unique_ptr<TelemetrySink> sink)
    : sink_(std::move(sink))
{}

template <typename Send>
void TelemetryPublisher::deliver(const char* what, int episode, Send&& send) noexcept
{
    if (!sink_) {
        return;
    }

    try {
        auto result = send(*sink_);
        if (result.isError()) {
            ++failures_;
            LOG_WARN(
                Telemetry, "{} failed (episode {}): {}", what, episode, result.errorValue());
            return;
        }
        ++published_;
    }
    catch (const std::exception& e) {
        ++failures_;
        LOG_WARN(Telemetry, "{} threw (episode {}): {}", what, episode, e.what());
    }
    catch (...) {
        ++failures_;
        LOG_WARN(Telemetry, "{} threw a non-standard exception (episode {})", what, episode);
    }
}

void TelemetryPublisher::episodeStartedSafely(const EpisodeStartEvent& event) noexcept
{
    deliver("Episode start", event.episode, [&](TelemetrySink& sink) {
        return sink.episodeStarted(event);
    });
}

void TelemetryPublisher::publishSafely(
    const WorldSnapshot& snapshot, const EpisodeMetadata& meta) noexcept
{
    deliver("Snapshot", meta.episode, [&](TelemetrySink& sink) {
        return sink.publish(snapshot, meta);
    });
}

void TelemetryPublisher::episodeCompletedSafely(const EpisodeSummary& summary) noexcept
{
    deliver("Episode summary", summary.episode, [&](TelemetrySink& sink) {
        return sink.episodeCompleted(summary);
    });
}

} // namespace EcoSim
