#pragma once

#include "core/Result.h"
#include "core/WorldSnapshot.h"
#include "core/persistence/EpisodeSummary.h"

#include <cstdint>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <variant>
#include <zpp_bits.h>

namespace EcoSim {

/**
 * Driver-side context sent alongside each world snapshot.
 */
struct EpisodeMetadata {
    int episode = 0;
    int step = 0;
    int maxSteps = 0;
    double progress = 0.0; // Percent of maxSteps completed.
    double totalReward = 0.0;
    std::string agentType;
    double explorationRate = 0.0;

    using serialize = zpp::bits::members<7>;
};

void to_json(nlohmann::json& j, const EpisodeMetadata& meta);
void from_json(const nlohmann::json& j, EpisodeMetadata& meta);

// Sent once per episode, right after reset.
struct EpisodeStartEvent {
    int episode = 0; // 1-based.
    int totalEpisodes = 0;
    uint32_t seed = 0;
    int cooperative = 0;
    int aggressive = 0;
    int neutral = 0;

    using serialize = zpp::bits::members<6>;
};

// JSON: event "episode_start", personality counts nested under "personalities".
void to_json(nlohmann::json& j, const EpisodeStartEvent& event);
void from_json(const nlohmann::json& j, EpisodeStartEvent& event);

/**
 * Destination for episode telemetry (display bridge, file, socket): one start
 * event, periodic world snapshots, then the final episode summary.
 */
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    virtual Result<std::monostate, std::string> episodeStarted(const EpisodeStartEvent& event) = 0;

    virtual Result<std::monostate, std::string> publish(
        const WorldSnapshot& snapshot, const EpisodeMetadata& meta) = 0;

    virtual Result<std::monostate, std::string> episodeCompleted(
        const EpisodeSummary& summary) = 0;
};

/**
 * Fire-and-forget wrapper around a sink. Error results and anything the sink throws
 * are logged and counted, never rethrown, so a broken display link cannot stop a run.
 * A null sink turns every call into a no-op. Counts cover all three message kinds.
 */
class TelemetryPublisher {
public:
    explicit TelemetryPublisher(std::unique_ptr<TelemetrySink> sink = nullptr);

    void episodeStartedSafely(const EpisodeStartEvent& event) noexcept;
    void publishSafely(const WorldSnapshot& snapshot, const EpisodeMetadata& meta) noexcept;
    void episodeCompletedSafely(const EpisodeSummary& summary) noexcept;

    bool enabled() const { return sink_ != nullptr; }
    uint64_t publishedCount() const { return published_; }
    uint64_t failureCount() const { return failures_; }

private:
    template <typename Send>
    void deliver(const char* what, int episode, Send&& send) noexcept;

    std::unique_ptr<TelemetrySink> sink_;
    uint64_t published_ = 0;
    uint64_t failures_ = 0;
};

} // namespace EcoSim
