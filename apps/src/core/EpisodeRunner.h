#pragma once

#include "RunnerConfig.h"
#include "World.h"
#include "persistence/EpisodeHistoryRepository.h"
#include "policy/AgentPolicy.h"
#include "telemetry/TelemetrySink.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

namespace EcoSim {

/**
 * Results from a completed run.
 */
struct RunResults {
    std::vector<EpisodeSummary> summaries;
    uint64_t telemetryPublished = 0;
    uint64_t telemetryFailures = 0;
    int historyFailures = 0;
    bool stoppedEarly = false;
};

/**
 * Drives a World through a sequence of episodes with a decision policy.
 *
 * Per episode: reset and announce the episode to telemetry, ask the policy for actions
 * until the world terminates, publish a snapshot every telemetryInterval steps, then
 * send and store the episode summary.
 * Telemetry and history failures are logged and counted; they never end a run.
 */
class EpisodeRunner {
public:
    // Throws std::invalid_argument if the config is invalid or the policy is null.
    EpisodeRunner(
        const RunnerConfig& config,
        std::unique_ptr<AgentPolicy> policy,
        TelemetryPublisher telemetry,
        EpisodeHistoryRepository history);

    RunResults run();

    // Runs one episode. episodeIndex is 0-based; summaries are numbered from 1.
    EpisodeSummary runEpisode(int episodeIndex);

    // Finishes the current episode and stops (safe to call from a signal handler).
    void requestStop() { stopRequested_ = true; }

    const World& world() const { return world_; }
    const EpisodeHistoryRepository& history() const { return history_; }
    const TelemetryPublisher& telemetry() const { return telemetry_; }

    // Seed passed to World::reset for an episode; nullopt when unseeded.
    std::optional<uint32_t> episodeSeed(int episodeIndex) const;

    // Policy seed derived from the run seed, or from std::random_device when unseeded.
    static uint32_t policySeed(const RunnerConfig& config);

    // Throws std::invalid_argument for an unknown policy kind.
    static std::unique_ptr<AgentPolicy> createPolicy(const PolicyConfig& config, uint32_t seed);

private:
    RunnerConfig config_;
    World world_;
    std::unique_ptr<AgentPolicy> policy_;
    TelemetryPublisher telemetry_;
    EpisodeHistoryRepository history_;
    std::atomic<bool> stopRequested_{ false };
    int historyFailures_ = 0;

    EpisodeStartEvent startEvent(int episode) const;
    void logPersonalityCounts(const EpisodeStartEvent& start) const;
    void logProgress(int step, const StepInfo& info) const;
    void logEpisodeReport(const EpisodeSummary& summary) const;
};

} // namespace EcoSim
