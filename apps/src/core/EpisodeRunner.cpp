#include "EpisodeRunner.h"

#include "LoggingChannels.h"
#include "policy/RandomPolicy.h"

#include <numeric>
#include <random>
#include <stdexcept>

namespace EcoSim {

namespace {
const RunnerConfig& validated(const RunnerConfig& config)
{
    config.validate();
    return config;
}
} // namespace

EpisodeRunner::EpisodeRunner(
    const RunnerConfig& config,
    std::unique_ptr<AgentPolicy> policy,
    TelemetryPublisher telemetry,
    EpisodeHistoryRepository history)
    : config_(validated(config)),
      world_(config_.world),
      policy_(std::move(policy)),
      telemetry_(std::move(telemetry)),
      history_(std::move(history))
{
    if (!policy_) {
        throw std::invalid_argument("EpisodeRunner requires a policy");
    }
}

std::optional<uint32_t> EpisodeRunner::episodeSeed(int episodeIndex) const
{
    if (!config_.seed) {
        return std::nullopt;
    }
    return *config_.seed + static_cast<uint32_t>(episodeIndex);
}

uint32_t EpisodeRunner::policySeed(const RunnerConfig& config)
{
    if (config.seed) {
        return *config.seed;
    }
    std::random_device device;
    return device();
}

std::unique_ptr<AgentPolicy> EpisodeRunner::createPolicy(const PolicyConfig& config, uint32_t seed)
{
    if (config.kind == "random") {
        return std::make_unique<RandomPolicy>(seed);
    }
    throw std::invalid_argument("Unknown policy kind '" + config.kind + "'");
}

RunResults EpisodeRunner::run()
{
    RunResults results;
    LOG_INFO(
        Runner,
        "Starting {} episode(s) with policy '{}' ({} agents, grid {}x{})",
        config_.episodes,
        policy_->name(),
        config_.world.numAgents,
        config_.world.gridSize,
        config_.world.gridSize);

    for (int episode = 0; episode < config_.episodes; ++episode) {
        if (stopRequested_) {
            LOG_WARN(Runner, "Stop requested, ending after {} episode(s)", episode);
            results.stoppedEarly = true;
            break;
        }
        results.summaries.push_back(runEpisode(episode));
    }

    results.telemetryPublished = telemetry_.publishedCount();
    results.telemetryFailures = telemetry_.failureCount();
    results.historyFailures = historyFailures_;

    LOG_INFO(
        Runner,
        "Run complete: {} episode(s), {} telemetry message(s) ({} failed)",
        results.summaries.size(),
        results.telemetryPublished,
        results.telemetryFailures);
    return results;
}

EpisodeSummary EpisodeRunner::runEpisode(int episodeIndex)
{
    const int episode = episodeIndex + 1;
    auto reset = world_.reset(episodeSeed(episodeIndex));
    auto observations = std::move(reset.observations);
    const auto personalities = world_.personalities();

    LOG_INFO(Runner, "Episode {}/{} (seed {})", episode, config_.episodes, world_.getSeed());
    const EpisodeStartEvent start = startEvent(episode);
    logPersonalityCounts(start);
    telemetry_.episodeStartedSafely(start);

    double totalReward = 0.0;
    StepInfo info = world_.currentInfo();
    const int maxSteps = config_.world.maxSteps;

    while (!world_.isTerminated()) {
        const auto actions = policy_->selectActions(observations, personalities);
        auto result = world_.step(actions);

        observations = std::move(result.observations);
        info = result.info;
        totalReward += std::accumulate(result.rewards.begin(), result.rewards.end(), 0.0);

        const int step = info.step;
        if (step % config_.progressInterval == 0) {
            logProgress(step, info);
        }
        if (step % config_.telemetryInterval == 0 && telemetry_.enabled()) {
            const EpisodeMetadata meta{
                .episode = episode,
                .step = step,
                .maxSteps = maxSteps,
                .progress = 100.0 * step / maxSteps,
                .totalReward = totalReward,
                .agentType = policy_->name(),
                .explorationRate = policy_->explorationRate(),
            };
            telemetry_.publishSafely(world_.snapshot(), meta);
        }
    }

    auto summary = EpisodeSummary::fromFinalStep(episode, totalReward, info, policy_->name());
    logEpisodeReport(summary);
    telemetry_.episodeCompletedSafely(summary);

    auto stored = history_.store(summary);
    if (stored.isError()) {
        ++historyFailures_;
        LOG_WARN(Runner, "Episode {} not saved: {}", episode, stored.errorValue());
    }
    return summary;
}

EpisodeStartEvent EpisodeRunner::startEvent(int episode) const
{
    EpisodeStartEvent event{
        .episode = episode, .totalEpisodes = config_.episodes, .seed = world_.getSeed()
    };
    for (const auto personality : world_.personalities()) {
        switch (personality) {
            case Personality::EnumType::Cooperative:
                ++event.cooperative;
                break;
            case Personality::EnumType::Aggressive:
                ++event.aggressive;
                break;
            case Personality::EnumType::Neutral:
                ++event.neutral;
                break;
        }
    }
    return event;
}

void EpisodeRunner::logPersonalityCounts(const EpisodeStartEvent& start) const
{
    LOG_INFO(
        Runner,
        "Episode {} personalities: {} cooperative, {} aggressive, {} neutral",
        start.episode,
        start.cooperative,
        start.aggressive,
        start.neutral);
}

void EpisodeRunner::logProgress(int step, const StepInfo& info) const
{
    LOG_INFO(
        Runner,
        "Step {:3d} | survival {:.1f}% | alliances {} | cooperations {} | thefts {}",
        step,
        info.survivalRate * 100.0,
        info.numAlliances,
        info.cooperationEvents,
        info.theftEvents);
}

void EpisodeRunner::logEpisodeReport(const EpisodeSummary& summary) const
{
    const auto& info = summary.finalInfo;
    LOG_INFO(
        Runner,
        "Episode {} complete: reward {:.1f}, survival {:.2f}%, food {}, cooperations {}, "
        "thefts {}, alliances {}, avg health {:.1f}",
        summary.episode,
        summary.totalReward,
        info.survivalRate * 100.0,
        info.totalFoodCollected,
        info.cooperationEvents,
        info.theftEvents,
        info.numAlliances,
        info.avgHealth);
    LOG_INFO(
        Runner,
        "Personality mean scores: cooperative {:.2f}, aggressive {:.2f}, neutral {:.2f}",
        info.personalityScores.cooperative,
        info.personalityScores.aggressive,
        info.personalityScores.neutral);
}

} // namespace EcoSim
