#include "core/ConfigLoader.h"
#include "core/EpisodeRunner.h"
#include "core/LoggingChannels.h"
#include "core/RunnerConfig.h"
#include "core/persistence/EpisodeHistoryRepository.h"
#include "core/telemetry/FileTelemetrySink.h"
#include <args.hxx>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

using namespace EcoSim;

namespace {

constexpr const char* kConfigFile = "ecosim.json";

std::optional<RunnerConfig> loadRunnerConfig()
{
    auto result = ConfigLoader::loadOrDefault<RunnerConfig>(kConfigFile);
    if (result.isError()) {
        SLOG_ERROR("{}", result.errorValue());
        return std::nullopt;
    }
    return result.value();
}

std::unique_ptr<TelemetrySink> createTelemetrySink(const RunnerConfig& config)
{
    if (config.telemetryPath.empty()) {
        return nullptr;
    }

    auto format = FileTelemetrySink::parseFormat(config.telemetryFormat);
    if (format.isError()) {
        throw std::invalid_argument(format.errorValue());
    }
    return std::make_unique<FileTelemetrySink>(config.telemetryPath, format.value());
}

EpisodeHistoryRepository createHistory(const RunnerConfig& config)
{
    if (config.historyPath.empty()) {
        return EpisodeHistoryRepository(config.historyCapacity);
    }
    return EpisodeHistoryRepository(
        std::filesystem::path(config.historyPath), config.historyCapacity);
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "EcoSim episode driver",
        "Runs multi-agent social simulation episodes with a random exploration policy.\n"
        "Settings come from ecosim.json (see --config-dir); flags override the file.");

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for ecosim.json", { "config-dir" });
    args::ValueFlag<std::string> logConfig(
        parser, "file", "Logging config file (default: logging-config.json)", { "log-config" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "spec",
        "Per-channel log levels, e.g. 'social:trace,*:warn'",
        { "log-channels" });

    args::ValueFlag<int> episodes(parser, "count", "Number of episodes", { "episodes" });
    args::ValueFlag<uint32_t> seed(parser, "seed", "Base seed for reproducible runs", { "seed" });
    args::ValueFlag<int> gridSize(parser, "size", "Grid side length", { "grid-size" });
    args::ValueFlag<int> agents(parser, "count", "Number of agents", { "agents" });
    args::ValueFlag<int> food(parser, "count", "Number of food items", { "food" });
    args::ValueFlag<int> obstacles(parser, "count", "Number of obstacles", { "obstacles" });
    args::ValueFlag<std::string> historyDb(
        parser, "path", "SQLite file for episode history (default: in memory)", { "history-db" });
    args::ValueFlag<std::string> telemetryPath(
        parser, "path", "Append world snapshots to this file", { "telemetry" });
    args::ValueFlag<std::string> telemetryFormat(
        parser, "format", "Telemetry format: json or binary", { "telemetry-format" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }
    catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Default console logging goes to stderr so stdout carries only the JSON result.
    if (logConfig) {
        LoggingChannels::initializeFromConfig(args::get(logConfig), "cli");
    }
    else {
        LoggingChannels::initialize(spdlog::level::info, spdlog::level::debug, "cli", true);
    }
    if (verbose) {
        LoggingChannels::configureFromString("*:debug");
    }
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }
    auto loaded = loadRunnerConfig();
    if (!loaded) {
        return 1;
    }
    RunnerConfig config = *loaded;

    if (episodes) {
        config.episodes = args::get(episodes);
    }
    if (seed) {
        config.seed = args::get(seed);
    }
    if (gridSize) {
        config.world.gridSize = args::get(gridSize);
    }
    if (agents) {
        config.world.numAgents = args::get(agents);
    }
    if (food) {
        config.world.numFood = args::get(food);
    }
    if (obstacles) {
        config.world.numObstacles = args::get(obstacles);
    }
    if (historyDb) {
        config.historyPath = args::get(historyDb);
    }
    if (telemetryPath) {
        config.telemetryPath = args::get(telemetryPath);
    }
    if (telemetryFormat) {
        config.telemetryFormat = args::get(telemetryFormat);
    }

    std::unique_ptr<EpisodeRunner> runner;
    try {
        config.validate();
        auto policy = EpisodeRunner::createPolicy(config.policy, EpisodeRunner::policySeed(config));
        runner = std::make_unique<EpisodeRunner>(
            config,
            std::move(policy),
            TelemetryPublisher(createTelemetrySink(config)),
            createHistory(config));
    }
    catch (const std::exception& e) {
        SLOG_ERROR("Configuration error: {}", e.what());
        return 1;
    }

    // Install SIGINT handler for graceful shutdown.
    // Note: Must use C-style function pointer, not lambda.
    static EpisodeRunner* g_runner = nullptr;
    static auto sigintHandler = +[](int) -> void {
        if (g_runner) {
            g_runner->requestStop();
        }
    };

    g_runner = runner.get();
    auto oldHandler = std::signal(SIGINT, sigintHandler);

    auto results = runner->run();

    std::signal(SIGINT, oldHandler);
    g_runner = nullptr;

    nlohmann::json output{
        { "episodes", results.summaries },
        { "telemetry_published", results.telemetryPublished },
        { "telemetry_failures", results.telemetryFailures },
        { "history_failures", results.historyFailures },
        { "stopped_early", results.stoppedEarly },
    };
    std::cout << output.dump(2) << std::endl;

    return 0;
}
