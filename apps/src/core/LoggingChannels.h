#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <cassert>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace EcoSim {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel {
    Alliance,
    Encoder,
    Metrics,
    Movement,
    Persistence,
    Policy,
    Runner,
    Social,
    Telemetry,
    World
};

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Alliance:
            return "alliance";
        case LogChannel::Encoder:
            return "encoder";
        case LogChannel::Metrics:
            return "metrics";
        case LogChannel::Movement:
            return "movement";
        case LogChannel::Persistence:
            return "persistence";
        case LogChannel::Policy:
            return "policy";
        case LogChannel::Runner:
            return "runner";
        case LogChannel::Social:
            return "social";
        case LogChannel::Telemetry:
            return "telemetry";
        case LogChannel::World:
            return "world";
    }
    assert(false && "Unhandled LogChannel in switch");
    return "";
}

/**
 * @brief Centralized logging channel management for fine-grained log filtering.
 *
 * Provides named loggers for the engine phases and the driver-side collaborators,
 * so a single phase (e.g. social interactions) can be traced without flooding
 * the output with per-step movement noise.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Default log level for console output
     * @param fileLevel Default log level for file output
     * @param componentName Component name for log pattern (e.g., "cli", "tests")
     * @param consoleToStderr Send console output to stderr instead of stdout
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Initialize the logging system from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath> if not found.
     * @return true if config was applied, false if already initialized
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default");

    /**
     * @brief Get a specific channel logger.
     */
    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channels from a specification string.
     * @param spec Format: "channel:level,channel2:level2" or "*:level" for all
     * Examples:
     *   "social:trace,movement:debug" - Set social to trace, movement to debug
     *   "*:error" - Set all channels to error
     *   "*:off,alliance:trace" - Disable all except alliance at trace level
     */
    static void configureFromString(const std::string& spec);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    /**
     * @brief Parse a log level string to enum. Unknown strings map to info.
     */
    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

private:
    static void createLogger(
        const std::string& name,
        const std::vector<spdlog::sink_ptr>& sinks,
        spdlog::level::level_enum level);

    static void createChannelLoggers(spdlog::level::level_enum level);

    static void installDefaultLogger(
        spdlog::level::level_enum consoleLevel,
        spdlog::level::level_enum fileLevel,
        const std::string& componentName,
        bool consoleToStderr);

    /**
     * @brief Load JSON config from file, with .local override support.
     * Creates default config if file doesn't exist. Falls back to built-in
     * defaults when the file cannot be read or parsed.
     */
    static nlohmann::json loadConfigFile(const std::string& configPath);

    static nlohmann::json defaultConfig();

    static bool createDefaultConfigFile(const std::string& path);

    static void applyConfig(const nlohmann::json& config, const std::string& componentName);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// clang-format off
#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::EcoSim::LoggingChannels::get(::EcoSim::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::EcoSim::LoggingChannels::get(::EcoSim::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::EcoSim::LoggingChannels::get(::EcoSim::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::EcoSim::LoggingChannels::get(::EcoSim::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::EcoSim::LoggingChannels::get(::EcoSim::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)
// clang-format on

} // namespace EcoSim
