#include "LoggingChannels.h"
#include "ConfigLoader.h"
#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>

namespace EcoSim {

namespace {
constexpr const char* kLogFile = "ecosim.log";
constexpr const char* kBasePattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";

constexpr std::array<LogChannel, 10> kAllChannels = {
    LogChannel::Alliance, LogChannel::Encoder, LogChannel::Metrics,   LogChannel::Movement,
    LogChannel::Persistence, LogChannel::Policy, LogChannel::Runner, LogChannel::Social,
    LogChannel::Telemetry, LogChannel::World,
};

std::string channelPattern(const std::string& componentName)
{
    return componentName == "default"
        ? kBasePattern
        : "[%H:%M:%S.%e] [" + componentName + "] [%n] [%^%l%$] [%s:%#] %v";
}

std::string defaultLoggerPattern(const std::string& componentName)
{
    return componentName == "default"
        ? "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%^%l%$] [%s:%#] %v";
}

std::string trimmed(const std::string& text)
{
    const size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    return text.substr(first, text.find_last_not_of(" \t") - first + 1);
}

spdlog::sink_ptr makeConsoleSink(bool toStderr)
{
    if (toStderr) {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
}
// Parsed form of logging-config.json. Missing keys keep these defaults.
struct FileSinkConfig {
    bool enabled = true;
    std::string level = "debug";
    std::string path = kLogFile;
    bool truncate = true;
    std::optional<size_t> maxSizeMb; // Rotating sink when set.
    size_t maxFiles = 3;
};

struct ConsoleSinkConfig {
    bool enabled = true;
    std::string level = "info";
};

struct LoggingConfig {
    std::string consoleLevel = "info";
    std::string fileLevel = "debug";
    std::string pattern = kBasePattern;
    int flushIntervalMs = 1000;
    ConsoleSinkConfig console;
    FileSinkConfig file;
    std::map<std::string, std::string> channels;
};

void from_json(const nlohmann::json& j, ConsoleSinkConfig& c)
{
    c.enabled = j.value("enabled", c.enabled);
    c.level = j.value("level", c.level);
}

void from_json(const nlohmann::json& j, FileSinkConfig& c)
{
    c.enabled = j.value("enabled", c.enabled);
    c.level = j.value("level", c.level);
    c.path = j.value("path", c.path);
    c.truncate = j.value("truncate", c.truncate);
    if (j.contains("max_size_mb")) {
        c.maxSizeMb = j.at("max_size_mb").get<size_t>();
    }
    c.maxFiles = j.value("max_files", c.maxFiles);
}

void from_json(const nlohmann::json& j, LoggingConfig& c)
{
    if (const auto it = j.find("defaults"); it != j.end()) {
        c.consoleLevel = it->value("console_level", c.consoleLevel);
        c.fileLevel = it->value("file_level", c.fileLevel);
        c.pattern = it->value("pattern", c.pattern);
        c.flushIntervalMs = it->value("flush_interval_ms", c.flushIntervalMs);
    }
    if (const auto it = j.find("sinks"); it != j.end()) {
        c.console = it->value("console", c.console);
        c.file = it->value("file", c.file);
    }
    c.channels = j.value("channels", c.channels);
}

// Inserts "[component] " after the leading timestamp of a configured pattern.
std::string withComponent(const std::string& pattern, const std::string& componentName)
{
    const size_t pos = pattern.find("] ");
    if (componentName == "default" || pos == std::string::npos) {
        return pattern;
    }
    return pattern.substr(0, pos + 2) + "[" + componentName + "] " + pattern.substr(pos + 2);
}

spdlog::sink_ptr makeFileSink(const FileSinkConfig& config)
{
    if (config.maxSizeMb) {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.path, *config.maxSizeMb * 1024 * 1024, config.maxFiles);
    }
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.path, config.truncate);
}
} // namespace

// Static member initialization.
bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto console_sink = makeConsoleSink(consoleToStderr);
    console_sink->set_level(consoleLevel);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
    file_sink->set_level(fileLevel);

    sharedSinks_ = { console_sink, file_sink };

    const std::string pattern = channelPattern(componentName);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::info);
    installDefaultLogger(consoleLevel, fileLevel, componentName, consoleToStderr);

    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_INFO("LoggingChannels initialized successfully");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    assert(logger && "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    if (!initialized_) {
        initialize();
    }

    std::stringstream ss(spec);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const size_t colon = item.find(':');
        if (colon == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", trimmed(item));
            continue;
        }

        const std::string channel = trimmed(item.substr(0, colon));
        const auto level = parseLevelString(trimmed(item.substr(colon + 1)));

        if (channel != "*") {
            setChannelLevel(channel, level);
            continue;
        }
        for (LogChannel each : kAllChannels) {
            get(each)->set_level(level);
        }
        spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}', ignoring", channel);
        return;
    }
    logger->set_level(level);
    spdlog::info("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    if (spdlog::get(name)) {
        spdlog::drop(name);
    }
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

void LoggingChannels::createChannelLoggers(spdlog::level::level_enum level)
{
    for (LogChannel channel : kAllChannels) {
        createLogger(toString(channel), sharedSinks_, level);
    }
}

void LoggingChannels::installDefaultLogger(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    // Separate sinks for the default logger so its pattern doesn't affect channel loggers.
    auto default_console_sink = makeConsoleSink(consoleToStderr);
    default_console_sink->set_level(consoleLevel);
    auto default_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, false);
    default_file_sink->set_level(fileLevel);

    const std::string pattern = defaultLoggerPattern(componentName);
    default_console_sink->set_pattern(pattern);
    default_file_sink->set_pattern(pattern);

    std::string loggerName = componentName.empty() ? "default" : componentName;
    std::vector<spdlog::sink_ptr> defaultSinks = { default_console_sink, default_file_sink };
    auto default_logger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    default_logger->set_level(spdlog::level::info);

    spdlog::set_default_logger(default_logger);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    applyConfig(loadConfigFile(configPath), componentName);

    initialized_ = true;
    return true;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    nlohmann::json channels = nlohmann::json::object();
    for (LogChannel channel : kAllChannels) {
        channels[toString(channel)] = "info";
    }

    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", kBasePattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kLogFile },
                { "truncate", true } } } } },
        { "channels", channels }
    };
}

bool LoggingChannels::createDefaultConfigFile(const std::string& path)
{
    std::ofstream configFile(path);
    if (!configFile) {
        spdlog::error("Failed to create logging config file: {}", path);
        return false;
    }
    configFile << defaultConfig().dump(2) << std::endl;
    spdlog::info("Created default logging config file: {}", path);
    return configFile.good();
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    // A path that resolves as given wins. Otherwise look through the config
    // directories, which also honours <name>.local there.
    std::optional<fs::path> found;
    if (fs::exists(configPath + ".local")) {
        found = configPath + ".local";
    }
    else if (fs::exists(configPath)) {
        found = configPath;
    }
    else if (fs::path(configPath).has_filename() && !fs::path(configPath).has_parent_path()) {
        found = ConfigLoader::findConfigFile(configPath);
    }

    if (!found) {
        spdlog::info("Logging config {} not found, writing defaults", configPath);
        if (!createDefaultConfigFile(configPath)) {
            spdlog::warn("Using built-in logging defaults");
        }
        return defaultConfig();
    }

    std::ifstream configFile(*found);
    if (!configFile) {
        spdlog::error("Cannot open {}, using built-in logging defaults", found->string());
        return defaultConfig();
    }

    try {
        auto config = nlohmann::json::parse(configFile);
        spdlog::info("Loaded logging config from {}", found->string());
        return config;
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse {}: {}", found->string(), e.what());
        spdlog::error("Fix the JSON syntax or delete the file to regenerate defaults.");
        return defaultConfig();
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& json, const std::string& componentName)
{
    LoggingConfig config;
    try {
        config = json.get<LoggingConfig>();
    }
    catch (const nlohmann::json::exception& e) {
        spdlog::warn("Invalid logging config ({}), using built-in defaults", e.what());
        config = LoggingConfig{};
    }

    const auto consoleLevel = parseLevelString(config.consoleLevel);
    const auto fileLevel = parseLevelString(config.fileLevel);

    std::vector<spdlog::sink_ptr> sinks;
    try {
        if (config.console.enabled) {
            auto consoleSink = makeConsoleSink(false);
            consoleSink->set_level(parseLevelString(config.console.level));
            sinks.push_back(consoleSink);
        }
        if (config.file.enabled) {
            auto fileSink = makeFileSink(config.file);
            fileSink->set_level(parseLevelString(config.file.level));
            sinks.push_back(fileSink);
        }
    }
    catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Error creating log sinks: {}, using defaults", e.what());
        sinks.clear();
    }

    if (sinks.empty()) {
        auto consoleSink = makeConsoleSink(false);
        consoleSink->set_level(consoleLevel);
        auto fileSink = makeFileSink(FileSinkConfig{});
        fileSink->set_level(fileLevel);
        sinks = { consoleSink, fileSink };
    }

    const std::string pattern = withComponent(config.pattern, componentName);
    sharedSinks_ = sinks;
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(spdlog::level::trace);
    for (const auto& [channel, level] : config.channels) {
        setChannelLevel(channel, parseLevelString(level));
    }

    installDefaultLogger(consoleLevel, fileLevel, componentName, false);

    spdlog::flush_every(std::chrono::milliseconds(config.flushIntervalMs));
    SLOG_INFO("LoggingChannels initialized from config");
}

} // namespace EcoSim
