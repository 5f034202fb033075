#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace EcoSim {

/**
 * @brief Finds and parses EcoSim's JSON config files (ecosim.json, logging-config.json).
 *
 * Directories are searched in order, first match wins:
 * 1. Directory given to setConfigDir() (the CLI's --config-dir)
 * 2. $ECOSIM_CONFIG_DIR
 * 3. ./config/
 * 4. ~/.config/ecosim/
 * 5. /etc/ecosim/
 *
 * Within a directory "<name>.local" beats "<name>". The .local file replaces the base
 * file outright; keys are never merged between the two.
 *
 * Every config struct provides an ADL-visible from_json() that leaves missing keys at
 * their defaults, so a config file only needs the settings it changes.
 */
class ConfigLoader {
public:
    static constexpr const char* kEnvVar = "ECOSIM_CONFIG_DIR";

    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    // Error when no file is found, or when it is empty, malformed or of the wrong shape.
    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // Like load(), but a missing file yields a default-constructed T.
    template <typename T>
    static Result<T, std::string> loadOrDefault(const std::string& filename);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;

    static Result<nlohmann::json, std::string> readObject(const std::filesystem::path& path);

    template <typename T>
    static Result<T, std::string> parse(const std::filesystem::path& path);
};

template <typename T>
Result<T, std::string> ConfigLoader::parse(const std::filesystem::path& path)
{
    auto json = readObject(path);
    if (json.isError()) {
        return Result<T, std::string>::error(json.errorValue());
    }

    try {
        T config{};
        from_json(json.value(), config);
        return Result<T, std::string>::okay(config);
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error(
            "Failed to parse " + path.string() + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path) {
        return Result<T, std::string>::error("Config file not found: " + filename);
    }
    return parse<T>(*path);
}

template <typename T>
Result<T, std::string> ConfigLoader::loadOrDefault(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path) {
        return Result<T, std::string>::okay(T{});
    }
    return parse<T>(*path);
}

} // namespace EcoSim
