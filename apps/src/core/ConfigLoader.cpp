#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <cstdlib>
#include <fstream>

namespace EcoSim {

namespace fs = std::filesystem;

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_.reset();
}

std::vector<fs::path> ConfigLoader::getSearchPaths()
{
    std::vector<fs::path> paths;

    if (explicitConfigDir_) {
        paths.emplace_back(*explicitConfigDir_);
    }
    if (const char* envDir = std::getenv(kEnvVar); envDir && *envDir) {
        paths.emplace_back(envDir);
    }
    paths.push_back(fs::current_path() / "config");
    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "ecosim");
    }
    paths.emplace_back("/etc/ecosim");

    return paths;
}

std::optional<fs::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    std::error_code ec;
    for (const auto& dir : getSearchPaths()) {
        for (const auto& candidate : { dir / (filename + ".local"), dir / filename }) {
            if (fs::is_regular_file(candidate, ec)) {
                SLOG_DEBUG("ConfigLoader: {} resolved to {}", filename, candidate.string());
                return candidate;
            }
        }
    }

    SLOG_DEBUG("ConfigLoader: {} not found in {} search paths", filename, getSearchPaths().size());
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::readObject(const fs::path& path)
{
    using JsonResult = Result<nlohmann::json, std::string>;

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return JsonResult::error("Cannot stat config file " + path.string() + ": " + ec.message());
    }
    if (size == 0) {
        SLOG_WARN("ConfigLoader: empty file {}", path.string());
        return JsonResult::error("Empty config file: " + path.string());
    }

    std::ifstream file(path);
    if (!file) {
        return JsonResult::error("Cannot open config file: " + path.string());
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    }
    catch (const nlohmann::json::parse_error& e) {
        SLOG_ERROR("ConfigLoader: {}", e.what());
        return JsonResult::error("Parse error in " + path.string() + ": " + e.what());
    }

    if (!json.is_object()) {
        return JsonResult::error(
            "Config root must be a JSON object in " + path.string() + " (got "
            + json.type_name() + ")");
    }

    SLOG_INFO("ConfigLoader: loaded {}", path.string());
    return JsonResult::okay(std::move(json));
}

} // namespace EcoSim
