#include "EpisodeHistoryRepository.h"

#include "core/LoggingChannels.h"

#include <algorithm>
#include <chrono>
#include <nlohmann/json.hpp>
#include <sqlite_modern_cpp.h>
#include <stdexcept>

namespace EcoSim {

namespace {
constexpr int kSchemaVersion = 1;

template <typename Func>
Result<std::monostate, std::string> execDb(sqlite::database& db, const char* operation, Func&& func)
{
    try {
        func(db);
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }
    catch (const sqlite::sqlite_exception& e) {
        std::string message = "EpisodeHistoryRepository: ";
        message += operation;
        message += " failed: ";
        message += e.what();
        message += " (code ";
        message += std::to_string(e.get_code());
        message += ")";
        LOG_ERROR(Persistence, "{}", message);
        return Result<std::monostate, std::string>::error(std::move(message));
    }
    catch (const std::exception& e) {
        std::string message = "EpisodeHistoryRepository: ";
        message += operation;
        message += " failed: ";
        message += e.what();
        LOG_ERROR(Persistence, "{}", message);
        return Result<std::monostate, std::string>::error(std::move(message));
    }
}

int64_t currentEpochSeconds()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void checkCapacity(size_t capacity)
{
    if (capacity == 0) {
        throw std::invalid_argument("EpisodeHistoryRepository capacity must be positive");
    }
}
} // namespace

EpisodeHistoryRepository::EpisodeHistoryRepository(size_t capacity) : capacity_(capacity)
{
    checkCapacity(capacity_);
}

EpisodeHistoryRepository::EpisodeHistoryRepository(
    const std::filesystem::path& dbPath, size_t capacity)
    : capacity_(capacity)
{
    checkCapacity(capacity_);
    db_ = std::make_unique<sqlite::database>(dbPath.string());
    LOG_INFO(Persistence, "Opening episode history at {}", dbPath.string());
    initSchema();
}

EpisodeHistoryRepository::~EpisodeHistoryRepository() = default;

EpisodeHistoryRepository::EpisodeHistoryRepository(EpisodeHistoryRepository&&) noexcept = default;
EpisodeHistoryRepository& EpisodeHistoryRepository::operator=(EpisodeHistoryRepository&&) noexcept =
    default;

bool EpisodeHistoryRepository::isPersistent() const
{
    return db_ != nullptr;
}

void EpisodeHistoryRepository::initSchema()
{
    if (!db_) {
        return;
    }

    *db_ << R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY
        )
    )";

    *db_ << R"(
        CREATE TABLE IF NOT EXISTS episode_history (
            episode INTEGER PRIMARY KEY,
            summary_json TEXT NOT NULL,
            stored_seq INTEGER NOT NULL,
            created_at INTEGER NOT NULL
        )
    )";

    int existingVersion = 0;
    *db_ << "SELECT version FROM schema_version LIMIT 1" >> [&](int v) { existingVersion = v; };

    if (existingVersion == 0) {
        *db_ << "INSERT INTO schema_version (version) VALUES (?)" << kSchemaVersion;
        LOG_INFO(Persistence, "Initialized history schema version {}", kSchemaVersion);
    }
    else if (existingVersion != kSchemaVersion) {
        LOG_WARN(
            Persistence,
            "History schema version mismatch (db={}, code={})",
            existingVersion,
            kSchemaVersion);
    }
}

Result<std::monostate, std::string> EpisodeHistoryRepository::store(const EpisodeSummary& summary)
{
    if (db_) {
        return storeInDb(summary);
    }

    auto it = std::find_if(inMemory_.begin(), inMemory_.end(), [&](const EpisodeSummary& existing) {
        return existing.episode == summary.episode;
    });
    if (it != inMemory_.end()) {
        inMemory_.erase(it);
    }
    inMemory_.push_back(summary);

    if (inMemory_.size() > capacity_) {
        const auto excess = static_cast<std::ptrdiff_t>(inMemory_.size() - capacity_);
        inMemory_.erase(inMemory_.begin(), inMemory_.begin() + excess);
        LOG_DEBUG(Persistence, "Pruned {} oldest in-memory episode(s)", excess);
    }
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

Result<std::monostate, std::string> EpisodeHistoryRepository::storeInDb(
    const EpisodeSummary& summary)
{
    std::string summaryJson;
    try {
        summaryJson = nlohmann::json(summary).dump();
    }
    catch (const std::exception& e) {
        std::string message = "EpisodeHistoryRepository: serialize failed: ";
        message += e.what();
        LOG_ERROR(Persistence, "{}", message);
        return Result<std::monostate, std::string>::error(std::move(message));
    }
    const int64_t createdAt = currentEpochSeconds();
    const auto capacity = static_cast<int64_t>(capacity_);

    return execDb(*db_, "store", [&](sqlite::database& db) {
        db << "BEGIN";
        try {
            int64_t nextSeq = 0;
            db << "SELECT COALESCE(MAX(stored_seq), 0) + 1 FROM episode_history" >> nextSeq;

            db << R"(
                INSERT OR REPLACE INTO episode_history
                    (episode, summary_json, stored_seq, created_at)
                VALUES (?, ?, ?, ?)
            )" << summary.episode
               << summaryJson << nextSeq << createdAt;

            db << R"(
                DELETE FROM episode_history WHERE episode NOT IN (
                    SELECT episode FROM episode_history ORDER BY stored_seq DESC LIMIT ?
                )
            )" << capacity;
            db << "COMMIT";
        }
        catch (...) {
            db << "ROLLBACK";
            throw;
        }
    });
}

Result<std::optional<EpisodeSummary>, std::string> EpisodeHistoryRepository::get(int episode) const
{
    if (db_) {
        return getFromDb(episode);
    }

    auto it = std::find_if(inMemory_.begin(), inMemory_.end(), [&](const EpisodeSummary& existing) {
        return existing.episode == episode;
    });
    if (it == inMemory_.end()) {
        return Result<std::optional<EpisodeSummary>, std::string>::okay(std::nullopt);
    }
    return Result<std::optional<EpisodeSummary>, std::string>::okay(*it);
}

Result<std::optional<EpisodeSummary>, std::string> EpisodeHistoryRepository::getFromDb(
    int episode) const
{
    std::optional<EpisodeSummary> found;
    auto result = execDb(*db_, "get", [&](sqlite::database& db) {
        db << "SELECT summary_json FROM episode_history WHERE episode = ?" << episode
            >> [&](std::string summaryJson) {
                  found = nlohmann::json::parse(summaryJson).get<EpisodeSummary>();
              };
    });
    if (result.isError()) {
        return Result<std::optional<EpisodeSummary>, std::string>::error(result.errorValue());
    }
    return Result<std::optional<EpisodeSummary>, std::string>::okay(std::move(found));
}

Result<std::vector<EpisodeSummary>, std::string> EpisodeHistoryRepository::list() const
{
    if (db_) {
        return listFromDb();
    }
    return Result<std::vector<EpisodeSummary>, std::string>::okay(inMemory_);
}

Result<std::vector<EpisodeSummary>, std::string> EpisodeHistoryRepository::listFromDb() const
{
    std::vector<EpisodeSummary> summaries;
    auto result = execDb(*db_, "list", [&](sqlite::database& db) {
        db << "SELECT summary_json FROM episode_history ORDER BY stored_seq ASC"
            >> [&](std::string summaryJson) {
                  summaries.push_back(nlohmann::json::parse(summaryJson).get<EpisodeSummary>());
              };
    });
    if (result.isError()) {
        return Result<std::vector<EpisodeSummary>, std::string>::error(result.errorValue());
    }
    return Result<std::vector<EpisodeSummary>, std::string>::okay(std::move(summaries));
}

Result<size_t, std::string> EpisodeHistoryRepository::count() const
{
    if (!db_) {
        return Result<size_t, std::string>::okay(inMemory_.size());
    }

    int64_t rows = 0;
    auto result = execDb(*db_, "count", [&](sqlite::database& db) {
        db << "SELECT COUNT(1) FROM episode_history" >> rows;
    });
    if (result.isError()) {
        return Result<size_t, std::string>::error(result.errorValue());
    }
    return Result<size_t, std::string>::okay(static_cast<size_t>(rows));
}

Result<std::monostate, std::string> EpisodeHistoryRepository::clear()
{
    if (!db_) {
        inMemory_.clear();
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }
    return execDb(*db_, "clear", [](sqlite::database& db) { db << "DELETE FROM episode_history"; });
}

} // namespace EcoSim
