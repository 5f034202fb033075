#pragma once

#include "EpisodeSummary.h"
#include "core/Result.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace sqlite {
class database;
}

namespace EcoSim {

/**
 * Rolling history of episode summaries, capped at the newest `capacity` entries.
 *
 * The default constructor keeps history in memory; the path constructor stores it in
 * SQLite. Storing an episode number that is already present replaces that entry and
 * makes it the newest.
 */
class EpisodeHistoryRepository {
public:
    static constexpr size_t kDefaultCapacity = 100;

    explicit EpisodeHistoryRepository(size_t capacity = kDefaultCapacity);
    explicit EpisodeHistoryRepository(
        const std::filesystem::path& dbPath, size_t capacity = kDefaultCapacity);
    ~EpisodeHistoryRepository();

    EpisodeHistoryRepository(EpisodeHistoryRepository&&) noexcept;
    EpisodeHistoryRepository& operator=(EpisodeHistoryRepository&&) noexcept;
    EpisodeHistoryRepository(const EpisodeHistoryRepository&) = delete;
    EpisodeHistoryRepository& operator=(const EpisodeHistoryRepository&) = delete;

    Result<std::monostate, std::string> store(const EpisodeSummary& summary);
    Result<std::optional<EpisodeSummary>, std::string> get(int episode) const;

    // Oldest first.
    Result<std::vector<EpisodeSummary>, std::string> list() const;
    Result<size_t, std::string> count() const;
    Result<std::monostate, std::string> clear();

    size_t capacity() const { return capacity_; }
    bool isPersistent() const;

private:
    std::unique_ptr<sqlite::database> db_;
    std::vector<EpisodeSummary> inMemory_;
    size_t capacity_;

    void initSchema();
    Result<std::monostate, std::string> storeInDb(const EpisodeSummary& summary);
    Result<std::optional<EpisodeSummary>, std::string> getFromDb(int episode) const;
    Result<std::vector<EpisodeSummary>, std::string> listFromDb() const;
};

} // namespace EcoSim
