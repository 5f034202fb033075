#include "core/persistence/EpisodeHistoryRepository.h"
#include <filesystem>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <random>
#include <stdexcept>

using namespace EcoSim;

namespace {
EpisodeSummary makeSummary(int episode, double totalReward)
{
    StepInfo info;
    info.step = 500;
    info.survivalRate = 0.42;
    info.avgScore = 1.5;
    info.totalFoodCollected = 150;
    info.cooperationEvents = 12;
    info.theftEvents = 7;
    info.allianceFormations = 4;
    info.numAlliances = 4;
    info.avgHealth = 61.25;
    info.personalityScores =
        PersonalityScores{ .cooperative = 1.25, .aggressive = 2.0, .neutral = 1.0 };

    return EpisodeSummary{
        .episode = episode,
        .totalReward = totalReward,
        .finalInfo = info,
        .agentType = "random",
        .timestamp = "2026-01-02T03:04:05Z",
    };
}

std::vector<int> episodeNumbers(const std::vector<EpisodeSummary>& summaries)
{
    std::vector<int> numbers;
    for (const auto& summary : summaries) {
        numbers.push_back(summary.episode);
    }
    return numbers;
}
} // namespace

class EpisodeHistoryRepositoryTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override { repository_ = open(EpisodeHistoryRepository::kDefaultCapacity); }

    void TearDown() override
    {
        repository_.reset();
        if (!testDataDir_.empty()) {
            std::filesystem::remove_all(testDataDir_);
        }
    }

    std::unique_ptr<EpisodeHistoryRepository> open(size_t capacity)
    {
        if (!isPersistent()) {
            return std::make_unique<EpisodeHistoryRepository>(capacity);
        }
        if (testDataDir_.empty()) {
            testDataDir_ = std::filesystem::temp_directory_path()
                / ("ecosim-test-history-" + std::to_string(std::random_device{}()));
            std::filesystem::create_directories(testDataDir_);
        }
        return std::make_unique<EpisodeHistoryRepository>(testDataDir_ / "history.db", capacity);
    }

    bool isPersistent() const { return GetParam(); }

    std::filesystem::path testDataDir_;
    std::unique_ptr<EpisodeHistoryRepository> repository_;
};

TEST_P(EpisodeHistoryRepositoryTest, StoreGetList)
{
    ASSERT_TRUE(repository_->store(makeSummary(1, -40.0)).isValue());
    ASSERT_TRUE(repository_->store(makeSummary(2, 12.5)).isValue());

    EXPECT_EQ(repository_->isPersistent(), isPersistent());

    auto fetched = repository_->get(2);
    ASSERT_TRUE(fetched.isValue());
    ASSERT_TRUE(fetched.value().has_value());
    const EpisodeSummary& summary = *fetched.value();
    EXPECT_DOUBLE_EQ(summary.totalReward, 12.5);
    EXPECT_EQ(summary.agentType, "random");
    EXPECT_EQ(summary.timestamp, "2026-01-02T03:04:05Z");
    EXPECT_EQ(summary.finalInfo.theftEvents, 7);
    EXPECT_DOUBLE_EQ(summary.finalInfo.personalityScores.cooperative, 1.25);

    auto missing = repository_->get(99);
    ASSERT_TRUE(missing.isValue());
    EXPECT_FALSE(missing.value().has_value());

    auto list = repository_->list();
    ASSERT_TRUE(list.isValue());
    EXPECT_EQ(episodeNumbers(list.value()), (std::vector<int>{ 1, 2 }));
}

TEST_P(EpisodeHistoryRepositoryTest, StoringSameEpisodeReplacesIt)
{
    ASSERT_TRUE(repository_->store(makeSummary(1, 1.0)).isValue());
    ASSERT_TRUE(repository_->store(makeSummary(2, 2.0)).isValue());
    ASSERT_TRUE(repository_->store(makeSummary(1, 3.0)).isValue());

    auto count = repository_->count();
    ASSERT_TRUE(count.isValue());
    EXPECT_EQ(count.value(), 2u);

    auto list = repository_->list();
    ASSERT_TRUE(list.isValue());
    EXPECT_EQ(episodeNumbers(list.value()), (std::vector<int>{ 2, 1 }));
    EXPECT_DOUBLE_EQ(list.value().back().totalReward, 3.0);
}

TEST_P(EpisodeHistoryRepositoryTest, KeepsOnlyNewestEntries)
{
    repository_ = open(3);
    for (int episode = 1; episode <= 5; ++episode) {
        ASSERT_TRUE(repository_->store(makeSummary(episode, episode)).isValue());
    }

    auto list = repository_->list();
    ASSERT_TRUE(list.isValue());
    EXPECT_EQ(episodeNumbers(list.value()), (std::vector<int>{ 3, 4, 5 }));
    EXPECT_FALSE(repository_->get(1).value().has_value());
}

TEST_P(EpisodeHistoryRepositoryTest, DefaultCapacityIsOneHundred)
{
    for (int episode = 1; episode <= 105; ++episode) {
        ASSERT_TRUE(repository_->store(makeSummary(episode, 0.0)).isValue());
    }

    EXPECT_EQ(repository_->capacity(), 100u);
    EXPECT_EQ(repository_->count().value(), 100u);
    EXPECT_EQ(repository_->list().value().front().episode, 6);
}

TEST_P(EpisodeHistoryRepositoryTest, ClearRemovesEverything)
{
    ASSERT_TRUE(repository_->store(makeSummary(1, 1.0)).isValue());

    ASSERT_TRUE(repository_->clear().isValue());

    EXPECT_EQ(repository_->count().value(), 0u);
}

TEST_P(EpisodeHistoryRepositoryTest, ZeroCapacityIsRejected)
{
    EXPECT_THROW(open(0), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    EpisodeHistoryRepositoryModes, EpisodeHistoryRepositoryTest, ::testing::Values(false, true));

TEST(EpisodeHistoryPersistenceTest, HistorySurvivesReopen)
{
    const auto dir = std::filesystem::temp_directory_path()
        / ("ecosim-test-history-reopen-" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(dir);
    const auto dbPath = dir / "history.db";

    {
        EpisodeHistoryRepository repository(dbPath);
        ASSERT_TRUE(repository.store(makeSummary(7, 70.0)).isValue());
    }
    {
        EpisodeHistoryRepository repository(dbPath);
        auto fetched = repository.get(7);
        ASSERT_TRUE(fetched.isValue());
        ASSERT_TRUE(fetched.value().has_value());
        EXPECT_DOUBLE_EQ(fetched.value()->totalReward, 70.0);
    }

    std::filesystem::remove_all(dir);
}

TEST(EpisodeSummaryTest, JsonIsFlat)
{
    const nlohmann::json j = makeSummary(3, 9.5);

    EXPECT_EQ(j.at("episode"), 3);
    EXPECT_DOUBLE_EQ(j.at("total_reward").get<double>(), 9.5);
    EXPECT_DOUBLE_EQ(j.at("survival_rate").get<double>(), 0.42);
    EXPECT_EQ(j.at("num_alliances"), 4);
    EXPECT_EQ(j.at("agent_type"), "random");
    EXPECT_TRUE(j.at("personality_scores").contains("aggressive"));
}

TEST(EpisodeSummaryTest, TimestampIsIso8601)
{
    const std::string timestamp = currentIsoTimestamp();

    ASSERT_EQ(timestamp.size(), 20u);
    EXPECT_EQ(timestamp[4], '-');
    EXPECT_EQ(timestamp[10], 'T');
    EXPECT_EQ(timestamp.back(), 'Z');
}
