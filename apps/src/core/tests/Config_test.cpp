#include "core/RunnerConfig.h"
#include "core/WorldConfig.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace EcoSim;

TEST(WorldConfigTest, DefaultsMatchReferenceScale)
{
    const WorldConfig config{};
    EXPECT_EQ(config.gridSize, 20);
    EXPECT_EQ(config.numAgents, 100);
    EXPECT_EQ(config.numFood, 30);
    EXPECT_EQ(config.numObstacles, 50);
    EXPECT_EQ(config.maxSteps, 500);
    EXPECT_NO_THROW(config.validate());
}

TEST(WorldConfigTest, ZeroFoodAndObstaclesAreValid)
{
    const WorldConfig config{ .numFood = 0, .numObstacles = 0 };
    EXPECT_NO_THROW(config.validate());
}

TEST(WorldConfigTest, MissingJsonKeysKeepDefaults)
{
    const auto config = nlohmann::json{ { "grid_size", 8 }, { "num_food", 0 } }.get<WorldConfig>();

    EXPECT_EQ(config.gridSize, 8);
    EXPECT_EQ(config.numFood, 0);
    EXPECT_EQ(config.numAgents, 100);
    EXPECT_EQ(config.maxSteps, 500);
}

TEST(RunnerConfigTest, ParsesNestedSections)
{
    const nlohmann::json j = {
        { "episodes", 3 },
        { "seed", 17 },
        { "telemetry_format", "binary" },
        { "history_capacity", 5 },
        { "policy", { { "kind", "random" } } },
        { "world", { { "num_agents", 12 } } },
    };

    const auto config = j.get<RunnerConfig>();

    EXPECT_EQ(config.episodes, 3);
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 17u);
    EXPECT_EQ(config.telemetryFormat, "binary");
    EXPECT_EQ(config.historyCapacity, 5u);
    EXPECT_EQ(config.telemetryInterval, 10);
    EXPECT_EQ(config.world.numAgents, 12);
    EXPECT_EQ(config.world.gridSize, 20);
    EXPECT_NO_THROW(config.validate());

    const nlohmann::json roundTrip = config;
    EXPECT_EQ(roundTrip.at("seed"), 17);
    EXPECT_EQ(roundTrip.at("world").at("num_agents"), 12);
}

TEST(RunnerConfigTest, NullSeedMeansUnseeded)
{
    const auto config = nlohmann::json{ { "seed", nullptr } }.get<RunnerConfig>();
    EXPECT_FALSE(config.seed.has_value());
}

TEST(RunnerConfigTest, ValidationRejectsBadValues)
{
    RunnerConfig config;
    config.telemetryFormat = "xml";
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = RunnerConfig{};
    config.policy.kind = "dqn";
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = RunnerConfig{};
    config.episodes = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = RunnerConfig{};
    config.world.gridSize = -3;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}
