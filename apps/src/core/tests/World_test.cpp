/**
 * @file World_test.cpp
 * @brief Scenario tests for World::step.
 *
 * Each test resets a small world, then places agents, food and obstacles by hand
 * through getData() so the outcome of one step is fully determined.
 */

#include "core/Action.h"
#include "core/World.h"
#include "core/WorldData.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace EcoSim;

namespace {

constexpr int kStay = static_cast<int>(Action::Stay);
constexpr int kUp = static_cast<int>(Action::Up);
constexpr int kDown = static_cast<int>(Action::Down);
constexpr int kLeft = static_cast<int>(Action::Left);
constexpr int kRight = static_cast<int>(Action::Right);
constexpr int kShare = static_cast<int>(Action::Share);
constexpr int kSteal = static_cast<int>(Action::Steal);
constexpr int kFormAlliance = static_cast<int>(Action::FormAlliance);
constexpr int kSignalHelp = static_cast<int>(Action::SignalHelp);

} // namespace

class WorldScenarioTest : public ::testing::Test {
protected:
    /**
     * @brief Builds an empty 5x5 world with the given agent count.
     *
     * All agents start Neutral at (0, 0); tests place them explicitly.
     */
    void SetUp() override
    {
        config_ = WorldConfig{
            .gridSize = 5, .numAgents = 2, .numFood = 0, .numObstacles = 0, .maxSteps = 500
        };
    }

    WorldData& start(int numAgents)
    {
        config_.numAgents = numAgents;
        world_ = std::make_unique<World>(config_);
        world_->reset(42);

        WorldData& data = world_->getData();
        data.food.clear();
        data.obstacles.clear();
        for (Agent& agent : data.agents) {
            agent.position = Vector2i{ 0, 0 };
            agent.personality = Personality::EnumType::Neutral;
        }
        return data;
    }

    void place(int id, Personality::EnumType personality, Vector2i position)
    {
        Agent& agent = world_->getData().agents[id];
        agent.personality = personality;
        agent.position = position;
    }

    WorldConfig config_;
    std::unique_ptr<World> world_;
};

TEST_F(WorldScenarioTest, StayCollectsFoodThenShareWithoutCooperativeNeighborIsNoOp)
{
    WorldData& data = start(2);
    place(0, Personality::EnumType::Cooperative, { 2, 2 });
    place(1, Personality::EnumType::Aggressive, { 2, 3 });
    data.food = { { 2, 2 } };

    // Agent 1 issues Share, which does nothing for an Aggressive agent in either phase.
    auto first = world_->step({ kStay, kShare });

    EXPECT_EQ(data.agents[0].foodInventory, 1);
    EXPECT_EQ(data.agents[0].score, 1);
    EXPECT_DOUBLE_EQ(first.rewards[0], 15.0);
    EXPECT_DOUBLE_EQ(first.rewards[1], 0.0);
    EXPECT_EQ(data.food.size(), 1u);

    auto second = world_->step({ kShare, kShare });

    EXPECT_EQ(data.agents[0].foodInventory, 1);
    EXPECT_EQ(data.agents[1].foodInventory, 0);
    EXPECT_DOUBLE_EQ(second.rewards[0], 0.0);
    EXPECT_EQ(second.info.cooperationEvents, 0);
}

TEST_F(WorldScenarioTest, StealTransfersExactlyOneUnit)
{
    WorldData& data = start(2);
    place(0, Personality::EnumType::Cooperative, { 2, 2 });
    place(1, Personality::EnumType::Aggressive, { 2, 3 });
    data.agents[0].foodInventory = 1;

    // Steal is a no-op for the Cooperative agent.
    auto result = world_->step({ kSteal, kSteal });

    EXPECT_EQ(data.agents[0].foodInventory, 0);
    EXPECT_EQ(data.agents[1].foodInventory, 1);
    EXPECT_EQ(data.agents[1].score, 1);
    EXPECT_DOUBLE_EQ(result.rewards[1], 10.0);
    EXPECT_DOUBLE_EQ(result.rewards[0], -10.0);
    EXPECT_EQ(result.info.theftEvents, 1);
}

TEST_F(WorldScenarioTest, StealTakesFromLowestIdVictim)
{
    WorldData& data = start(3);
    place(0, Personality::EnumType::Neutral, { 1, 1 });
    place(1, Personality::EnumType::Neutral, { 1, 2 });
    place(2, Personality::EnumType::Aggressive, { 2, 2 });
    data.agents[0].foodInventory = 2;
    data.agents[1].foodInventory = 2;

    world_->step({ kShare, kShare, kSteal });

    EXPECT_EQ(data.agents[0].foodInventory, 1);
    EXPECT_EQ(data.agents[1].foodInventory, 2);
    EXPECT_EQ(data.agents[2].foodInventory, 1);
}

TEST_F(WorldScenarioTest, StealWithEmptyNeighborsDoesNothing)
{
    start(2);
    place(0, Personality::EnumType::Neutral, { 2, 2 });
    place(1, Personality::EnumType::Aggressive, { 2, 3 });

    auto result = world_->step({ kShare, kSteal });

    EXPECT_DOUBLE_EQ(result.rewards[1], 0.0);
    EXPECT_EQ(result.info.theftEvents, 0);
}

TEST_F(WorldScenarioTest, MutualFormAllianceCreatesOneAlliance)
{
    WorldData& data = start(2);
    place(0, Personality::EnumType::Cooperative, { 1, 1 });
    place(1, Personality::EnumType::Cooperative, { 1, 2 });

    auto result = world_->step({ kFormAlliance, kFormAlliance });

    ASSERT_EQ(data.alliances.size(), 1u);
    ASSERT_TRUE(data.agents[0].allianceId.has_value());
    ASSERT_TRUE(data.agents[1].allianceId.has_value());
    EXPECT_EQ(*data.agents[0].allianceId, *data.agents[1].allianceId);

    const auto& members = data.alliances.members(*data.agents[0].allianceId);
    EXPECT_EQ(members, (AllianceManager::MemberSet{ 0, 1 }));
    EXPECT_EQ(result.info.allianceFormations, 1);
    EXPECT_EQ(result.info.numAlliances, 1);

    // Only agent 0 acts; agent 1 is already allied when its turn comes.
    EXPECT_DOUBLE_EQ(result.rewards[0], 3.0);
    EXPECT_DOUBLE_EQ(result.rewards[1], 3.0);
}

TEST_F(WorldScenarioTest, FormAllianceJoinsPartnersExistingAlliance)
{
    WorldData& data = start(3);
    place(0, Personality::EnumType::Cooperative, { 0, 0 });
    place(1, Personality::EnumType::Cooperative, { 0, 1 });
    place(2, Personality::EnumType::Cooperative, { 0, 3 });
    const AllianceId alliance = data.alliances.create(data.agents, 0, 1);

    auto result = world_->step({ kStay, kStay, kFormAlliance });

    EXPECT_EQ(data.alliances.size(), 1u);
    EXPECT_EQ(data.alliances.members(alliance), (AllianceManager::MemberSet{ 0, 1, 2 }));
    ASSERT_TRUE(data.agents[2].allianceId.has_value());
    EXPECT_EQ(*data.agents[2].allianceId, alliance);
    EXPECT_EQ(result.info.allianceFormations, 0);
    EXPECT_DOUBLE_EQ(result.rewards[2], 3.0);
    EXPECT_DOUBLE_EQ(result.rewards[1], -1.0 + 3.0);
}

TEST_F(WorldScenarioTest, FormAllianceIgnoresNonCooperativeActor)
{
    WorldData& data = start(2);
    place(0, Personality::EnumType::Neutral, { 1, 1 });
    place(1, Personality::EnumType::Cooperative, { 1, 2 });

    world_->step({ kFormAlliance, kShare });

    EXPECT_EQ(data.alliances.size(), 0u);
    EXPECT_FALSE(data.agents[0].isAllied());
}

TEST_F(WorldScenarioTest, ShareGoesToFirstCooperativeNeighbor)
{
    WorldData& data = start(3);
    place(0, Personality::EnumType::Aggressive, { 2, 1 });
    place(1, Personality::EnumType::Cooperative, { 2, 2 });
    place(2, Personality::EnumType::Cooperative, { 2, 3 });
    data.agents[1].foodInventory = 2;

    auto result = world_->step({ kShare, kShare, kStay });

    EXPECT_EQ(data.agents[0].foodInventory, 0);
    EXPECT_EQ(data.agents[1].foodInventory, 1);
    EXPECT_EQ(data.agents[2].foodInventory, 1);
    EXPECT_EQ(data.agents[2].score, 1);
    EXPECT_DOUBLE_EQ(result.rewards[1], 5.0);
    EXPECT_DOUBLE_EQ(result.rewards[2], -1.0 + 5.0);
    EXPECT_EQ(result.info.cooperationEvents, 1);

    // Sharing never forms or joins an alliance.
    EXPECT_FALSE(data.agents[1].isAllied());
    EXPECT_FALSE(data.agents[2].isAllied());
    EXPECT_TRUE(data.alliances.isConsistent(data.agents));
}

TEST_F(WorldScenarioTest, LaterAgentsSeeEarlierSocialMutations)
{
    WorldData& data = start(3);
    place(0, Personality::EnumType::Aggressive, { 2, 1 });
    place(1, Personality::EnumType::Cooperative, { 2, 2 });
    place(2, Personality::EnumType::Cooperative, { 2, 3 });
    data.agents[1].foodInventory = 2;

    // Agent 2 receives a unit from agent 1, then shares it straight back.
    auto result = world_->step({ kShare, kShare, kShare });

    EXPECT_EQ(data.agents[1].foodInventory, 2);
    EXPECT_EQ(data.agents[2].foodInventory, 0);
    EXPECT_EQ(data.agents[1].score, 1);
    EXPECT_EQ(data.agents[2].score, 1);
    EXPECT_DOUBLE_EQ(result.rewards[1], 10.0);
    EXPECT_DOUBLE_EQ(result.rewards[2], 10.0);
    EXPECT_EQ(result.info.cooperationEvents, 2);
}

TEST_F(WorldScenarioTest, ShareOutsideInteractionRadiusDoesNothing)
{
    WorldData& data = start(2);
    place(0, Personality::EnumType::Cooperative, { 0, 0 });
    place(1, Personality::EnumType::Cooperative, { 2, 2 });
    data.agents[0].foodInventory = 1;

    auto result = world_->step({ kShare, kStay });

    EXPECT_EQ(data.agents[0].foodInventory, 1);
    EXPECT_EQ(result.info.cooperationEvents, 0);
}

TEST_F(WorldScenarioTest, SignalHelpPaysOncePerAllyInRange)
{
    WorldData& data = start(4);
    place(0, Personality::EnumType::Cooperative, { 2, 2 });
    place(1, Personality::EnumType::Cooperative, { 2, 3 });
    place(2, Personality::EnumType::Cooperative, { 3, 2 });
    place(3, Personality::EnumType::Cooperative, { 4, 4 });
    const AllianceId alliance = data.alliances.create(data.agents, 0, 1);
    data.alliances.join(data.agents, alliance, 2);

    auto result = world_->step({ kSignalHelp, kShare, kShare, kStay });

    EXPECT_EQ(data.agents[0].signal, CommunicationSignal::Help);
    EXPECT_DOUBLE_EQ(result.rewards[0], 4.0);
    EXPECT_DOUBLE_EQ(result.rewards[1], 2.0);
    EXPECT_DOUBLE_EQ(result.rewards[2], 2.0);

    // Agent 3 at distance sqrt(8) is outside radius 2 but inside radius 3.
    EXPECT_FLOAT_EQ(result.observations[3][13], 1.0f);
}

TEST_F(WorldScenarioTest, SignalHelpWhileUnalliedOnlySetsSignal)
{
    WorldData& data = start(2);
    place(0, Personality::EnumType::Neutral, { 2, 2 });
    place(1, Personality::EnumType::Neutral, { 2, 3 });

    auto result = world_->step({ kSignalHelp, kShare });

    EXPECT_EQ(data.agents[0].signal, CommunicationSignal::Help);
    EXPECT_DOUBLE_EQ(result.rewards[0], 0.0);
    EXPECT_FLOAT_EQ(result.observations[1][13], 1.0f);

    // Signals are cleared at the start of the next step.
    world_->step({ kStay, kStay });
    EXPECT_EQ(data.agents[0].signal, CommunicationSignal::None);
}

TEST_F(WorldScenarioTest, MovementClampsAtGridEdges)
{
    WorldData& data = start(4);
    place(0, Personality::EnumType::Neutral, { 0, 0 });
    place(1, Personality::EnumType::Neutral, { 0, 0 });
    place(2, Personality::EnumType::Neutral, { 4, 4 });
    place(3, Personality::EnumType::Neutral, { 4, 4 });

    auto result = world_->step({ kUp, kLeft, kDown, kRight });

    EXPECT_EQ(data.agents[0].position, (Vector2i{ 0, 0 }));
    EXPECT_EQ(data.agents[1].position, (Vector2i{ 0, 0 }));
    EXPECT_EQ(data.agents[2].position, (Vector2i{ 4, 4 }));
    EXPECT_EQ(data.agents[3].position, (Vector2i{ 4, 4 }));
    for (double reward : result.rewards) {
        EXPECT_DOUBLE_EQ(reward, -1.0);
    }
}

TEST_F(WorldScenarioTest, MovementDirections)
{
    WorldData& data = start(4);
    for (int id = 0; id < 4; ++id) {
        place(id, Personality::EnumType::Neutral, { 2, 2 });
    }

    world_->step({ kUp, kDown, kLeft, kRight });

    EXPECT_EQ(data.agents[0].position, (Vector2i{ 2, 1 }));
    EXPECT_EQ(data.agents[1].position, (Vector2i{ 2, 3 }));
    EXPECT_EQ(data.agents[2].position, (Vector2i{ 1, 2 }));
    EXPECT_EQ(data.agents[3].position, (Vector2i{ 3, 2 }));
}

TEST_F(WorldScenarioTest, ObstacleBlocksMoveAndDamages)
{
    WorldData& data = start(2);
    place(0, Personality::EnumType::Neutral, { 2, 2 });
    place(1, Personality::EnumType::Neutral, { 4, 4 });
    data.obstacles.insert({ 2, 1 });

    auto result = world_->step({ kUp, kShare });

    EXPECT_EQ(data.agents[0].position, (Vector2i{ 2, 2 }));
    EXPECT_DOUBLE_EQ(result.rewards[0], -5.0);
    EXPECT_NEAR(data.agents[0].health, 100.0 - 2.0 - 0.2, 1e-9);
    EXPECT_NEAR(data.agents[1].health, 99.8, 1e-9);
}

TEST_F(WorldScenarioTest, ObstacleDamageFloorsAtZero)
{
    WorldData& data = start(2);
    place(0, Personality::EnumType::Neutral, { 2, 2 });
    data.agents[0].health = 1.0;
    data.obstacles.insert({ 3, 2 });

    world_->step({ kRight, kShare });

    EXPECT_DOUBLE_EQ(data.agents[0].health, 0.0);
}

TEST_F(WorldScenarioTest, VisitConsumesOnlyOneDuplicateFoodUnit)
{
    WorldData& data = start(2);
    place(0, Personality::EnumType::Neutral, { 1, 1 });
    place(1, Personality::EnumType::Neutral, { 4, 4 });
    data.food = { { 1, 2 }, { 1, 2 } };

    auto result = world_->step({ kDown, kShare });

    EXPECT_EQ(data.agents[0].foodInventory, 1);
    EXPECT_DOUBLE_EQ(result.rewards[0], 15.0);
    ASSERT_EQ(data.food.size(), 2u);
    EXPECT_EQ(data.food[0], (Vector2i{ 1, 2 }));
}

TEST_F(WorldScenarioTest, FoodHealIsCapped)
{
    WorldData& data = start(2);
    place(0, Personality::EnumType::Neutral, { 1, 1 });
    data.agents[0].health = 95.0;
    data.food = { { 1, 1 } };

    world_->step({ kStay, kShare });

    EXPECT_NEAR(data.agents[0].health, 100.0 - 0.2, 1e-9);
}

TEST_F(WorldScenarioTest, AllianceBonusAppliesBeforeDecay)
{
    WorldData& data = start(3);
    place(0, Personality::EnumType::Cooperative, { 0, 0 });
    place(1, Personality::EnumType::Cooperative, { 4, 4 });
    place(2, Personality::EnumType::Cooperative, { 2, 2 });
    data.alliances.create(data.agents, 0, 1);
    for (Agent& agent : data.agents) {
        agent.health = 50.0;
    }

    world_->step({ kShare, kShare, kShare });

    EXPECT_NEAR(data.agents[0].health, 50.0 + 0.1 - 0.2, 1e-9);
    EXPECT_NEAR(data.agents[1].health, 50.0 + 0.1 - 0.2, 1e-9);
    EXPECT_NEAR(data.agents[2].health, 50.0 - 0.2, 1e-9);
}

TEST_F(WorldScenarioTest, HealthDecayFloorsAtZero)
{
    WorldData& data = start(2);
    data.agents[0].health = 0.1;

    world_->step({ kShare, kShare });

    EXPECT_DOUBLE_EQ(data.agents[0].health, 0.0);
}

TEST_F(WorldScenarioTest, StepInfoReflectsScores)
{
    WorldData& data = start(2);
    place(0, Personality::EnumType::Cooperative, { 1, 1 });
    place(1, Personality::EnumType::Aggressive, { 4, 4 });
    data.food = { { 1, 1 } };

    auto result = world_->step({ kStay, kShare });

    EXPECT_EQ(result.info.step, 1);
    EXPECT_DOUBLE_EQ(result.info.survivalRate, 0.5);
    EXPECT_DOUBLE_EQ(result.info.avgScore, 0.5);
    EXPECT_EQ(result.info.totalFoodCollected, 1);
    EXPECT_DOUBLE_EQ(result.info.personalityScores.cooperative, 1.0);
    EXPECT_DOUBLE_EQ(result.info.personalityScores.aggressive, 0.0);
    EXPECT_DOUBLE_EQ(result.info.personalityScores.neutral, 0.0);
    EXPECT_FALSE(result.terminated);
    EXPECT_FALSE(result.truncated);
}

// =============================================================================
// Validation.
// =============================================================================

TEST(WorldTest, ConstructorRejectsInvalidConfig)
{
    EXPECT_THROW(World(WorldConfig{ .gridSize = 0 }), std::invalid_argument);
    EXPECT_THROW(World(WorldConfig{ .numAgents = 0 }), std::invalid_argument);
    EXPECT_THROW(World(WorldConfig{ .numFood = -1 }), std::invalid_argument);
    EXPECT_THROW(World(WorldConfig{ .numObstacles = -1 }), std::invalid_argument);
    EXPECT_THROW(World(WorldConfig{ .maxSteps = 0 }), std::invalid_argument);
}

TEST(WorldTest, StepBeforeResetThrows)
{
    World world(WorldConfig{ .numAgents = 2 });
    EXPECT_THROW(world.step({ 0, 0 }), std::logic_error);
}

TEST(WorldTest, StepRejectsBadActionsWithoutMutating)
{
    World world(WorldConfig{ .gridSize = 10, .numAgents = 3, .numFood = 5, .numObstacles = 5 });
    world.reset(7);
    const nlohmann::json before = world.snapshot();

    EXPECT_THROW(world.step({ 0, 0 }), std::invalid_argument);
    EXPECT_THROW(world.step({ 0, 0, 0, 0 }), std::invalid_argument);
    EXPECT_THROW(world.step({ 0, 9, 0 }), std::invalid_argument);
    EXPECT_THROW(world.step({ -1, 0, 0 }), std::invalid_argument);

    EXPECT_EQ(nlohmann::json(world.snapshot()), before);
    EXPECT_EQ(world.getData().step, 0);
}

TEST(WorldTest, TerminatesAtMaxStepsAndRejectsFurtherSteps)
{
    World world(WorldConfig{ .gridSize = 5, .numAgents = 2, .maxSteps = 3 });
    world.reset(1);

    EXPECT_FALSE(world.step({ 0, 0 }).terminated);
    EXPECT_FALSE(world.step({ 0, 0 }).terminated);
    EXPECT_TRUE(world.step({ 0, 0 }).terminated);
    EXPECT_TRUE(world.isTerminated());
    EXPECT_THROW(world.step({ 0, 0 }), std::logic_error);

    world.reset(1);
    EXPECT_FALSE(world.isTerminated());
    EXPECT_NO_THROW(world.step({ 0, 0 }));
}

TEST(WorldTest, ResetReturnsObservationsAndEmptyInfo)
{
    World world(WorldConfig{});
    auto reset = world.reset(3);

    ASSERT_EQ(reset.observations.size(), 100u);
    for (const auto& obs : reset.observations) {
        EXPECT_EQ(obs.size(), 40u);
    }
    EXPECT_TRUE(reset.info.is_object());
    EXPECT_TRUE(reset.info.empty());
}

TEST(WorldTest, ResetRestoresDefaults)
{
    World world(WorldConfig{ .gridSize = 8, .numAgents = 6, .numFood = 4, .numObstacles = 3 });
    world.reset(11);
    WorldData& data = world.getData();
    data.agents[0].score = 9;
    data.agents[0].health = 12.0;
    data.agents[0].foodInventory = 4;
    data.alliances.create(data.agents, 1, 2);
    data.counters.theftEvents = 5;
    world.step(std::vector<int>(6, 0));

    world.reset(11);

    for (const Agent& agent : world.getData().agents) {
        EXPECT_DOUBLE_EQ(agent.health, 100.0);
        EXPECT_EQ(agent.score, 0);
        EXPECT_EQ(agent.foodInventory, 0);
        EXPECT_FALSE(agent.isAllied());
        EXPECT_EQ(agent.signal, CommunicationSignal::None);
    }
    EXPECT_EQ(world.getData().alliances.size(), 0u);
    EXPECT_EQ(world.getData().alliances.nextId(), AllianceId{ 0 });
    EXPECT_EQ(world.getData().counters.theftEvents, 0);
    EXPECT_EQ(world.getData().step, 0);
    EXPECT_EQ(world.getData().food.size(), 4u);
}

TEST(WorldTest, ResetPlacesEverythingInBounds)
{
    World world(WorldConfig{ .gridSize = 7, .numAgents = 50, .numFood = 20, .numObstacles = 30 });
    world.reset(5);
    const WorldData& data = world.getData();

    for (const Agent& agent : data.agents) {
        EXPECT_TRUE(data.inBounds(agent.position));
    }
    for (const Vector2i& cell : data.food) {
        EXPECT_TRUE(data.inBounds(cell));
    }
    for (const Vector2i& cell : data.obstacles) {
        EXPECT_TRUE(data.inBounds(cell));
    }
    EXPECT_LE(data.obstacles.size(), 30u);
}
