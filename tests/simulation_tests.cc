#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <cstdint>

#include "core/input.h"
#include "sim/simulation.h"
#include "test_world.h"

namespace {

// Holds the action for one tick, then releases it for the next.
void tapAction(layerfall::sim::Simulation& simulation, layerfall::core::InputState& input, layerfall::core::InputAction action) {
    input.setDown(action, true);
    simulation.tick(input);
    input.endTick();
    input.setDown(action, false);
    simulation.tick(input);
    input.endTick();
}

} // namespace

TEST(SimulationTest, ResetBuildsLayeredWorld) {
    using namespace layerfall;

    sim::Simulation simulation;
    const sim::SimConfig config{};
    ASSERT_TRUE(simulation.reset(config));

    const sim::WorldContext& context = simulation.context();
    ASSERT_EQ(context.blocks.layers().size(), 4u);
    EXPECT_FLOAT_EQ(context.blocks.layers().front().baseY, 0.0f);
    EXPECT_FLOAT_EQ(context.blocks.layers().back().baseY, -150.0f);
    EXPECT_TRUE(context.blocks.checkIntegrity());
    EXPECT_EQ(context.blocks.counts().voids, 0u);

    EXPECT_EQ(context.coins.size(), config.content.coinSites.size());
    EXPECT_GE(context.monsters.size(), 4u * context.coins.size());
    EXPECT_LE(context.monsters.size(), 5u * context.coins.size());
    for (const sim::Monster& monster : context.monsters) {
        EXPECT_TRUE(monster.isGuardian());
    }
    EXPECT_LE(context.trees.size(), static_cast<std::size_t>(config.content.treeAttempts));
    for (const sim::Tree& tree : context.trees) {
        EXPECT_FLOAT_EQ(tree.position.y, 0.0f);
        EXPECT_FALSE(std::abs(tree.position.x) < 5.0f && std::abs(tree.position.z) < 5.0f);
    }

    EXPECT_EQ(context.player.position, config.player.spawnPosition);
    EXPECT_EQ(context.player.health, config.player.maxHealth);
    EXPECT_EQ(context.state, sim::SessionState::Playing);
    EXPECT_EQ(context.spawn.initialSpawnsRemaining, config.spawn.initialSpawns);
}

TEST(SimulationTest, ResetRejectsConfigWithoutLayers) {
    using namespace layerfall;

    sim::Simulation simulation;
    sim::SimConfig config{};
    config.terrain.layerBaseYs.clear();
    EXPECT_FALSE(simulation.reset(config));
}

TEST(SimulationTest, SameSeedReplaysIdentically) {
    using namespace layerfall;

    sim::Simulation first;
    sim::Simulation second;
    sim::SimConfig config{};
    config.seed = 1234;
    // The diagonal run crosses a guarded coin; the session must outlast it.
    config.player.maxHealth = 1000000;
    ASSERT_TRUE(first.reset(config));
    ASSERT_TRUE(second.reset(config));

    core::InputState input;
    input.setDown(core::InputAction::MoveForward, true);
    input.setDown(core::InputAction::MoveLeft, true);
    for (int tick = 0; tick < 300; ++tick) {
        first.tick(input);
        second.tick(input);
        input.endTick();
    }

    EXPECT_EQ(first.tickCount(), 300u);
    EXPECT_EQ(first.context().player.position, second.context().player.position);
    ASSERT_EQ(first.context().monsters.size(), second.context().monsters.size());
    for (std::size_t i = 0; i < first.context().monsters.size(); ++i) {
        EXPECT_EQ(first.context().monsters[i].id, second.context().monsters[i].id);
        EXPECT_EQ(first.context().monsters[i].position, second.context().monsters[i].position);
    }
    // The initial wave is out by now.
    EXPECT_EQ(first.context().spawn.initialSpawnsRemaining, 0);
}

TEST(SimulationTest, PurchasesOnlyWhileShopIsOpen) {
    using namespace layerfall;

    sim::Simulation simulation;
    ASSERT_TRUE(simulation.reset(test::quietConfig()));
    simulation.context().player.coins = 10;
    simulation.context().player.health = 40;

    core::InputState input;
    tapAction(simulation, input, core::InputAction::BuyHeal);
    EXPECT_EQ(simulation.context().player.health, 40);
    EXPECT_EQ(simulation.context().player.coins, 10);

    tapAction(simulation, input, core::InputAction::ToggleShop);
    EXPECT_TRUE(simulation.context().shopOpen);
    input.setDown(core::InputAction::BuyHeal, true);
    simulation.tick(input);
    EXPECT_EQ(simulation.context().player.health, simulation.context().player.maxHealth);
    EXPECT_EQ(simulation.context().player.coins, 5);
    EXPECT_FALSE(simulation.events().empty());
}

TEST(SimulationTest, CastleBuildsOnlyWhileBuilderIsOpen) {
    using namespace layerfall;

    sim::Simulation simulation;
    ASSERT_TRUE(simulation.reset(test::quietConfig()));
    simulation.context().player.wood = 50;

    core::InputState input;
    tapAction(simulation, input, core::InputAction::BuildCastle);
    EXPECT_EQ(simulation.context().player.wood, 50);

    tapAction(simulation, input, core::InputAction::ToggleCastleBuilder);
    tapAction(simulation, input, core::InputAction::BuildCastle);
    EXPECT_EQ(simulation.context().player.wood, 0);
    EXPECT_GT(simulation.context().blocks.counts().placed, 0u);
}

TEST(SimulationTest, CoinsNearPlayerAreCollected) {
    using namespace layerfall;

    sim::Simulation simulation;
    ASSERT_TRUE(simulation.reset(test::quietConfig()));
    sim::WorldContext& context = simulation.context();
    sim::Coin coin{};
    coin.id = context.nextCoinId++;
    coin.position = context.player.position + math::Vector3{0.3f, 0.0f, 0.0f};
    context.coins.push_back(coin);
    sim::Coin farCoin{};
    farCoin.id = context.nextCoinId++;
    farCoin.position = context.player.position + math::Vector3{6.0f, 0.0f, 0.0f};
    context.coins.push_back(farCoin);

    simulation.tick(core::InputState{});
    // The collected coin is erased; the distant one stays.
    ASSERT_EQ(context.coins.size(), 1u);
    EXPECT_EQ(context.coins.front().id, farCoin.id);
    EXPECT_EQ(context.player.coins, 1);
    EXPECT_EQ(test::countEvents(context, sim::SimEventKind::CoinCollected), 1u);
}

TEST(SimulationTest, GameOverFreezesTheSession) {
    using namespace layerfall;

    sim::Simulation simulation;
    ASSERT_TRUE(simulation.reset(test::quietConfig()));
    sim::WorldContext& context = simulation.context();
    context.player.health = 0;

    simulation.tick(core::InputState{});
    EXPECT_EQ(simulation.state(), sim::SessionState::GameOver);
    const std::uint64_t frozenTick = simulation.tickCount();

    core::InputState input;
    input.setDown(core::InputAction::MoveForward, true);
    simulation.tick(input);
    EXPECT_EQ(simulation.tickCount(), frozenTick);
    EXPECT_EQ(context.player.position, context.config.player.spawnPosition);
}
