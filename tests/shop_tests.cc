#include <gtest/gtest.h>

#include <cstddef>
#include <vector>

#include "sim/construction.h"
#include "sim/shop.h"
#include "test_world.h"

TEST(ShopTest, UpgradesGetDearerWithEachLevel) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld();
    context.player.coins = 100;

    EXPECT_TRUE(sim::buyHealthUpgrade(context));
    EXPECT_EQ(context.player.coins, 90);
    EXPECT_EQ(context.player.maxHealth, 125);
    EXPECT_EQ(context.player.health, 125);
    EXPECT_EQ(context.player.healthUpgradeLevel, 1);

    EXPECT_EQ(sim::shopItemCost(context.player, context.config.shop, sim::ShopItem::HealthUpgrade), 15);
    EXPECT_TRUE(sim::buyHealthUpgrade(context));
    EXPECT_EQ(context.player.coins, 75);

    EXPECT_TRUE(sim::buyAttackUpgrade(context));
    EXPECT_EQ(context.player.coins, 60);
    EXPECT_EQ(context.player.attackDamage, context.config.player.attackDamage + 10);
    EXPECT_EQ(sim::shopItemCost(context.player, context.config.shop, sim::ShopItem::AttackUpgrade), 20);
    EXPECT_EQ(test::countEvents(context, sim::SimEventKind::PurchaseMade), 3u);
}

TEST(ShopTest, HealRestoresFullHealthOnlyWhenHurt) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld();
    context.player.coins = 20;

    EXPECT_FALSE(sim::buyHeal(context));
    EXPECT_EQ(context.player.coins, 20);

    context.player.health = 30;
    EXPECT_TRUE(sim::buyHeal(context));
    EXPECT_EQ(context.player.health, context.player.maxHealth);
    EXPECT_EQ(context.player.coins, 15);
    EXPECT_EQ(test::countEvents(context, sim::SimEventKind::PlayerHealed), 1u);
}

TEST(ShopTest, PurchasesNeedEnoughCoins) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld();
    context.player.coins = 4;
    context.player.health = 10;

    EXPECT_FALSE(sim::buyHeal(context));
    EXPECT_FALSE(sim::buyHealthUpgrade(context));
    EXPECT_FALSE(sim::buyAttackUpgrade(context));
    EXPECT_FALSE(sim::buyVoidEscape(context));
    EXPECT_EQ(context.player.coins, 4);
    EXPECT_EQ(context.player.health, 10);
    EXPECT_TRUE(context.events.empty());
}

TEST(ShopTest, OnlyOneVoidEscapeChargeAtATime) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld();
    context.player.coins = 50;

    EXPECT_TRUE(sim::purchase(context, sim::ShopItem::VoidEscape));
    EXPECT_TRUE(context.player.hasVoidEscape);
    EXPECT_EQ(context.player.coins, 30);
    EXPECT_FALSE(sim::purchase(context, sim::ShopItem::VoidEscape));
    EXPECT_EQ(context.player.coins, 30);
}

TEST(CastleTest, BlueprintHasTowersWallsAndEntrance) {
    using namespace layerfall;

    const sim::CastleConfig config{};
    const std::vector<core::Cell3i> cells = sim::castleBlueprint(0, 0, 0, config);
    // 4 towers of 6, 28 wall columns of 4, minus a 3 x 2 entrance.
    EXPECT_EQ(cells.size(), 130u);

    auto contains = [&cells](const core::Cell3i& cell) {
        for (const core::Cell3i& candidate : cells) {
            if (candidate == cell) {
                return true;
            }
        }
        return false;
    };
    EXPECT_TRUE(contains(core::Cell3i{4, 5, 4}));
    EXPECT_FALSE(contains(core::Cell3i{3, 5, 4}));
    EXPECT_TRUE(contains(core::Cell3i{3, 3, 4}));
    EXPECT_FALSE(contains(core::Cell3i{0, 0, -4}));
    EXPECT_FALSE(contains(core::Cell3i{1, 1, -4}));
    EXPECT_TRUE(contains(core::Cell3i{0, 2, -4}));
    EXPECT_TRUE(contains(core::Cell3i{0, 0, 4}));
    EXPECT_FALSE(contains(core::Cell3i{0, 0, 0}));
    // Nine cells per side, from -4 to 4.
    EXPECT_TRUE(contains(core::Cell3i{-4, 0, 0}));
    EXPECT_TRUE(contains(core::Cell3i{-4, 5, -4}));
    EXPECT_FALSE(contains(core::Cell3i{5, 0, 0}));
    EXPECT_FALSE(contains(core::Cell3i{-5, 0, 0}));
}

TEST(CastleTest, BuildingNeedsWood) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld(12);
    context.player.wood = 49;
    const std::size_t blocksBefore = context.blocks.blocks().size();

    const sim::CastleResult result = sim::tryBuildCastle(context);
    EXPECT_EQ(result.outcome, sim::CastleOutcome::NotEnoughWood);
    EXPECT_EQ(context.player.wood, 49);
    EXPECT_EQ(context.blocks.blocks().size(), blocksBefore);
}

TEST(CastleTest, BuildsStoneCastleAroundPlayer) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld(12);
    context.player.wood = 60;

    const sim::CastleResult result = sim::tryBuildCastle(context);
    ASSERT_EQ(result.outcome, sim::CastleOutcome::Built);
    EXPECT_EQ(result.blocksPlaced, 130);
    EXPECT_EQ(context.player.wood, 10);
    EXPECT_EQ(context.blocks.counts().placed, 130u);
    EXPECT_EQ(test::countEvents(context, sim::SimEventKind::CastleBuilt), 1u);

    const int cx = result.center.x;
    const int cz = result.center.z;
    const world::Block* tower = context.blocks.solidBlockAtCell(core::Cell3i{cx + 4, 5, cz - 4});
    ASSERT_NE(tower, nullptr);
    EXPECT_EQ(tower->material, world::BlockMaterial::Stone);
    EXPECT_EQ(tower->state, world::BlockState::Placed);
    EXPECT_EQ(context.blocks.solidBlockAtCell(core::Cell3i{cx, 0, cz - 4}), nullptr);
    EXPECT_TRUE(context.blocks.checkIntegrity());
}

TEST(CastleTest, CrowdedSiteIsRefused) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld(12);
    const world::LayerId layerId = test::mainLayerId(context);
    context.player.wood = 60;
    // Fill eleven cells of the back wall's footprint.
    for (int x = -3; x <= 5; ++x) {
        context.blocks.addBlock(core::Cell3i{x, 0, 5}, world::BlockMaterial::Platform, layerId);
    }
    context.blocks.addBlock(core::Cell3i{-3, 1, 5}, world::BlockMaterial::Platform, layerId);
    context.blocks.addBlock(core::Cell3i{5, 1, 5}, world::BlockMaterial::Platform, layerId);

    const sim::CastleResult result = sim::tryBuildCastle(context);
    EXPECT_EQ(result.outcome, sim::CastleOutcome::Obstructed);
    EXPECT_EQ(result.obstructions, 11);
    EXPECT_EQ(context.player.wood, 60);
    EXPECT_EQ(context.blocks.counts().placed, 0u);
}

TEST(CastleTest, BuildsAtRequestedColumnOnPlayerLayer) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld(12);
    context.player.wood = 50;

    EXPECT_EQ(sim::countCastleObstructions(context, -6, -6, 0), 0);
    const sim::CastleResult result = sim::tryBuildCastleAt(context, -6, -6);
    ASSERT_EQ(result.outcome, sim::CastleOutcome::Built);
    EXPECT_STREQ(sim::castleOutcomeName(result.outcome), "built");
    EXPECT_EQ(result.center, (core::Cell3i{-6, 0, -6}));
    EXPECT_EQ(context.player.wood, 0);
    EXPECT_NE(context.blocks.solidBlockAtCell(core::Cell3i{-10, 0, -10}), nullptr);
    EXPECT_EQ(sim::countCastleObstructions(context, -6, -6, 0), 58);

    const sim::CastleResult again = sim::tryBuildCastleAt(context, -6, -6);
    EXPECT_EQ(again.outcome, sim::CastleOutcome::NotEnoughWood);
    EXPECT_STREQ(sim::castleOutcomeName(again.outcome), "not-enough-wood");
}
