#include <gtest/gtest.h>

#include <optional>

#include "sim/combat.h"
#include "sim/mining.h"
#include "sim/monster_controller.h"
#include "test_world.h"

// With the default camera behind the player, the view ray meets the ground two cells ahead.
TEST(MiningTest, ViewRayTargetsGroundAheadOfPlayer) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld();
    const std::optional<world::BlockId> target = sim::findTargetBlock(context);
    ASSERT_TRUE(target.has_value());
    const world::Block* block = context.blocks.block(*target);
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block->cell, (core::Cell3i{0, -1, -2}));
}

TEST(MiningTest, RaySamplesStopAtMaxDistance) {
    using namespace layerfall;

    int samples = 0;
    const bool hit = sim::marchRay(
        math::Vector3{}, math::Vector3{1.0f, 0.0f, 0.0f}, 0.5f, 4.0f,
        [&samples](const math::Vector3&) {
            ++samples;
            return false;
        });
    EXPECT_FALSE(hit);
    EXPECT_EQ(samples, 8);
}

TEST(MiningTest, SupportingBlockIsNeverBroken) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld();
    const world::Block* under = context.blocks.solidBlockAtCell(core::Cell3i{0, -1, 0});
    const world::Block* ahead = context.blocks.solidBlockAtCell(core::Cell3i{0, -1, -2});
    ASSERT_NE(under, nullptr);
    ASSERT_NE(ahead, nullptr);
    EXPECT_TRUE(sim::isSupportingBlock(context.player, *under, context.config.mining));
    EXPECT_FALSE(sim::isSupportingBlock(context.player, *ahead, context.config.mining));

    // Looking straight down puts the supporting block first on the ray.
    context.camera.position = math::Vector3{0.5f, 10.0f, 0.5f};
    EXPECT_FALSE(sim::tryBreakTargetBlock(context));
    EXPECT_NE(context.blocks.solidBlockAtCell(core::Cell3i{0, -1, 0}), nullptr);
    EXPECT_EQ(context.blocks.counts().voids, 0u);
}

TEST(MiningTest, BreakThenPlaceRestoresStandableCell) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld();
    const core::Cell3i cell{0, -1, -2};
    const world::BlockId original = context.blocks.solidBlockAtCell(cell)->id;

    ASSERT_TRUE(sim::tryBreakTargetBlock(context));
    EXPECT_EQ(context.blocks.solidBlockAtCell(cell), nullptr);
    EXPECT_EQ(test::countEvents(context, sim::SimEventKind::BlockBroken), 1u);

    context.player.wood = 1;
    ASSERT_TRUE(sim::tryPlaceBlock(context));
    EXPECT_EQ(context.player.wood, 0);
    const world::Block* placed = context.blocks.solidBlockAtCell(cell);
    ASSERT_NE(placed, nullptr);
    EXPECT_EQ(placed->id, original);
    EXPECT_EQ(placed->state, world::BlockState::Placed);
    EXPECT_EQ(placed->material, world::BlockMaterial::Wood);
    EXPECT_EQ(test::countEvents(context, sim::SimEventKind::BlockPlaced), 1u);
    EXPECT_TRUE(context.blocks.checkIntegrity());

    EXPECT_FALSE(sim::tryPlaceBlock(context));
}

TEST(MiningTest, CuttingTreeYieldsWoodOnce) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld();
    sim::Tree tree{};
    tree.id = context.nextTreeId++;
    tree.position = math::Vector3{0.5f, 0.0f, -1.5f};
    tree.woodYield = 4;
    context.trees.push_back(tree);

    const std::optional<sim::TreeId> target = sim::findTargetTree(context);
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(*target, tree.id);
    EXPECT_TRUE(sim::tryCutTargetTree(context));
    EXPECT_EQ(context.player.wood, 4);
    EXPECT_TRUE(context.trees.front().cutDown);
    EXPECT_FALSE(sim::tryCutTargetTree(context));
    EXPECT_EQ(context.player.wood, 4);
}

TEST(CombatTest, AttackStrikesMonstersInRangeAndStartsCooldown) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld();
    sim::Coin coin{};
    coin.id = context.nextCoinId++;
    coin.position = math::Vector3{6.0f, 0.5f, 6.0f};
    context.coins.push_back(coin);

    sim::Monster near = sim::makeMonster(context, 0, math::Vector3{2.5f, 0.5f, 0.5f}, test::mainLayerId(context));
    near.guardedCoin = coin.id;
    near.mode = sim::MonsterMode::GuardianPatrol;
    context.monsters.push_back(near);
    context.monsters.push_back(
        sim::makeMonster(context, 0, math::Vector3{7.5f, 0.5f, 0.5f}, test::mainLayerId(context)));

    const sim::AttackResult result = sim::playerAttack(context);
    EXPECT_TRUE(result.performed);
    EXPECT_TRUE(result.brokeBlock);
    EXPECT_EQ(result.monstersHit, 1);
    EXPECT_EQ(context.monsters[0].health, 70 - context.player.attackDamage);
    EXPECT_EQ(context.monsters[0].mode, sim::MonsterMode::GuardianAggro);
    EXPECT_GT(context.monsters[0].flashTicks, 0);
    EXPECT_EQ(context.monsters[1].health, 70);
    EXPECT_EQ(context.player.attackCooldownTicks, sim::secondsToTicks(context.config.player.attackCooldownSeconds));

    const sim::AttackResult blocked = sim::playerAttack(context);
    EXPECT_FALSE(blocked.performed);
    EXPECT_EQ(context.monsters[0].health, 70 - context.player.attackDamage);
}

TEST(CombatTest, PlayerDeathEndsSession) {
    using namespace layerfall;

    sim::WorldContext context = test::makeFlatWorld();
    context.player.health = 10;
    sim::damagePlayer(context, 25, 7);
    EXPECT_EQ(context.player.health, 0);
    EXPECT_EQ(context.state, sim::SessionState::GameOver);
    EXPECT_EQ(test::countEvents(context, sim::SimEventKind::GameOver), 1u);

    sim::damagePlayer(context, 25, 7);
    EXPECT_EQ(test::countEvents(context, sim::SimEventKind::PlayerDamaged), 1u);
}
