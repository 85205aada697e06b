#include <gtest/gtest.h>

#include <vector>

#include "core/grid3.h"
#include "world/block_store.h"

TEST(BlockStoreTest, LayersStaySortedHighestFirst) {
    using namespace layerfall;

    world::BlockStore store;
    const world::LayerId middle = store.addLayer(-50.0f);
    const world::LayerId top = store.addLayer(0.0f);
    store.addLayer(-100.0f);

    ASSERT_EQ(store.layers().size(), 3u);
    EXPECT_FLOAT_EQ(store.layers()[0].baseY, 0.0f);
    EXPECT_FLOAT_EQ(store.layers()[1].baseY, -50.0f);
    EXPECT_FLOAT_EQ(store.layers()[2].baseY, -100.0f);

    EXPECT_EQ(store.addLayer(0.0f), top);
    EXPECT_EQ(store.layers().size(), 3u);
    ASSERT_NE(store.layer(middle), nullptr);
    EXPECT_FLOAT_EQ(store.layer(middle)->baseY, -50.0f);
}

TEST(BlockStoreTest, LayerLookupsPickLayerAtOrBelowHeight) {
    using namespace layerfall;

    world::BlockStore store;
    EXPECT_EQ(store.layerForHeight(0.0f), nullptr);
    EXPECT_EQ(store.layerBelow(0.0f), nullptr);

    store.addLayer(0.0f);
    store.addLayer(-50.0f);

    EXPECT_FLOAT_EQ(store.layerForHeight(0.0f)->baseY, 0.0f);
    EXPECT_FLOAT_EQ(store.layerForHeight(12.0f)->baseY, 0.0f);
    EXPECT_FLOAT_EQ(store.layerForHeight(-10.0f)->baseY, -50.0f);
    EXPECT_FLOAT_EQ(store.layerForHeight(-500.0f)->baseY, -50.0f);

    EXPECT_FLOAT_EQ(store.layerBelow(10.0f)->baseY, 0.0f);
    EXPECT_FLOAT_EQ(store.layerBelow(0.0f)->baseY, -50.0f);
}

TEST(BlockStoreTest, BreakThenPlaceRevivesRecordAsPlaced) {
    using namespace layerfall;

    world::BlockStore store;
    const world::LayerId layerId = store.addLayer(0.0f);
    const core::Cell3i cell{0, -1, 0};
    const world::BlockId original = store.addBlock(cell, world::BlockMaterial::Ground, layerId);

    EXPECT_TRUE(store.breakBlock(original));
    EXPECT_FALSE(store.breakBlock(original));
    EXPECT_EQ(store.solidBlockAtCell(cell), nullptr);
    ASSERT_NE(store.blockAtCell(cell), nullptr);
    EXPECT_TRUE(store.blockAtCell(cell)->isVoid());

    world::BlockId placedId = world::kInvalidBlockId;
    const world::PlaceOutcome outcome = store.placeBlock(
        cell, world::BlockMaterial::Wood, math::Vector3{10.0f, 10.0f, 10.0f}, 1.5f, &placedId);
    EXPECT_EQ(outcome, world::PlaceOutcome::Placed);
    EXPECT_EQ(placedId, original);

    const world::Block* revived = store.solidBlockAtCell(cell);
    ASSERT_NE(revived, nullptr);
    EXPECT_EQ(revived->state, world::BlockState::Placed);
    EXPECT_EQ(revived->material, world::BlockMaterial::Wood);
    EXPECT_FLOAT_EQ(revived->top(), 0.0f);

    const world::BlockCounts counts = store.counts();
    EXPECT_EQ(counts.solid, 0u);
    EXPECT_EQ(counts.placed, 1u);
    EXPECT_EQ(counts.voids, 0u);
    EXPECT_TRUE(store.checkIntegrity());
}

TEST(BlockStoreTest, PlacementRefusesOccupiedCellsAndActorKeepOut) {
    using namespace layerfall;

    world::BlockStore store;
    const world::LayerId layerId = store.addLayer(0.0f);
    store.addBlock(core::Cell3i{0, 0, 0}, world::BlockMaterial::Platform, layerId);
    const world::BlockCounts before = store.counts();

    const math::Vector3 actor{1.5f, 0.5f, 0.5f};
    EXPECT_EQ(store.placeBlock(core::Cell3i{0, 0, 0}, world::BlockMaterial::Wood, actor, 0.0f),
              world::PlaceOutcome::Occupied);
    EXPECT_EQ(store.placeBlock(core::Cell3i{1, 0, 0}, world::BlockMaterial::Wood, actor, 1.5f),
              world::PlaceOutcome::TooCloseToActor);
    EXPECT_EQ(store.counts(), before);

    EXPECT_EQ(store.placeBlock(core::Cell3i{3, 0, 0}, world::BlockMaterial::Wood, actor, 1.5f),
              world::PlaceOutcome::Placed);
    EXPECT_EQ(store.counts().placed, 1u);
    EXPECT_TRUE(store.checkIntegrity());
}

TEST(BlockStoreTest, QueriesNeverReturnVoidBlocksAsCollidable) {
    using namespace layerfall;

    world::BlockStore store;
    const world::LayerId layerId = store.addLayer(0.0f);
    const world::BlockId kept = store.addBlock(core::Cell3i{0, -1, 0}, world::BlockMaterial::Ground, layerId);
    const world::BlockId broken = store.addBlock(core::Cell3i{1, -1, 0}, world::BlockMaterial::Ground, layerId);
    ASSERT_TRUE(store.breakBlock(broken));

    const world::Aabb3f box{-0.5f, 2.5f, -1.5f, 0.5f, -0.5f, 1.5f};
    std::vector<world::BlockId> ids;
    store.queryOverlapping(box, ids);
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], kept);

    store.queryVoidOverlapping(box, ids);
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], broken);
    EXPECT_TRUE(store.overlapsVoid(box));
}

TEST(BlockStoreTest, TouchingFacesDoNotOverlap) {
    using namespace layerfall;

    world::BlockStore store;
    const world::LayerId layerId = store.addLayer(0.0f);
    store.addBlock(core::Cell3i{0, 0, 0}, world::BlockMaterial::Platform, layerId);

    std::vector<world::BlockId> ids;
    store.queryOverlapping(world::Aabb3f{1.0f, 2.0f, 0.0f, 1.0f, 0.0f, 1.0f}, ids);
    EXPECT_TRUE(ids.empty());
    store.queryOverlapping(world::Aabb3f{0.0f, 1.0f, 1.0f, 2.0f, 0.0f, 1.0f}, ids);
    EXPECT_TRUE(ids.empty());
    store.queryOverlapping(world::Aabb3f{0.9f, 2.0f, 0.0f, 1.0f, 0.0f, 1.0f}, ids);
    EXPECT_EQ(ids.size(), 1u);
}

TEST(BlockStoreTest, LayerExtentTracksGroundAndPlatforms) {
    using namespace layerfall;

    world::BlockStore store;
    const world::LayerId upper = store.addLayer(0.0f);
    const world::LayerId lower = store.addLayer(-50.0f);
    store.addBlock(core::Cell3i{0, -1, 0}, world::BlockMaterial::Ground, upper);
    store.addBlock(core::Cell3i{0, 4, 0}, world::BlockMaterial::Platform, upper);
    store.addBlock(core::Cell3i{0, -51, 0}, world::BlockMaterial::Ground, lower);

    EXPECT_EQ(store.layer(upper)->minCellY, -1);
    EXPECT_EQ(store.layer(upper)->maxCellY, 4);
    EXPECT_EQ(store.lowestCellY(), -51);

    store.clear();
    EXPECT_TRUE(store.layers().empty());
    EXPECT_EQ(store.counts().total(), 0u);
}
