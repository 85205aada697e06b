#pragma once

#include <cstdint>
#include <optional>

#include "world/aabb.h"
#include "world/block.h"
#include "world/block_store.h"

// World Collision subsystem
// Responsible for: axis-aligned contacts against the block grid, standable heights, and the sky band.
// Should NOT do: velocity integration, input handling, or block mutation.
namespace layerfall::world {

struct CollisionConfig {
    // Blocks whose top is above this height, and actors whose center is above it, are in the sky band.
    float skyBandY = 2.0f;
    // Largest obstruction an actor can be in contact with sideways without being blocked.
    float stepHeight = 0.5f;
    float epsilon = 0.001f;
};

enum class Axis : std::uint8_t {
    X = 0,
    Y = 1,
    Z = 2
};

struct ContactResult {
    // Lateral: the axis move must be reverted. Vertical: upward motion hit a ceiling.
    bool blocked = false;
    bool stepContact = false;
    bool ceiling = false;
    bool landed = false;
    float landingTop = 0.0f;
    BlockId blockId = kInvalidBlockId;
};

// Horizontal extent and bottom of an actor body relative to its position.
struct Footprint {
    float halfExtentX = 0.4f;
    float halfExtentZ = 0.4f;
    float bottomOffset = -1.0f;
};

[[nodiscard]] bool isInSkyBand(float y, const CollisionConfig& config = {});
[[nodiscard]] bool isSkyBandBlock(const Block& block, const CollisionConfig& config = {});

// Tests the move from `current` to `future` along one axis. Void and sky-band blocks never collide.
// A falling actor lands on the highest overlapped top at most one step height above its feet.
[[nodiscard]] ContactResult resolveCollision(
    const BlockStore& store,
    const Aabb3f& current,
    const Aabb3f& future,
    Axis axis,
    float velocityOnAxis,
    const CollisionConfig& config = {}
);

// Highest standable block top under the footprint at (x, z) that does not exceed the actor bottom,
// plus the step height when allowStepUp is set. Returns nullopt over open air.
// A reference height in the sky band redirects the query to the layer below it.
[[nodiscard]] std::optional<float> groundHeight(
    const BlockStore& store,
    float x,
    float z,
    const Footprint& footprint,
    float referenceY,
    bool allowStepUp,
    const CollisionConfig& config = {}
);

// Terrain snap for actors that ignore step rules: highest non-void top containing (x, z)
// within the given layer, or one below the layer base over a hole.
[[nodiscard]] float terrainSnapHeight(const BlockStore& store, float x, float z, LayerId layerId);

} // namespace layerfall::world
