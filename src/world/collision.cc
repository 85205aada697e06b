#include "world/collision.h"

#include "core/log.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace layerfall::world {
namespace {

constexpr float kOpenAirHoleDepth = 1.0f;

bool isCollidable(const Block& block, const CollisionConfig& config) {
    return !block.isVoid() && !isSkyBandBlock(block, config);
}

} // namespace

bool isInSkyBand(float y, const CollisionConfig& config) {
    return y > config.skyBandY;
}

bool isSkyBandBlock(const Block& block, const CollisionConfig& config) {
    return block.top() > config.skyBandY;
}

ContactResult resolveCollision(
    const BlockStore& store,
    const Aabb3f& current,
    const Aabb3f& future,
    Axis axis,
    float velocityOnAxis,
    const CollisionConfig& config
) {
    ContactResult result{};
    std::vector<BlockId> hits;

    if (axis != Axis::Y) {
        if (velocityOnAxis == 0.0f) {
            return result;
        }
        store.queryOverlapping(future, hits);
        const float stepLimit = current.minY + config.stepHeight;
        for (const BlockId id : hits) {
            const Block* candidate = store.block(id);
            if (candidate == nullptr || !isCollidable(*candidate, config)) {
                continue;
            }
            if (candidate->top() > stepLimit && candidate->bottom() < current.maxY) {
                result.blocked = true;
                result.blockId = id;
                return result;
            }
            if (candidate->top() <= stepLimit && candidate->bottom() <= current.minY + config.epsilon) {
                result.stepContact = true;
                result.blockId = id;
            }
        }
        return result;
    }

    if (velocityOnAxis > 0.0f) {
        store.queryOverlapping(future, hits);
        for (const BlockId id : hits) {
            const Block* candidate = store.block(id);
            if (candidate == nullptr || !isCollidable(*candidate, config)) {
                continue;
            }
            if (candidate->bottom() >= current.maxY - config.epsilon) {
                result.blocked = true;
                result.ceiling = true;
                result.blockId = id;
                return result;
            }
        }
        return result;
    }

    // A lateral step contact can leave the body overlapping a low block; its top is a landing surface too.
    const float landingLimit = current.minY + config.stepHeight + config.epsilon;
    Aabb3f sweep = future;
    sweep.minY = std::min(future.minY, current.minY) - config.epsilon;
    sweep.maxY = current.maxY;
    store.queryOverlapping(sweep, hits);
    for (const BlockId id : hits) {
        const Block* candidate = store.block(id);
        if (candidate == nullptr || !isCollidable(*candidate, config)) {
            continue;
        }
        const float top = candidate->top();
        if (top > landingLimit) {
            continue;
        }
        if (!result.landed || top > result.landingTop) {
            result.landed = true;
            result.landingTop = top;
            result.blockId = id;
        }
    }
    return result;
}

std::optional<float> groundHeight(
    const BlockStore& store,
    float x,
    float z,
    const Footprint& footprint,
    float referenceY,
    bool allowStepUp,
    const CollisionConfig& config
) {
    const float bottom = referenceY + footprint.bottomOffset;
    const float limit = bottom + (allowStepUp ? config.stepHeight : 0.0f) + config.epsilon;
    const Aabb3f footprintBox{
        x - footprint.halfExtentX, x + footprint.halfExtentX,
        0.0f, 0.0f,
        z - footprint.halfExtentZ, z + footprint.halfExtentZ
    };

    const bool redirected = isInSkyBand(referenceY, config);
    const WorldLayer* redirectLayer = redirected ? store.layerBelow(referenceY) : nullptr;
    if (redirected && redirectLayer == nullptr) {
        return std::nullopt;
    }

    int topCellY = static_cast<int>(std::floor(limit)) - 1;
    int bottomCellY = store.lowestCellY();
    if (redirectLayer != nullptr) {
        if (redirectLayer->maxCellY < redirectLayer->minCellY) {
            return std::nullopt;
        }
        topCellY = std::min(topCellY, redirectLayer->maxCellY);
        bottomCellY = redirectLayer->minCellY;
    }

    const int startX = static_cast<int>(std::floor(footprintBox.minX));
    const int endX = static_cast<int>(std::ceil(footprintBox.maxX)) - 1;
    const int startZ = static_cast<int>(std::floor(footprintBox.minZ));
    const int endZ = static_cast<int>(std::ceil(footprintBox.maxZ)) - 1;

    std::optional<float> best;
    for (int cz = startZ; cz <= endZ; ++cz) {
        for (int cx = startX; cx <= endX; ++cx) {
            for (int cy = topCellY; cy >= bottomCellY; --cy) {
                const Block* candidate = store.solidBlockAtCell(core::Cell3i{cx, cy, cz});
                if (candidate == nullptr || !aabbOverlapsXZ(footprintBox, candidate->bounds())) {
                    continue;
                }
                if (redirectLayer != nullptr) {
                    if (candidate->layer != redirectLayer->id) {
                        continue;
                    }
                } else if (isSkyBandBlock(*candidate, config)) {
                    continue;
                }
                const float top = candidate->top();
                if (top > limit) {
                    continue;
                }
                if (!best.has_value() || top > *best) {
                    best = top;
                }
                break;
            }
        }
    }
    return best;
}

float terrainSnapHeight(const BlockStore& store, float x, float z, LayerId layerId) {
    const WorldLayer* owner = store.layer(layerId);
    if (owner == nullptr) {
        LF_LOGW("world") << "terrain snap against unknown layer " << layerId;
        return -kOpenAirHoleDepth;
    }

    const float holeHeight = owner->baseY - kOpenAirHoleDepth;
    if (owner->maxCellY < owner->minCellY) {
        return holeHeight;
    }

    // Points on a cell face belong to both neighbours.
    const int startX = static_cast<int>(std::ceil(x)) - 1;
    const int endX = static_cast<int>(std::floor(x));
    const int startZ = static_cast<int>(std::ceil(z)) - 1;
    const int endZ = static_cast<int>(std::floor(z));

    std::optional<float> best;
    for (int cz = startZ; cz <= endZ; ++cz) {
        for (int cx = startX; cx <= endX; ++cx) {
            for (int cy = owner->maxCellY; cy >= owner->minCellY; --cy) {
                const Block* candidate = store.solidBlockAtCell(core::Cell3i{cx, cy, cz});
                if (candidate == nullptr || candidate->layer != owner->id) {
                    continue;
                }
                if (!best.has_value() || candidate->top() > *best) {
                    best = candidate->top();
                }
                break;
            }
        }
    }
    return best.value_or(holeHeight);
}

} // namespace layerfall::world
