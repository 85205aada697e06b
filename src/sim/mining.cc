#include "sim/mining.h"

#include "core/grid3.h"
#include "core/log.h"
#include "sim/kinetic_controller.h"

#include <cmath>
#include <limits>

namespace layerfall::sim {
namespace {

struct CellSpan {
    int low = 0;
    int high = 0;
};

// Inclusive containment: a point on a face lies in both neighbouring cells.
CellSpan cellsAround(float value) {
    return CellSpan{static_cast<int>(std::ceil(value)) - 1, static_cast<int>(std::floor(value))};
}

} // namespace

std::optional<world::BlockId> findTargetBlock(const WorldContext& context) {
    const Player& player = context.player;
    const MiningConfig& config = context.config.mining;
    const math::Vector3 origin = player.position;
    const math::Vector3 direction = viewDirection(context.camera, origin);

    std::optional<world::BlockId> best;
    marchRay(origin, direction, config.rayStep, config.breakRange, [&](const math::Vector3& sample) {
        const CellSpan spanX = cellsAround(sample.x);
        const CellSpan spanY = cellsAround(sample.y);
        const CellSpan spanZ = cellsAround(sample.z);

        float bestDistance = std::numeric_limits<float>::infinity();
        for (int y = spanY.low; y <= spanY.high; ++y) {
            for (int z = spanZ.low; z <= spanZ.high; ++z) {
                for (int x = spanX.low; x <= spanX.high; ++x) {
                    const world::Block* candidate = context.blocks.solidBlockAtCell(core::Cell3i{x, y, z});
                    if (candidate == nullptr) {
                        continue;
                    }
                    const float centerDistance = math::distance(candidate->center(), origin);
                    if (centerDistance < bestDistance) {
                        bestDistance = centerDistance;
                        best = candidate->id;
                    }
                }
            }
        }
        return best.has_value();
    });
    return best;
}

bool isSupportingBlock(const Player& player, const world::Block& block, const MiningConfig& config) {
    const world::Aabb3f body = player.bounds();
    const world::Aabb3f blockBounds = block.bounds();
    const float top = block.top();
    return body.minY <= top + config.supportAboveTolerance &&
           body.minY >= top - config.supportBelowTolerance &&
           world::aabbOverlapsXZ(body, blockBounds);
}

bool tryBreakTargetBlock(WorldContext& context) {
    const std::optional<world::BlockId> target = findTargetBlock(context);
    if (!target.has_value()) {
        return false;
    }
    const world::Block* block = context.blocks.block(*target);
    if (block == nullptr) {
        return false;
    }

    const MiningConfig& config = context.config.mining;
    const float reach = math::distance(block->center(), context.player.position);
    if (reach > config.breakRange) {
        LF_LOGD("mining") << "block " << block->id << " out of reach (" << reach << ")";
        return false;
    }
    if (isSupportingBlock(context.player, *block, config)) {
        LF_LOGD("mining") << "block " << block->id << " supports the player, not breaking";
        return false;
    }

    const math::Vector3 center = block->center();
    const world::BlockId id = block->id;
    if (!context.blocks.breakBlock(id)) {
        return false;
    }
    context.emit(SimEventKind::BlockBroken, center, 0, id);
    LF_LOGD("mining") << "block " << id << " broken at (" << center.x << ", " << center.y << ", " << center.z << ")";
    return true;
}

std::optional<TreeId> findTargetTree(const WorldContext& context) {
    const MiningConfig& config = context.config.mining;
    const math::Vector3 origin = context.player.position;
    const math::Vector3 direction = viewDirection(context.camera, origin);

    std::optional<TreeId> best;
    marchRay(origin, direction, config.rayStep, config.treeReach, [&](const math::Vector3& sample) {
        float bestDistance = config.treeHitRadius;
        for (const Tree& tree : context.trees) {
            if (tree.cutDown) {
                continue;
            }
            const float sampleDistance = math::distance(sample, tree.position);
            if (sampleDistance < bestDistance) {
                bestDistance = sampleDistance;
                best = tree.id;
            }
        }
        return best.has_value();
    });
    return best;
}

bool tryCutTargetTree(WorldContext& context) {
    const std::optional<TreeId> target = findTargetTree(context);
    if (!target.has_value()) {
        return false;
    }
    for (Tree& tree : context.trees) {
        if (tree.id != *target || tree.cutDown) {
            continue;
        }
        if (math::distance(tree.position, context.player.position) > context.config.mining.treeReach) {
            return false;
        }
        tree.cutDown = true;
        context.player.wood += tree.woodYield;
        context.emit(SimEventKind::TreeCut, tree.position, tree.woodYield, tree.id);
        LF_LOGD("mining") << "tree " << tree.id << " cut for " << tree.woodYield
                          << " wood (total " << context.player.wood << ")";
        return true;
    }
    return false;
}

bool tryPlaceBlock(WorldContext& context) {
    const MiningConfig& config = context.config.mining;
    Player& player = context.player;
    if (player.wood < config.placeWoodCost) {
        LF_LOGD("mining") << "not enough wood to place a block";
        return false;
    }

    const math::Vector3 origin = player.position;
    const math::Vector3 direction = viewDirection(context.camera, origin);

    world::BlockId placedId = world::kInvalidBlockId;
    const bool placed = marchRay(origin, direction, config.rayStep, config.placeReach, [&](const math::Vector3& sample) {
        const core::Cell3i cell = core::cellContaining(sample);
        const world::PlaceOutcome outcome =
            context.blocks.placeBlock(cell, world::BlockMaterial::Wood, origin, config.placeKeepOutRadius, &placedId);
        return outcome == world::PlaceOutcome::Placed;
    });
    if (!placed) {
        return false;
    }

    player.wood -= config.placeWoodCost;
    const world::Block* block = context.blocks.block(placedId);
    const math::Vector3 center = block != nullptr ? block->center() : origin;
    context.emit(SimEventKind::BlockPlaced, center, 0, placedId);
    LF_LOGD("mining") << "block " << placedId << " placed, wood remaining " << player.wood;
    return true;
}

} // namespace layerfall::sim
