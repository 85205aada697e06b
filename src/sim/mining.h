#pragma once

#include <optional>

#include "math/math.h"
#include "sim/actor.h"
#include "sim/sim_config.h"
#include "sim/world_context.h"
#include "world/block.h"

// Simulation Mining subsystem
// Responsible for: ray-marched targeting along the view direction, block breaking, tree cutting, and single block placement.
// Should NOT do: attack cooldowns or monster damage.
namespace layerfall::sim {

// Sample points at rayStep, 2 * rayStep, ... up to and including maxDistance.
template <typename Fn>
bool marchRay(const math::Vector3& origin, const math::Vector3& direction, float rayStep, float maxDistance, Fn&& visit) {
    if (rayStep <= 0.0f) {
        return false;
    }
    for (int step = 1;; ++step) {
        const float travelled = static_cast<float>(step) * rayStep;
        if (travelled > maxDistance) {
            return false;
        }
        if (visit(origin + (direction * travelled))) {
            return true;
        }
    }
}

// First ray sample inside a non-void block wins; among the blocks containing it, the one nearest the player.
[[nodiscard]] std::optional<world::BlockId> findTargetBlock(const WorldContext& context);
[[nodiscard]] bool isSupportingBlock(const Player& player, const world::Block& block, const MiningConfig& config);
// Breaks the targeted block unless it is out of range or holds the player up.
bool tryBreakTargetBlock(WorldContext& context);

[[nodiscard]] std::optional<TreeId> findTargetTree(const WorldContext& context);
bool tryCutTargetTree(WorldContext& context);

// Places one wood block at the first free grid cell along the view ray.
bool tryPlaceBlock(WorldContext& context);

} // namespace layerfall::sim
