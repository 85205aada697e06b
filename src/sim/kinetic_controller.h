#pragma once

#include <cstdint>
#include <optional>

#include "core/input.h"
#include "math/math.h"
#include "sim/actor.h"
#include "sim/sim_config.h"
#include "sim/void_trap.h"
#include "sim/world_context.h"

// Simulation Kinetic Controller
// Responsible for: player velocity integration, collision-constrained position commit, jumping, and the trailing camera.
// Should NOT do: monster behavior, block mutation, or combat.
namespace layerfall::sim {

enum class MoveDirection : std::uint8_t {
    Forward = 0,
    Backward = 1,
    Left = 2,
    Right = 3
};

struct KineticStepResult {
    VoidTrapOutcome trap = VoidTrapOutcome::Free;
    bool skyPath = false;
    bool landed = false;
    bool blockedX = false;
    bool blockedZ = false;
    bool stepUpPrevented = false;
    bool ceilingHit = false;
};

[[nodiscard]] std::optional<MoveDirection> moveDirectionFor(core::InputAction action);

// Unit vector on the ground plane, relative to a camera looking at the player from `cameraYaw`.
[[nodiscard]] math::Vector3 movementDirection(float cameraYaw, MoveDirection direction);

// Grounded-only. Returns false when the player is airborne.
bool applyDirectionalJump(Player& player, const PlayerConfig& config, float cameraYaw, MoveDirection direction);

void applyCameraDrag(CameraRig& camera, const CameraConfig& config, float dragDeltaX, float dragDeltaY);
void updateCamera(CameraRig& camera, const math::Vector3& target);
[[nodiscard]] math::Vector3 viewDirection(const CameraRig& camera, const math::Vector3& target);

// One fixed tick of player motion. The vertical position is resolved exactly once.
KineticStepResult stepPlayer(WorldContext& context, const core::InputState& input);

} // namespace layerfall::sim
