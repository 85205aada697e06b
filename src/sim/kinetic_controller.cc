#include "sim/kinetic_controller.h"

#include "core/log.h"
#include "world/collision.h"

#include <algorithm>
#include <cmath>

namespace layerfall::sim {
namespace {

constexpr float kHalfPi = math::kPi * 0.5f;

struct MovementBinding {
    core::InputAction action;
    MoveDirection direction;
};

constexpr MovementBinding kMovementBindings[] = {
    {core::InputAction::MoveForward, MoveDirection::Forward},
    {core::InputAction::MoveBackward, MoveDirection::Backward},
    {core::InputAction::MoveLeft, MoveDirection::Left},
    {core::InputAction::MoveRight, MoveDirection::Right},
};

void accumulateMovement(Player& player, const PlayerConfig& config, float cameraYaw, const core::InputState& input) {
    if (input.isDown(core::InputAction::JumpModifier)) {
        return;
    }
    for (const MovementBinding& binding : kMovementBindings) {
        if (input.isDown(binding.action)) {
            player.velocity += movementDirection(cameraYaw, binding.direction) * config.moveAcceleration;
        }
    }
}

void resolveSkyPath(WorldContext& context, math::Vector3& candidate, KineticStepResult& result) {
    Player& player = context.player;
    const world::CollisionConfig& collision = context.config.collision;

    result.skyPath = true;
    const bool wasGrounded = player.grounded;
    player.grounded = false;

    const std::optional<float> ground = world::groundHeight(
        context.blocks,
        candidate.x,
        candidate.z,
        player.footprint(),
        player.position.y,
        false,
        collision
    );
    if (!ground.has_value() || player.velocity.y > 0.0f) {
        return;
    }
    if (candidate.y + player.bodyMin.y <= *ground + collision.epsilon) {
        candidate.y = *ground - player.bodyMin.y;
        player.velocity.y = 0.0f;
        player.grounded = true;
        result.landed = !wasGrounded;
    }
}

} // namespace

std::optional<MoveDirection> moveDirectionFor(core::InputAction action) {
    for (const MovementBinding& binding : kMovementBindings) {
        if (binding.action == action) {
            return binding.direction;
        }
    }
    return std::nullopt;
}

math::Vector3 movementDirection(float cameraYaw, MoveDirection direction) {
    switch (direction) {
    case MoveDirection::Forward:
        return math::Vector3{-std::sin(cameraYaw), 0.0f, -std::cos(cameraYaw)};
    case MoveDirection::Backward:
        return math::Vector3{std::sin(cameraYaw), 0.0f, std::cos(cameraYaw)};
    case MoveDirection::Left:
        return math::Vector3{std::sin(cameraYaw - kHalfPi), 0.0f, std::cos(cameraYaw - kHalfPi)};
    case MoveDirection::Right:
        return math::Vector3{std::sin(cameraYaw + kHalfPi), 0.0f, std::cos(cameraYaw + kHalfPi)};
    default:
        return math::Vector3{};
    }
}

bool applyDirectionalJump(Player& player, const PlayerConfig& config, float cameraYaw, MoveDirection direction) {
    if (!player.grounded) {
        return false;
    }
    const math::Vector3 horizontal = movementDirection(cameraYaw, direction) * config.jumpPower;
    player.velocity.x = horizontal.x;
    player.velocity.z = horizontal.z;
    player.velocity.y = config.jumpPower * config.jumpVerticalScale;
    player.grounded = false;
    return true;
}

void applyCameraDrag(CameraRig& camera, const CameraConfig& config, float dragDeltaX, float dragDeltaY) {
    camera.yaw += dragDeltaX * config.dragYawPerPixel;
    camera.heightOffset = std::clamp(
        camera.heightOffset - (dragDeltaY * config.dragHeightPerPixel),
        config.minHeightOffset,
        config.maxHeightOffset
    );
}

void updateCamera(CameraRig& camera, const math::Vector3& target) {
    camera.position = math::Vector3{
        target.x + (std::sin(camera.yaw) * camera.distance),
        target.y + camera.heightOffset,
        target.z + (std::cos(camera.yaw) * camera.distance)
    };
}

math::Vector3 viewDirection(const CameraRig& camera, const math::Vector3& target) {
    return math::normalize(target - camera.position);
}

KineticStepResult stepPlayer(WorldContext& context, const core::InputState& input) {
    KineticStepResult result{};
    Player& player = context.player;
    const PlayerConfig& config = context.config.player;
    const world::CollisionConfig& collision = context.config.collision;

    const bool escapeRequested = input.anyMovementDown() || input.isDown(core::InputAction::JumpModifier);
    result.trap = updatePlayerVoidTrap(context, escapeRequested);
    if (result.trap == VoidTrapOutcome::Frozen) {
        updateCamera(context.camera, player.position);
        return result;
    }

    accumulateMovement(player, config, context.camera.yaw, input);
    player.velocity.x *= config.friction;
    player.velocity.z *= config.friction;
    if (!player.grounded) {
        player.velocity.y = std::max(player.velocity.y - config.gravity, -config.maxFallSpeed);
    }

    const math::Vector3 start = player.position;
    math::Vector3 candidate = start + player.velocity;

    if (world::isInSkyBand(start.y, collision) || world::isInSkyBand(candidate.y, collision)) {
        resolveSkyPath(context, candidate, result);
        player.position = candidate;
        updateCamera(context.camera, player.position);
        return result;
    }

    math::Vector3 next = start;

    if (player.velocity.x != 0.0f) {
        math::Vector3 trial = next;
        trial.x = candidate.x;
        const world::ContactResult contact = world::resolveCollision(
            context.blocks, player.boundsAt(next), player.boundsAt(trial), world::Axis::X, player.velocity.x, collision);
        if (contact.blocked) {
            player.velocity.x = 0.0f;
            result.blockedX = true;
        } else {
            next.x = trial.x;
        }
    }

    if (player.velocity.z != 0.0f) {
        math::Vector3 trial = next;
        trial.z = candidate.z;
        const world::ContactResult contact = world::resolveCollision(
            context.blocks, player.boundsAt(next), player.boundsAt(trial), world::Axis::Z, player.velocity.z, collision);
        if (contact.blocked) {
            player.velocity.z = 0.0f;
            result.blockedZ = true;
        } else {
            next.z = trial.z;
        }
    }

    // Standing actors may not walk onto higher ground; reaching it takes a jump.
    const bool movedHorizontally = next.x != start.x || next.z != start.z;
    if (movedHorizontally && player.grounded && std::fabs(player.velocity.y) < config.stationaryVelocityThreshold) {
        const world::Footprint footprint = player.footprint();
        const std::optional<float> currentGround =
            world::groundHeight(context.blocks, start.x, start.z, footprint, start.y, false, collision);
        const std::optional<float> destinationGround =
            world::groundHeight(context.blocks, next.x, next.z, footprint, start.y, true, collision);
        if (currentGround.has_value() && destinationGround.has_value() &&
            *destinationGround > *currentGround + collision.epsilon) {
            next.x = start.x;
            next.z = start.z;
            player.velocity.x = 0.0f;
            player.velocity.z = 0.0f;
            result.stepUpPrevented = true;
            LF_LOGT("sim") << "step-up onto " << *destinationGround << " from " << *currentGround << " prevented";
        }
    }

    math::Vector3 verticalTrial = next;
    verticalTrial.y = candidate.y;
    const world::ContactResult vertical = world::resolveCollision(
        context.blocks, player.boundsAt(next), player.boundsAt(verticalTrial), world::Axis::Y, player.velocity.y, collision);
    const bool wasGrounded = player.grounded;
    if (player.velocity.y > 0.0f) {
        player.grounded = false;
        if (vertical.ceiling) {
            player.velocity.y = 0.0f;
            result.ceilingHit = true;
        } else {
            next.y = verticalTrial.y;
        }
    } else if (vertical.landed) {
        next.y = vertical.landingTop - player.bodyMin.y;
        player.velocity.y = 0.0f;
        player.grounded = true;
        result.landed = !wasGrounded;
    } else {
        next.y = verticalTrial.y;
        player.grounded = false;
    }

    player.position = next;
    updateCamera(context.camera, player.position);
    return result;
}

} // namespace layerfall::sim
