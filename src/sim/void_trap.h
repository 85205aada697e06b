#pragma once

#include <cstdint>

#include "sim/actor.h"
#include "sim/world_context.h"
#include "world/aabb.h"
#include "world/block_store.h"

// Simulation Void Trap subsystem
// Responsible for: detecting actors inside broken-block holes and freezing them there.
// Should NOT do: block mutation or ordinary motion integration.
namespace layerfall::sim {

enum class VoidTrapOutcome : std::uint8_t {
    Free = 0,
    // Inside a hole with no escape charge; velocity was zeroed and the actor must not move this tick.
    Frozen = 1,
    // Inside a hole holding an unused escape charge; motion continues.
    HoldingCharge = 2,
    // The escape charge was spent this tick.
    Escaped = 3
};

[[nodiscard]] bool inVoid(const world::BlockStore& store, const world::Aabb3f& body);

// Updates the player's trap state. escapeRequested is true when any movement or jump input is held.
VoidTrapOutcome updatePlayerVoidTrap(WorldContext& context, bool escapeRequested);

// Monsters have no escape path. Returns true while the monster is stuck.
bool updateMonsterVoidTrap(const world::BlockStore& store, Monster& monster);

} // namespace layerfall::sim
