#pragma once

#include <cstdint>

#include "sim/world_context.h"

// Simulation Combat subsystem
// Responsible for: the player's attack action and damage applied to the player.
// Should NOT do: monster movement or target selection.
namespace layerfall::sim {

struct AttackResult {
    bool performed = false;
    bool brokeBlock = false;
    bool cutTree = false;
    int monstersHit = 0;

    [[nodiscard]] bool hitAnything() const { return brokeBlock || cutTree || monstersHit > 0; }
};

// Mines the targeted block, cuts the targeted tree, then strikes every monster in range.
// Does nothing while the attack cooldown runs; any hit restarts it.
AttackResult playerAttack(WorldContext& context);

// Returns the number of monsters struck. Struck guardians turn aggressive.
int strikeMonstersInRange(WorldContext& context);

// Clamps health at zero and ends the session when it gets there.
void damagePlayer(WorldContext& context, int amount, std::uint32_t sourceId);

} // namespace layerfall::sim
