#pragma once

#include <cstddef>

#include "math/math.h"
#include "sim/actor.h"
#include "sim/world_context.h"
#include "world/block.h"

// Simulation Monster Controller
// Responsible for: monster spawning, roam/guardian target selection, terrain-snapped movement, and monster attacks.
// Should NOT do: player physics, block mutation, or player-initiated combat.
namespace layerfall::sim {

struct MonsterTarget {
    bool shouldMove = false;
    math::Vector3 point{};
};

[[nodiscard]] Monster makeMonster(WorldContext& context, int level, const math::Vector3& groundPosition, world::LayerId layer);

// Roaming spawn on a random ring around the player. Returns the new monster id.
MonsterId spawnRoamingMonster(WorldContext& context);
// Rings a coin with guardians anchored where they spawn. Returns how many were added.
std::size_t spawnGuardians(WorldContext& context, CoinId coinId);

// Starts or refreshes a guardian's aggro window. Roaming monsters are unaffected.
void triggerAggro(Monster& monster, const GuardianConfig& config);

// Picks this tick's movement target and advances the guardian mode machine.
[[nodiscard]] MonsterTarget selectTarget(WorldContext& context, Monster& monster);

// One tick for one monster: void trap, target, movement, terrain snap, attack.
void stepMonster(WorldContext& context, Monster& monster);

// Removes dead monsters, counting each as a kill, then steps the survivors.
void updateMonsters(WorldContext& context);

// Initial staggered wave plus periodic roaming spawns.
void updateSpawnDirector(WorldContext& context);

} // namespace layerfall::sim
