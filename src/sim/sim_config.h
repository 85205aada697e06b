#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "math/math.h"
#include "world/collision.h"
#include "world/world_gen.h"

// Simulation Config subsystem
// Responsible for: tunable constants of one play session, grouped by the system that reads them.
// Should NOT do: hold runtime state.
namespace layerfall::sim {

inline constexpr int kTicksPerSecond = 60;

inline int secondsToTicks(float seconds) {
    if (seconds <= 0.0f) {
        return 0;
    }
    return static_cast<int>(std::lround(seconds * static_cast<float>(kTicksPerSecond)));
}

struct PlayerConfig {
    math::Vector3 spawnPosition{0.5f, 1.0f, 0.5f};
    math::Vector3 bodyMin{-0.4f, -1.0f, -0.4f};
    math::Vector3 bodyMax{0.4f, 1.0f, 0.4f};
    // Per-tick quantities.
    float moveAcceleration = 0.1f;
    float friction = 0.9f;
    float gravity = 0.02f;
    float maxFallSpeed = 2.0f;
    float jumpPower = 0.3f;
    float jumpVerticalScale = 1.5f;
    float stationaryVelocityThreshold = 0.01f;

    int maxHealth = 100;
    int attackDamage = 18;
    float attackRange = 5.0f;
    float attackCooldownSeconds = 0.65f;
    float voidEscapeGraceSeconds = 1.0f;
    int damageFlashTicks = 12;
};

struct CameraConfig {
    float distance = 10.0f;
    float heightOffset = 8.0f;
    float minHeightOffset = 3.0f;
    float maxHeightOffset = 15.0f;
    float dragYawPerPixel = 0.005f;
    float dragHeightPerPixel = 0.05f;
    float initialYaw = 0.0f;
};

struct MonsterConfig {
    int baseHealth = 70;
    int healthPerLevel = 30;
    int baseDamage = 16;
    int damagePerLevel = 8;
    float baseSpeed = 0.15f;
    float speedPerLevel = 0.015f;
    float baseSize = 0.8f;
    float sizePerLevel = 0.1f;
    float bodyHeightScale = 1.2f;
    float attackRange = 2.0f;
    float attackCooldownSeconds = 1.2f;
    // Monsters ride this far above the terrain they snap to.
    float groundOffset = 0.5f;
    float arrivalDistance = 0.1f;
    int hitFlashTicks = 6;
};

struct GuardianConfig {
    int level = 8;
    int minPerCoin = 4;
    int maxPerCoin = 5;
    float ringMinRadius = 2.0f;
    float ringMaxRadius = 3.5f;
    float guardRadius = 6.0f;
    float alertRadius = 15.0f;
    float aggroTriggerRadius = 8.0f;
    float aggroDurationSeconds = 20.0f;
    float aggroLeashRadius = 40.0f;
    float anchorArrivalRadius = 1.0f;
    // Guardians still chase inside alertRadius while within guardRadius * chaseTetherScale of the coin.
    float chaseTetherScale = 2.0f;
    float idleInnerFraction = 0.5f;
    float patrolRingFraction = 0.7f;
    float patrolStepChance = 0.05f;
};

struct SpawnConfig {
    int killsPerLevel = 3;
    int maxRoamLevel = 5;
    float minDistance = 15.0f;
    float maxDistance = 35.0f;
    float baseIntervalSeconds = 6.0f;
    float intervalReductionPerKill = 0.15f;
    float minIntervalSeconds = 2.0f;
    std::size_t populationCap = 20;
    int initialSpawns = 6;
    float initialSpawnStaggerSeconds = 0.8f;
};

struct MiningConfig {
    float rayStep = 0.5f;
    float breakRange = 4.0f;
    float treeReach = 5.0f;
    float treeHitRadius = 1.5f;
    float placeReach = 5.0f;
    float placeKeepOutRadius = 1.5f;
    int placeWoodCost = 1;
    // A block supports the player when its top is within these bounds of the player's bottom.
    float supportBelowTolerance = 0.5f;
    float supportAboveTolerance = 0.1f;
};

struct CastleConfig {
    int woodCost = 50;
    int halfSize = 4;
    int wallHeight = 4;
    int towerHeight = 6;
    int entranceWidth = 3;
    int entranceHeight = 2;
    int maxObstructions = 10;
};

struct ShopConfig {
    int healCost = 5;
    int healthUpgradeBaseCost = 10;
    int healthUpgradeCostStep = 5;
    int healthUpgradeAmount = 25;
    int attackUpgradeBaseCost = 15;
    int attackUpgradeCostStep = 5;
    int attackUpgradeAmount = 10;
    int voidEscapeCost = 20;
};

struct ContentConfig {
    std::vector<std::array<float, 2>> coinSites{
        {20.0f, 20.0f}, {-20.0f, 20.0f}, {20.0f, -20.0f}, {-20.0f, -20.0f},
        {30.0f, 10.0f}, {-30.0f, -10.0f}, {10.0f, -30.0f}, {-10.0f, 30.0f}
    };
    float coinHeightOffset = 0.5f;
    float coinPickupRadius = 0.8f;

    int treeAttempts = 30;
    float treeSpread = 37.5f;
    float treeSpawnClearance = 5.0f;
    int treeMinTrunk = 2;
    int treeMaxTrunk = 3;
    int treeMinWood = 3;
    int treeMaxWood = 5;
};

struct SimConfig {
    std::uint64_t seed = 0x6c6179657266616cULL;
    world::TerrainConfig terrain{};
    world::CollisionConfig collision{};
    PlayerConfig player{};
    CameraConfig camera{};
    MonsterConfig monster{};
    GuardianConfig guardian{};
    SpawnConfig spawn{};
    MiningConfig mining{};
    CastleConfig castle{};
    ShopConfig shop{};
    ContentConfig content{};
};

} // namespace layerfall::sim
