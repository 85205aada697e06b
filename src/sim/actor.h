#pragma once

#include <cstdint>
#include <optional>

#include "math/math.h"
#include "world/aabb.h"
#include "world/block.h"
#include "world/collision.h"

namespace layerfall::sim {

using MonsterId = std::uint32_t;
using CoinId = std::uint32_t;
using TreeId = std::uint32_t;

struct Actor {
    math::Vector3 position{};
    math::Vector3 velocity{};
    // Body box as offsets from position.
    math::Vector3 bodyMin{};
    math::Vector3 bodyMax{};
    bool grounded = false;
    bool stuckInVoid = false;
    // Remaining ticks of the hit/damage flash.
    int flashTicks = 0;

    [[nodiscard]] world::Aabb3f bounds() const {
        return world::makeBodyAabb(position, bodyMin, bodyMax);
    }

    [[nodiscard]] world::Aabb3f boundsAt(const math::Vector3& at) const {
        return world::makeBodyAabb(at, bodyMin, bodyMax);
    }

    [[nodiscard]] world::Footprint footprint() const {
        return world::Footprint{
            (bodyMax.x - bodyMin.x) * 0.5f,
            (bodyMax.z - bodyMin.z) * 0.5f,
            bodyMin.y
        };
    }

    [[nodiscard]] float bottom() const { return position.y + bodyMin.y; }
};

struct Player : Actor {
    int health = 100;
    int maxHealth = 100;
    int attackDamage = 18;
    float attackRange = 5.0f;
    int attackCooldownTicks = 0;

    int coins = 0;
    int wood = 0;
    int healthUpgradeLevel = 0;
    int attackUpgradeLevel = 0;

    bool hasVoidEscape = false;
    // Trap re-arms when this reaches zero after an escape.
    int voidEscapeGraceTicks = 0;
};

enum class MonsterMode : std::uint8_t {
    Roam = 0,
    GuardianPatrol = 1,
    GuardianAggro = 2
};

struct Monster : Actor {
    MonsterId id = 0;
    int level = 0;
    int health = 0;
    int maxHealth = 0;
    int damage = 0;
    float speed = 0.0f;
    float size = 0.0f;
    float attackRange = 2.0f;
    int attackCooldownTicks = 0;
    float facingYaw = 0.0f;
    world::LayerId layer = world::kInvalidLayerId;

    MonsterMode mode = MonsterMode::Roam;
    std::optional<CoinId> guardedCoin;
    math::Vector3 guardAnchor{};
    int aggroTicksRemaining = 0;

    [[nodiscard]] bool isGuardian() const { return guardedCoin.has_value(); }
    [[nodiscard]] bool isDead() const { return health <= 0; }
    [[nodiscard]] float healthFraction() const {
        if (maxHealth <= 0) {
            return 0.0f;
        }
        return static_cast<float>(health) / static_cast<float>(maxHealth);
    }
};

// Erased from WorldContext::coins on collection.
struct Coin {
    CoinId id = 0;
    math::Vector3 position{};
};

struct Tree {
    TreeId id = 0;
    math::Vector3 position{};
    int trunkHeight = 2;
    int woodYield = 3;
    bool cutDown = false;
};

// Trails the player at a yaw-relative offset.
struct CameraRig {
    float yaw = 0.0f;
    float distance = 10.0f;
    float heightOffset = 8.0f;
    math::Vector3 position{};
};

[[nodiscard]] const char* monsterModeName(MonsterMode mode);

} // namespace layerfall::sim
