#include "sim/monster_controller.h"

#include "core/log.h"
#include "sim/combat.h"
#include "sim/difficulty.h"
#include "sim/void_trap.h"
#include "world/collision.h"

#include <algorithm>
#include <cmath>

namespace layerfall::sim {
namespace {

constexpr float kTwoPi = math::kPi * 2.0f;

world::LayerId layerUnder(const WorldContext& context, float y) {
    const world::WorldLayer* layer = context.blocks.layerForHeight(y);
    return layer != nullptr ? layer->id : world::kInvalidLayerId;
}

math::Vector3 snappedPosition(const WorldContext& context, float x, float z, world::LayerId layer) {
    const float ground = world::terrainSnapHeight(context.blocks, x, z, layer);
    return math::Vector3{x, ground + context.config.monster.groundOffset, z};
}

void tryMonsterAttack(WorldContext& context, Monster& monster) {
    if (context.state == SessionState::GameOver || monster.attackCooldownTicks > 0) {
        return;
    }
    if (math::distance(monster.position, context.player.position) > monster.attackRange) {
        return;
    }
    damagePlayer(context, monster.damage, monster.id);
    monster.attackCooldownTicks = secondsToTicks(context.config.monster.attackCooldownSeconds);
}

void tickMonsterTimers(Monster& monster) {
    if (monster.attackCooldownTicks > 0) {
        --monster.attackCooldownTicks;
    }
    if (monster.flashTicks > 0) {
        --monster.flashTicks;
    }
    if (monster.aggroTicksRemaining > 0) {
        --monster.aggroTicksRemaining;
    }
}

std::size_t removeDeadMonsters(WorldContext& context) {
    std::size_t removed = 0;
    auto it = context.monsters.begin();
    while (it != context.monsters.end()) {
        if (!it->isDead()) {
            ++it;
            continue;
        }
        ++context.kills;
        ++removed;
        context.emit(SimEventKind::MonsterKilled, it->position, it->level, it->id);
        LF_LOGI("monster") << "monster " << it->id << " (level " << it->level << ") killed, kills " << context.kills;
        it = context.monsters.erase(it);
    }
    return removed;
}

} // namespace

Monster makeMonster(WorldContext& context, int level, const math::Vector3& groundPosition, world::LayerId layer) {
    const MonsterConfig& config = context.config.monster;
    const MonsterStats stats = monsterStatsForLevel(config, level);

    Monster monster{};
    monster.id = context.nextMonsterId++;
    monster.level = level;
    monster.health = stats.health;
    monster.maxHealth = stats.health;
    monster.damage = stats.damage;
    monster.speed = stats.speed;
    monster.size = stats.size;
    monster.attackRange = config.attackRange;
    monster.layer = layer;
    monster.position = groundPosition;
    monster.grounded = true;

    const float half = stats.size * 0.5f;
    monster.bodyMin = math::Vector3{-half, -half, -half};
    monster.bodyMax = math::Vector3{half, stats.size * config.bodyHeightScale, half};
    return monster;
}

MonsterId spawnRoamingMonster(WorldContext& context) {
    const SpawnConfig& config = context.config.spawn;
    const Player& player = context.player;

    const float angle = context.rng.nextFloat(0.0f, kTwoPi);
    const float radius = context.rng.nextFloat(config.minDistance, config.maxDistance);
    const float x = player.position.x + (std::cos(angle) * radius);
    const float z = player.position.z + (std::sin(angle) * radius);
    const world::LayerId layer = layerUnder(context, player.bottom());

    const int level = roamSpawnLevel(config, context.kills);
    Monster monster = makeMonster(context, level, snappedPosition(context, x, z, layer), layer);
    monster.mode = MonsterMode::Roam;

    const MonsterId id = monster.id;
    context.emit(SimEventKind::MonsterSpawned, monster.position, level, id);
    LF_LOGD("monster") << "roaming monster " << id << " (level " << level << ") spawned at ("
                       << monster.position.x << ", " << monster.position.y << ", " << monster.position.z << ")";
    context.monsters.push_back(monster);
    return id;
}

std::size_t spawnGuardians(WorldContext& context, CoinId coinId) {
    const Coin* coin = context.findCoin(coinId);
    if (coin == nullptr) {
        LF_LOGW("monster") << "cannot spawn guardians for unknown coin " << coinId;
        return 0;
    }
    const GuardianConfig& config = context.config.guardian;
    const math::Vector3 coinPosition = coin->position;
    const world::LayerId layer = layerUnder(context, coinPosition.y);

    const int count = context.rng.nextInt(config.minPerCoin, config.maxPerCoin);
    for (int i = 0; i < count; ++i) {
        const float angle = (static_cast<float>(i) / static_cast<float>(count)) * kTwoPi;
        const float radius = context.rng.nextFloat(config.ringMinRadius, config.ringMaxRadius);
        const float x = coinPosition.x + (std::cos(angle) * radius);
        const float z = coinPosition.z + (std::sin(angle) * radius);

        Monster guardian = makeMonster(context, config.level, snappedPosition(context, x, z, layer), layer);
        guardian.mode = MonsterMode::GuardianPatrol;
        guardian.guardedCoin = coinId;
        guardian.guardAnchor = guardian.position;
        context.emit(SimEventKind::MonsterSpawned, guardian.position, guardian.level, guardian.id);
        context.monsters.push_back(guardian);
    }
    LF_LOGD("monster") << count << " guardians spawned around coin " << coinId;
    return static_cast<std::size_t>(count);
}

void triggerAggro(Monster& monster, const GuardianConfig& config) {
    if (!monster.isGuardian()) {
        return;
    }
    if (monster.mode != MonsterMode::GuardianAggro) {
        LF_LOGD("monster") << "guardian " << monster.id << " " << monsterModeName(monster.mode)
                           << " -> " << monsterModeName(MonsterMode::GuardianAggro);
    }
    monster.mode = MonsterMode::GuardianAggro;
    monster.aggroTicksRemaining = secondsToTicks(config.aggroDurationSeconds);
}

MonsterTarget selectTarget(WorldContext& context, Monster& monster) {
    const math::Vector3 playerPosition = context.player.position;
    if (!monster.isGuardian()) {
        monster.mode = MonsterMode::Roam;
        return MonsterTarget{true, playerPosition};
    }

    const Coin* coin = context.findCoin(*monster.guardedCoin);
    if (coin == nullptr) {
        LF_LOGD("monster") << "guardian " << monster.id << " lost its coin, roaming";
        monster.guardedCoin.reset();
        monster.mode = MonsterMode::Roam;
        monster.aggroTicksRemaining = 0;
        return MonsterTarget{true, playerPosition};
    }

    const GuardianConfig& config = context.config.guardian;
    const math::Vector3 coinPosition = coin->position;
    const float playerToCoin = math::distanceXZ(coinPosition, playerPosition);

    bool aggroJustEnded = false;
    if (monster.mode == MonsterMode::GuardianAggro &&
        (monster.aggroTicksRemaining <= 0 || playerToCoin > config.aggroLeashRadius)) {
        monster.mode = MonsterMode::GuardianPatrol;
        monster.aggroTicksRemaining = 0;
        aggroJustEnded = true;
        LF_LOGD("monster") << "guardian " << monster.id << " calmed down, returning to its post";
    }

    if (monster.mode == MonsterMode::GuardianAggro) {
        return MonsterTarget{true, playerPosition};
    }
    monster.mode = MonsterMode::GuardianPatrol;

    const float toAnchor = math::distanceXZ(monster.guardAnchor, monster.position);
    if (aggroJustEnded || toAnchor > config.guardRadius) {
        return MonsterTarget{true, monster.guardAnchor};
    }

    const float toCoin = math::distanceXZ(coinPosition, monster.position);
    if (playerToCoin < config.alertRadius) {
        if (playerToCoin < config.aggroTriggerRadius) {
            triggerAggro(monster, config);
        }
        if (toCoin < config.guardRadius * config.chaseTetherScale) {
            return MonsterTarget{true, playerPosition};
        }
        return MonsterTarget{true, coinPosition};
    }

    if (toAnchor > config.anchorArrivalRadius) {
        return MonsterTarget{true, monster.guardAnchor};
    }
    if (toCoin > config.guardRadius) {
        return MonsterTarget{true, coinPosition};
    }
    if (toCoin < config.guardRadius * config.idleInnerFraction) {
        const float angle = context.rng.nextFloat(0.0f, kTwoPi);
        const float ring = config.guardRadius * config.patrolRingFraction;
        const math::Vector3 patrolPoint{
            coinPosition.x + (std::cos(angle) * ring),
            monster.position.y,
            coinPosition.z + (std::sin(angle) * ring)
        };
        return MonsterTarget{context.rng.chance(config.patrolStepChance), patrolPoint};
    }
    return MonsterTarget{false, monster.position};
}

void stepMonster(WorldContext& context, Monster& monster) {
    if (updateMonsterVoidTrap(context.blocks, monster)) {
        // Trapped monsters stay put but still strike anything that comes close.
        tryMonsterAttack(context, monster);
        return;
    }

    const MonsterTarget target = selectTarget(context, monster);
    float nextX = monster.position.x;
    float nextZ = monster.position.z;
    if (target.shouldMove) {
        const float dx = target.point.x - monster.position.x;
        const float dz = target.point.z - monster.position.z;
        const float targetDistance = std::sqrt((dx * dx) + (dz * dz));
        if (targetDistance > context.config.monster.arrivalDistance) {
            nextX += (dx / targetDistance) * monster.speed;
            nextZ += (dz / targetDistance) * monster.speed;
            monster.facingYaw = std::atan2(dx, dz);
        }
    }
    monster.position = snappedPosition(context, nextX, nextZ, monster.layer);

    tryMonsterAttack(context, monster);
}

void updateMonsters(WorldContext& context) {
    removeDeadMonsters(context);
    for (Monster& monster : context.monsters) {
        tickMonsterTimers(monster);
        stepMonster(context, monster);
    }
}

void updateSpawnDirector(WorldContext& context) {
    const SpawnConfig& config = context.config.spawn;
    SpawnDirectorState& director = context.spawn;

    if (director.initialSpawnsRemaining > 0) {
        if (director.initialStaggerTicks > 0) {
            --director.initialStaggerTicks;
        } else {
            spawnRoamingMonster(context);
            --director.initialSpawnsRemaining;
            director.initialStaggerTicks = secondsToTicks(config.initialSpawnStaggerSeconds);
        }
    }

    ++director.elapsedTicks;
    const int intervalTicks = secondsToTicks(spawnIntervalSeconds(config, context.kills));
    if (director.elapsedTicks >= intervalTicks && context.monsters.size() < config.populationCap) {
        spawnRoamingMonster(context);
        director.elapsedTicks = 0;
    }
}

} // namespace layerfall::sim
