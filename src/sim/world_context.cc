#include "sim/world_context.h"

#include "sim/kinetic_controller.h"

namespace layerfall::sim {

const char* monsterModeName(MonsterMode mode) {
    switch (mode) {
    case MonsterMode::Roam:
        return "roam";
    case MonsterMode::GuardianPatrol:
        return "guardian-patrol";
    case MonsterMode::GuardianAggro:
        return "guardian-aggro";
    default:
        return "unknown";
    }
}

const char* simEventKindName(SimEventKind kind) {
    switch (kind) {
    case SimEventKind::BlockBroken:
        return "block-broken";
    case SimEventKind::BlockPlaced:
        return "block-placed";
    case SimEventKind::TreeCut:
        return "tree-cut";
    case SimEventKind::CoinCollected:
        return "coin-collected";
    case SimEventKind::MonsterSpawned:
        return "monster-spawned";
    case SimEventKind::MonsterHit:
        return "monster-hit";
    case SimEventKind::MonsterKilled:
        return "monster-killed";
    case SimEventKind::PlayerDamaged:
        return "player-damaged";
    case SimEventKind::PlayerHealed:
        return "player-healed";
    case SimEventKind::PlayerTrapped:
        return "player-trapped";
    case SimEventKind::PlayerEscapedVoid:
        return "player-escaped-void";
    case SimEventKind::CastleBuilt:
        return "castle-built";
    case SimEventKind::PurchaseMade:
        return "purchase-made";
    case SimEventKind::GameOver:
        return "game-over";
    default:
        return "unknown";
    }
}

const Coin* WorldContext::findCoin(CoinId id) const {
    for (const Coin& coin : coins) {
        if (coin.id == id) {
            return &coin;
        }
    }
    return nullptr;
}

Monster* WorldContext::findMonster(MonsterId id) {
    for (Monster& monster : monsters) {
        if (monster.id == id) {
            return &monster;
        }
    }
    return nullptr;
}

const Monster* WorldContext::findMonster(MonsterId id) const {
    for (const Monster& monster : monsters) {
        if (monster.id == id) {
            return &monster;
        }
    }
    return nullptr;
}

void WorldContext::emit(SimEventKind kind, const math::Vector3& position, int amount, std::uint32_t subjectId) {
    events.push_back(SimEvent{kind, position, amount, subjectId});
}

void resetPlayer(WorldContext& context) {
    const PlayerConfig& config = context.config.player;
    Player player{};
    player.position = config.spawnPosition;
    player.bodyMin = config.bodyMin;
    player.bodyMax = config.bodyMax;
    player.grounded = true;
    player.health = config.maxHealth;
    player.maxHealth = config.maxHealth;
    player.attackDamage = config.attackDamage;
    player.attackRange = config.attackRange;
    context.player = player;

    context.camera = CameraRig{};
    context.camera.yaw = context.config.camera.initialYaw;
    context.camera.distance = context.config.camera.distance;
    context.camera.heightOffset = context.config.camera.heightOffset;
    updateCamera(context.camera, context.player.position);
}

} // namespace layerfall::sim
