#include "sim/combat.h"

#include "core/log.h"
#include "sim/mining.h"
#include "sim/monster_controller.h"

namespace layerfall::sim {

AttackResult playerAttack(WorldContext& context) {
    AttackResult result{};
    Player& player = context.player;
    if (player.attackCooldownTicks > 0) {
        return result;
    }

    result.performed = true;
    result.brokeBlock = tryBreakTargetBlock(context);
    result.cutTree = tryCutTargetTree(context);
    result.monstersHit = strikeMonstersInRange(context);

    if (result.hitAnything()) {
        player.attackCooldownTicks = secondsToTicks(context.config.player.attackCooldownSeconds);
    }
    return result;
}

int strikeMonstersInRange(WorldContext& context) {
    const Player& player = context.player;
    const MonsterConfig& monsterConfig = context.config.monster;
    int hits = 0;
    for (Monster& monster : context.monsters) {
        if (monster.isDead()) {
            continue;
        }
        if (math::distance(monster.position, player.position) > player.attackRange) {
            continue;
        }
        monster.health -= player.attackDamage;
        monster.flashTicks = monsterConfig.hitFlashTicks;
        if (monster.isGuardian()) {
            triggerAggro(monster, context.config.guardian);
        }
        context.emit(SimEventKind::MonsterHit, monster.position, player.attackDamage, monster.id);
        LF_LOGD("sim") << "monster " << monster.id << " hit for " << player.attackDamage
                       << ", health " << monster.health << "/" << monster.maxHealth;
        ++hits;
    }
    return hits;
}

void damagePlayer(WorldContext& context, int amount, std::uint32_t sourceId) {
    Player& player = context.player;
    if (context.state == SessionState::GameOver || amount <= 0) {
        return;
    }

    player.health -= amount;
    player.flashTicks = context.config.player.damageFlashTicks;
    context.emit(SimEventKind::PlayerDamaged, player.position, amount, sourceId);
    LF_LOGD("sim") << "player took " << amount << " damage from monster " << sourceId
                   << ", health " << player.health << "/" << player.maxHealth;

    if (player.health <= 0) {
        player.health = 0;
        context.state = SessionState::GameOver;
        context.emit(SimEventKind::GameOver, player.position, context.kills);
        LF_LOGI("sim") << "game over after " << context.kills << " kill(s) at tick " << context.tick;
    }
}

} // namespace layerfall::sim
