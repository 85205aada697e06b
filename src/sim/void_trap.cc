#include "sim/void_trap.h"

#include "core/log.h"

namespace layerfall::sim {

bool inVoid(const world::BlockStore& store, const world::Aabb3f& body) {
    return store.overlapsVoid(body);
}

VoidTrapOutcome updatePlayerVoidTrap(WorldContext& context, bool escapeRequested) {
    Player& player = context.player;
    if (player.voidEscapeGraceTicks > 0) {
        --player.voidEscapeGraceTicks;
        player.stuckInVoid = false;
        return VoidTrapOutcome::Free;
    }

    if (!inVoid(context.blocks, player.bounds())) {
        player.stuckInVoid = false;
        return VoidTrapOutcome::Free;
    }

    if (!player.stuckInVoid) {
        player.stuckInVoid = true;
        context.emit(SimEventKind::PlayerTrapped, player.position);
        LF_LOGI("sim") << "player trapped in void at (" << player.position.x << ", "
                       << player.position.y << ", " << player.position.z << ")"
                       << (player.hasVoidEscape ? ", escape charge available" : "");
    }

    if (player.hasVoidEscape) {
        if (!escapeRequested) {
            return VoidTrapOutcome::HoldingCharge;
        }
        player.hasVoidEscape = false;
        player.stuckInVoid = false;
        player.voidEscapeGraceTicks = secondsToTicks(context.config.player.voidEscapeGraceSeconds);
        context.emit(SimEventKind::PlayerEscapedVoid, player.position);
        LF_LOGI("sim") << "void escape charge used";
        return VoidTrapOutcome::Escaped;
    }

    player.velocity = math::Vector3{};
    return VoidTrapOutcome::Frozen;
}

bool updateMonsterVoidTrap(const world::BlockStore& store, Monster& monster) {
    const bool stuck = inVoid(store, monster.bounds());
    if (stuck && !monster.stuckInVoid) {
        LF_LOGD("monster") << "monster " << monster.id << " trapped in void";
    }
    monster.stuckInVoid = stuck;
    if (stuck) {
        monster.velocity = math::Vector3{};
    }
    return stuck;
}

} // namespace layerfall::sim
