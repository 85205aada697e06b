#pragma once

#include <cstdint>

#include "math/math.h"

namespace layerfall::sim {

enum class SimEventKind : std::uint8_t {
    BlockBroken = 0,
    BlockPlaced,
    TreeCut,
    CoinCollected,
    MonsterSpawned,
    MonsterHit,
    MonsterKilled,
    PlayerDamaged,
    PlayerHealed,
    PlayerTrapped,
    PlayerEscapedVoid,
    CastleBuilt,
    PurchaseMade,
    GameOver
};

// Published for presentation layers; cleared at the start of every tick.
struct SimEvent {
    SimEventKind kind = SimEventKind::BlockBroken;
    math::Vector3 position{};
    int amount = 0;
    std::uint32_t subjectId = 0;
};

[[nodiscard]] const char* simEventKindName(SimEventKind kind);

} // namespace layerfall::sim
