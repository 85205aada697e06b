#pragma once

#include <cstdint>
#include <vector>

#include "core/rng.h"
#include "sim/actor.h"
#include "sim/events.h"
#include "sim/sim_config.h"
#include "world/block_store.h"

// Simulation World Context
// Responsible for: all mutable state of one session, passed explicitly to every system.
// Should NOT do: per-tick logic of its own.
namespace layerfall::sim {

enum class SessionState : std::uint8_t {
    Playing = 0,
    GameOver = 1
};

struct SpawnDirectorState {
    int elapsedTicks = 0;
    int initialSpawnsRemaining = 0;
    int initialStaggerTicks = 0;
};

struct WorldContext {
    SimConfig config{};
    world::BlockStore blocks;
    Player player{};
    CameraRig camera{};
    std::vector<Monster> monsters;
    std::vector<Coin> coins;
    std::vector<Tree> trees;
    std::vector<SimEvent> events;
    core::Pcg32 rng{};
    SpawnDirectorState spawn{};

    SessionState state = SessionState::Playing;
    bool shopOpen = false;
    bool castleBuilderOpen = false;
    int kills = 0;
    std::uint64_t tick = 0;

    MonsterId nextMonsterId = 0;
    CoinId nextCoinId = 0;
    TreeId nextTreeId = 0;

    [[nodiscard]] const Coin* findCoin(CoinId id) const;
    [[nodiscard]] Monster* findMonster(MonsterId id);
    [[nodiscard]] const Monster* findMonster(MonsterId id) const;

    void emit(SimEventKind kind, const math::Vector3& position, int amount = 0, std::uint32_t subjectId = 0);
};

// Places the player at its spawn with base stats and resets the trailing camera behind it.
void resetPlayer(WorldContext& context);

} // namespace layerfall::sim
