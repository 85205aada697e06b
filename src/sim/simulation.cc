#include "sim/simulation.h"

#include "core/log.h"
#include "sim/combat.h"
#include "sim/construction.h"
#include "sim/kinetic_controller.h"
#include "sim/mining.h"
#include "sim/monster_controller.h"
#include "sim/shop.h"
#include "world/collision.h"
#include "world/world_gen.h"

#include <chrono>
#include <cmath>

namespace layerfall::sim {
namespace {

constexpr int kTreeSiteRetries = 20;

const world::WorldLayer* topLayer(const WorldContext& context) {
    const std::vector<world::WorldLayer>& layers = context.blocks.layers();
    return layers.empty() ? nullptr : &layers.front();
}

bool insideSpawnClearance(float x, float z, float clearance) {
    return std::abs(x) < clearance && std::abs(z) < clearance;
}

} // namespace

std::size_t populateTrees(WorldContext& context) {
    const world::WorldLayer* layer = topLayer(context);
    if (layer == nullptr) {
        return 0;
    }
    const ContentConfig& config = context.config.content;
    std::size_t placed = 0;
    for (int attempt = 0; attempt < config.treeAttempts; ++attempt) {
        float x = context.rng.nextFloat(-config.treeSpread, config.treeSpread);
        float z = context.rng.nextFloat(-config.treeSpread, config.treeSpread);
        for (int retry = 0; retry < kTreeSiteRetries && insideSpawnClearance(x, z, config.treeSpawnClearance); ++retry) {
            x = context.rng.nextFloat(-config.treeSpread, config.treeSpread);
            z = context.rng.nextFloat(-config.treeSpread, config.treeSpread);
        }

        const float groundTop = world::terrainSnapHeight(context.blocks, x, z, layer->id);
        if (groundTop > layer->baseY) {
            continue;
        }

        Tree tree{};
        tree.id = context.nextTreeId++;
        tree.position = math::Vector3{x, groundTop, z};
        tree.trunkHeight = context.rng.nextInt(config.treeMinTrunk, config.treeMaxTrunk);
        tree.woodYield = context.rng.nextInt(config.treeMinWood, config.treeMaxWood);
        context.trees.push_back(tree);
        ++placed;
    }
    return placed;
}

std::size_t populateCoins(WorldContext& context) {
    const world::WorldLayer* layer = topLayer(context);
    if (layer == nullptr) {
        return 0;
    }
    const ContentConfig& config = context.config.content;
    std::size_t placed = 0;
    for (const auto& site : config.coinSites) {
        const float groundTop = world::terrainSnapHeight(context.blocks, site[0], site[1], layer->id);
        Coin coin{};
        coin.id = context.nextCoinId++;
        coin.position = math::Vector3{site[0], groundTop + config.coinHeightOffset, site[1]};
        context.coins.push_back(coin);
        spawnGuardians(context, coin.id);
        ++placed;
    }
    return placed;
}

int collectCoins(WorldContext& context) {
    Player& player = context.player;
    const float radius = context.config.content.coinPickupRadius;
    int collected = 0;
    auto it = context.coins.begin();
    while (it != context.coins.end()) {
        if (math::distance(it->position, player.position) >= radius) {
            ++it;
            continue;
        }
        ++player.coins;
        ++collected;
        context.emit(SimEventKind::CoinCollected, it->position, player.coins, it->id);
        LF_LOGI("sim") << "coin " << it->id << " collected, " << player.coins << " held";
        it = context.coins.erase(it);
    }
    return collected;
}

bool Simulation::reset(const SimConfig& config) {
    const auto startTime = std::chrono::steady_clock::now();

    m_context = WorldContext{};
    m_context.config = config;
    m_context.rng = core::Pcg32(config.seed);

    world::TerrainStats terrainStats{};
    if (!world::generateTerrain(m_context.blocks, config.terrain, m_context.rng, &terrainStats)) {
        LF_LOGE("sim") << "session reset failed: terrain generation rejected the config";
        return false;
    }

    resetPlayer(m_context);
    const std::size_t treeCount = populateTrees(m_context);
    const std::size_t coinCount = populateCoins(m_context);

    m_context.spawn = SpawnDirectorState{};
    m_context.spawn.initialSpawnsRemaining = config.spawn.initialSpawns;
    m_context.events.clear();

    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime
    ).count();
    LF_LOGI("sim") << "session ready (seed " << config.seed << "): " << terrainStats.layerCount << " layers, "
                   << m_context.blocks.counts().total() << " blocks, " << treeCount << " trees, "
                   << coinCount << " coins, " << m_context.monsters.size() << " guardians in " << elapsedMs << " ms";
    return true;
}

void Simulation::tick(const core::InputState& input) {
    if (m_context.state == SessionState::GameOver) {
        return;
    }
    m_context.events.clear();
    ++m_context.tick;

    tickTimers();
    applyCameraDrag(m_context.camera, m_context.config.camera, input.dragDeltaX(), input.dragDeltaY());
    handleActions(input);
    stepPlayer(m_context, input);
    updateSpawnDirector(m_context);
    updateMonsters(m_context);
    collectCoins(m_context);

    if (m_context.player.health <= 0 && m_context.state != SessionState::GameOver) {
        m_context.player.health = 0;
        m_context.state = SessionState::GameOver;
        m_context.emit(SimEventKind::GameOver, m_context.player.position, m_context.kills);
        LF_LOGI("sim") << "game over after " << m_context.kills << " kill(s) at tick " << m_context.tick;
    }
}

// Monster timers run inside updateMonsters so removed monsters are never ticked.
void Simulation::tickTimers() {
    Player& player = m_context.player;
    if (player.attackCooldownTicks > 0) {
        --player.attackCooldownTicks;
    }
    if (player.flashTicks > 0) {
        --player.flashTicks;
    }
}

void Simulation::handleActions(const core::InputState& input) {
    using core::InputAction;

    if (input.wasPressed(InputAction::ToggleShop)) {
        m_context.shopOpen = !m_context.shopOpen;
        LF_LOGD("shop") << (m_context.shopOpen ? "shop opened" : "shop closed");
    }
    if (input.wasPressed(InputAction::ToggleCastleBuilder)) {
        m_context.castleBuilderOpen = !m_context.castleBuilderOpen;
        LF_LOGD("sim") << (m_context.castleBuilderOpen ? "castle builder opened" : "castle builder closed");
    }
    if (m_context.shopOpen) {
        handlePurchases(input);
    }
    if (m_context.castleBuilderOpen && input.wasPressed(InputAction::BuildCastle)) {
        const CastleResult castle = tryBuildCastle(m_context);
        if (castle.outcome != CastleOutcome::Built) {
            LF_LOGI("sim") << "castle not built: " << castleOutcomeName(castle.outcome);
        }
    }

    if (input.isDown(InputAction::JumpModifier)) {
        for (const InputAction action : core::kMovementActions) {
            if (!input.wasPressed(action)) {
                continue;
            }
            const std::optional<MoveDirection> direction = moveDirectionFor(action);
            if (direction.has_value() &&
                applyDirectionalJump(m_context.player, m_context.config.player, m_context.camera.yaw, *direction)) {
                break;
            }
        }
    }

    if (input.wasPressed(InputAction::Attack)) {
        playerAttack(m_context);
    }
    if (input.wasPressed(InputAction::PlaceBlock)) {
        tryPlaceBlock(m_context);
    }
}

void Simulation::handlePurchases(const core::InputState& input) {
    using core::InputAction;

    if (input.wasPressed(InputAction::BuyHeal)) {
        buyHeal(m_context);
    }
    if (input.wasPressed(InputAction::BuyHealthUpgrade)) {
        buyHealthUpgrade(m_context);
    }
    if (input.wasPressed(InputAction::BuyAttackUpgrade)) {
        buyAttackUpgrade(m_context);
    }
    if (input.wasPressed(InputAction::BuyVoidEscape)) {
        buyVoidEscape(m_context);
    }
}

} // namespace layerfall::sim
