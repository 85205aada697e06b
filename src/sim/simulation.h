#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/input.h"
#include "sim/events.h"
#include "sim/sim_config.h"
#include "sim/world_context.h"

// Simulation subsystem
// Responsible for: owning the world context, seeding a session, and running the fixed per-tick system order.
// Should NOT do: window management, device polling, or rendering.
namespace layerfall::sim {

// Scatters trees over the topmost layer, away from the spawn area and off platforms. Returns trees placed.
std::size_t populateTrees(WorldContext& context);
// Drops one coin per configured site on the topmost layer and rings each with guardians. Returns coins placed.
std::size_t populateCoins(WorldContext& context);
// Removes coins within pickup range of the player. Returns how many were collected.
int collectCoins(WorldContext& context);

class Simulation {
public:
    // Regenerates the world from config.seed. Returns false when terrain generation rejects the config.
    bool reset(const SimConfig& config);
    void tick(const core::InputState& input);

    [[nodiscard]] WorldContext& context() { return m_context; }
    [[nodiscard]] const WorldContext& context() const { return m_context; }
    // Events emitted during the last tick.
    [[nodiscard]] const std::vector<SimEvent>& events() const { return m_context.events; }
    [[nodiscard]] SessionState state() const { return m_context.state; }
    [[nodiscard]] std::uint64_t tickCount() const { return m_context.tick; }

private:
    void tickTimers();
    void handleActions(const core::InputState& input);
    void handlePurchases(const core::InputState& input);

    WorldContext m_context{};
};

} // namespace layerfall::sim
