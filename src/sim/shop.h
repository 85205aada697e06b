#pragma once

#include <cstdint>

#include "sim/sim_config.h"
#include "sim/world_context.h"

// Simulation Shop subsystem
// Responsible for: coin-priced heals, stat upgrades, and the void escape charge.
// Should NOT do: decide whether the shop is open (the tick owner gates purchases).
namespace layerfall::sim {

enum class ShopItem : std::uint8_t {
    Heal = 0,
    HealthUpgrade = 1,
    AttackUpgrade = 2,
    VoidEscape = 3
};

[[nodiscard]] const char* shopItemName(ShopItem item);
// Current coin price; upgrades get dearer with each level bought.
[[nodiscard]] int shopItemCost(const Player& player, const ShopConfig& config, ShopItem item);

bool buyHeal(WorldContext& context);
bool buyHealthUpgrade(WorldContext& context);
bool buyAttackUpgrade(WorldContext& context);
bool buyVoidEscape(WorldContext& context);

bool purchase(WorldContext& context, ShopItem item);

} // namespace layerfall::sim
