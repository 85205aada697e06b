#include "sim/shop.h"

#include "core/log.h"

namespace layerfall::sim {
namespace {

bool spendCoins(WorldContext& context, ShopItem item) {
    Player& player = context.player;
    const int cost = shopItemCost(player, context.config.shop, item);
    if (player.coins < cost) {
        LF_LOGD("shop") << shopItemName(item) << " refused: " << player.coins << "/" << cost << " coins";
        return false;
    }
    player.coins -= cost;
    context.emit(SimEventKind::PurchaseMade, player.position, cost, static_cast<std::uint32_t>(item));
    LF_LOGI("shop") << "bought " << shopItemName(item) << " for " << cost << " coins, " << player.coins << " left";
    return true;
}

} // namespace

const char* shopItemName(ShopItem item) {
    switch (item) {
    case ShopItem::Heal:
        return "heal";
    case ShopItem::HealthUpgrade:
        return "health-upgrade";
    case ShopItem::AttackUpgrade:
        return "attack-upgrade";
    case ShopItem::VoidEscape:
        return "void-escape";
    default:
        return "unknown";
    }
}

int shopItemCost(const Player& player, const ShopConfig& config, ShopItem item) {
    switch (item) {
    case ShopItem::Heal:
        return config.healCost;
    case ShopItem::HealthUpgrade:
        return config.healthUpgradeBaseCost + (config.healthUpgradeCostStep * player.healthUpgradeLevel);
    case ShopItem::AttackUpgrade:
        return config.attackUpgradeBaseCost + (config.attackUpgradeCostStep * player.attackUpgradeLevel);
    case ShopItem::VoidEscape:
        return config.voidEscapeCost;
    default:
        return 0;
    }
}

bool buyHeal(WorldContext& context) {
    Player& player = context.player;
    if (player.health >= player.maxHealth) {
        LF_LOGD("shop") << "heal refused: already at full health";
        return false;
    }
    if (!spendCoins(context, ShopItem::Heal)) {
        return false;
    }
    const int restored = player.maxHealth - player.health;
    player.health = player.maxHealth;
    context.emit(SimEventKind::PlayerHealed, player.position, restored);
    return true;
}

bool buyHealthUpgrade(WorldContext& context) {
    if (!spendCoins(context, ShopItem::HealthUpgrade)) {
        return false;
    }
    Player& player = context.player;
    const int amount = context.config.shop.healthUpgradeAmount;
    player.maxHealth += amount;
    player.health += amount;
    ++player.healthUpgradeLevel;
    return true;
}

bool buyAttackUpgrade(WorldContext& context) {
    if (!spendCoins(context, ShopItem::AttackUpgrade)) {
        return false;
    }
    Player& player = context.player;
    player.attackDamage += context.config.shop.attackUpgradeAmount;
    ++player.attackUpgradeLevel;
    return true;
}

bool buyVoidEscape(WorldContext& context) {
    if (context.player.hasVoidEscape) {
        LF_LOGD("shop") << "void escape refused: charge already held";
        return false;
    }
    if (!spendCoins(context, ShopItem::VoidEscape)) {
        return false;
    }
    context.player.hasVoidEscape = true;
    return true;
}

bool purchase(WorldContext& context, ShopItem item) {
    switch (item) {
    case ShopItem::Heal:
        return buyHeal(context);
    case ShopItem::HealthUpgrade:
        return buyHealthUpgrade(context);
    case ShopItem::AttackUpgrade:
        return buyAttackUpgrade(context);
    case ShopItem::VoidEscape:
        return buyVoidEscape(context);
    default:
        return false;
    }
}

} // namespace layerfall::sim
