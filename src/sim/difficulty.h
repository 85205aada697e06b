#pragma once

#include <algorithm>

#include "sim/sim_config.h"

namespace layerfall::sim {

struct MonsterStats {
    int health = 0;
    int damage = 0;
    float speed = 0.0f;
    float size = 0.0f;
};

[[nodiscard]] inline MonsterStats monsterStatsForLevel(const MonsterConfig& config, int level) {
    const int clampedLevel = std::max(0, level);
    return MonsterStats{
        config.baseHealth + (clampedLevel * config.healthPerLevel),
        config.baseDamage + (clampedLevel * config.damagePerLevel),
        config.baseSpeed + (static_cast<float>(clampedLevel) * config.speedPerLevel),
        config.baseSize + (static_cast<float>(clampedLevel) * config.sizePerLevel)
    };
}

[[nodiscard]] inline int roamSpawnLevel(const SpawnConfig& config, int kills) {
    if (config.killsPerLevel <= 0) {
        return config.maxRoamLevel;
    }
    return std::min(std::max(0, kills) / config.killsPerLevel, config.maxRoamLevel);
}

[[nodiscard]] inline float spawnIntervalSeconds(const SpawnConfig& config, int kills) {
    const float interval = config.baseIntervalSeconds - (static_cast<float>(std::max(0, kills)) * config.intervalReductionPerKill);
    return std::max(config.minIntervalSeconds, interval);
}

} // namespace layerfall::sim
