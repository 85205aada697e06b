#include "world/world_gen.h"

#include "core/log.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>

namespace layerfall::world {
namespace {

constexpr std::array<PlatformSpec, 22> kMainLayerPlatforms{{
    {5, 5, 2, 3, 3},
    {-5, -5, 4, 2, 2},
    {8, -8, 6, 2, 2},
    {-8, 8, 3, 4, 4},
    {0, -10, 5, 3, 3},
    {10, 0, 3, 2, 2},
    {15, 15, 3, 3, 3},
    {-15, 15, 4, 2, 2},
    {20, -20, 5, 4, 4},
    {-20, -20, 6, 3, 3},
    {25, 10, 4, 2, 2},
    {-25, -10, 5, 3, 3},
    {30, 0, 7, 2, 2},
    {-30, 0, 4, 4, 4},
    {0, 25, 6, 3, 3},
    {0, -30, 8, 2, 2},
    {35, 20, 5, 3, 3},
    {-35, -25, 6, 2, 2},
    {40, -15, 4, 4, 4},
    {-40, 15, 7, 2, 2},
    {15, -35, 8, 3, 3},
    {-15, 35, 5, 2, 2},
}};

std::size_t placeGround(BlockStore& store, const WorldLayer& layer, int halfExtent) {
    const int cellY = static_cast<int>(std::floor(layer.baseY)) - 1;
    std::size_t placed = 0;
    for (int x = -halfExtent; x < halfExtent; ++x) {
        for (int z = -halfExtent; z < halfExtent; ++z) {
            store.addBlock(core::Cell3i{x, cellY, z}, BlockMaterial::Ground, layer.id);
            ++placed;
        }
    }
    return placed;
}

} // namespace

std::span<const PlatformSpec> mainLayerPlatforms() {
    return kMainLayerPlatforms;
}

std::size_t placePlatform(BlockStore& store, const WorldLayer& layer, const PlatformSpec& platform) {
    const int width = std::max(1, platform.width);
    const int depth = std::max(1, platform.depth);
    const int startX = platform.centerX - (width / 2);
    const int startZ = platform.centerZ - (depth / 2);
    const int cellY = static_cast<int>(std::floor(layer.baseY)) + platform.top - 1;

    std::size_t placed = 0;
    for (int dz = 0; dz < depth; ++dz) {
        for (int dx = 0; dx < width; ++dx) {
            store.addBlock(core::Cell3i{startX + dx, cellY, startZ + dz}, BlockMaterial::Platform, layer.id);
            ++placed;
        }
    }
    return placed;
}

bool generateTerrain(BlockStore& store, const TerrainConfig& config, core::Pcg32& rng, TerrainStats* outStats) {
    using Clock = std::chrono::steady_clock;
    const auto start = Clock::now();

    if (config.layerBaseYs.empty()) {
        LF_LOGE("world") << "terrain generation needs at least one layer";
        return false;
    }
    if (config.groundHalfExtent <= 0) {
        LF_LOGE("world") << "terrain generation needs a positive ground extent, got " << config.groundHalfExtent;
        return false;
    }

    TerrainStats stats{};
    for (const float baseY : config.layerBaseYs) {
        store.addLayer(baseY);
    }
    stats.layerCount = store.layers().size();

    bool topmost = true;
    for (const WorldLayer& layer : store.layers()) {
        stats.groundBlocks += placeGround(store, layer, config.groundHalfExtent);

        if (topmost) {
            for (const PlatformSpec& platform : kMainLayerPlatforms) {
                stats.platformBlocks += placePlatform(store, layer, platform);
            }
            topmost = false;
            continue;
        }

        for (int i = 0; i < config.randomPlatformsPerLayer; ++i) {
            PlatformSpec platform{};
            platform.centerX = static_cast<int>(std::lround(rng.nextFloat(-config.randomPlatformSpread, config.randomPlatformSpread)));
            platform.centerZ = static_cast<int>(std::lround(rng.nextFloat(-config.randomPlatformSpread, config.randomPlatformSpread)));
            platform.top = rng.nextInt(config.randomPlatformMinTop, config.randomPlatformMaxTop);
            platform.width = rng.nextInt(config.randomPlatformMinSize, config.randomPlatformMaxSize);
            platform.depth = rng.nextInt(config.randomPlatformMinSize, config.randomPlatformMaxSize);
            stats.platformBlocks += placePlatform(store, layer, platform);
        }
    }

    const auto elapsedMs = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    LF_LOGI("world") << "terrain generated: " << stats.layerCount << " layers, "
                     << stats.groundBlocks << " ground blocks, "
                     << stats.platformBlocks << " platform blocks in " << elapsedMs << " ms";

    if (outStats != nullptr) {
        *outStats = stats;
    }
    return true;
}

} // namespace layerfall::world
