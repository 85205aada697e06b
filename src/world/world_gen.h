#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "core/rng.h"
#include "world/block_store.h"

// World Generation subsystem
// Responsible for: filling a block store with stacked layers, their ground slabs, and floating platforms.
// Should NOT do: actor placement or any per-tick logic.
namespace layerfall::world {

// One-block-thick platform. `top` is relative to the owning layer base.
struct PlatformSpec {
    int centerX = 0;
    int centerZ = 0;
    int top = 2;
    int width = 2;
    int depth = 2;
};

struct TerrainConfig {
    std::vector<float> layerBaseYs{0.0f, -50.0f, -100.0f, -150.0f};
    // Ground spans cells [-halfExtent, halfExtent) on x and z.
    int groundHalfExtent = 50;
    int randomPlatformsPerLayer = 10;
    float randomPlatformSpread = 40.0f;
    int randomPlatformMinTop = 2;
    int randomPlatformMaxTop = 6;
    int randomPlatformMinSize = 2;
    int randomPlatformMaxSize = 5;
};

struct TerrainStats {
    std::size_t layerCount = 0;
    std::size_t groundBlocks = 0;
    std::size_t platformBlocks = 0;
};

// Hand-placed platforms of the topmost layer.
[[nodiscard]] std::span<const PlatformSpec> mainLayerPlatforms();

std::size_t placePlatform(BlockStore& store, const WorldLayer& layer, const PlatformSpec& platform);

// Topmost layer gets the hand-placed platforms; every lower layer gets random ones.
bool generateTerrain(BlockStore& store, const TerrainConfig& config, core::Pcg32& rng, TerrainStats* outStats = nullptr);

} // namespace layerfall::world
