#include "sim/construction.h"

#include "core/log.h"
#include "world/collision.h"

#include <cmath>
#include <cstdlib>

namespace layerfall::sim {
namespace {

template <typename Fn>
void forEachPerimeterColumn(std::int32_t centerX, std::int32_t centerZ, std::int32_t halfSize, Fn&& fn) {
    for (std::int32_t x = centerX - halfSize; x <= centerX + halfSize; ++x) {
        fn(x, centerZ - halfSize);
        fn(x, centerZ + halfSize);
    }
    for (std::int32_t z = centerZ - halfSize + 1; z <= centerZ + halfSize - 1; ++z) {
        fn(centerX - halfSize, z);
        fn(centerX + halfSize, z);
    }
}

} // namespace

std::vector<core::Cell3i> castleBlueprint(
    std::int32_t centerX,
    std::int32_t centerZ,
    std::int32_t groundCellY,
    const CastleConfig& config
) {
    std::vector<core::Cell3i> cells;
    const std::int32_t halfSize = config.halfSize;
    const std::int32_t entranceHalfWidth = config.entranceWidth / 2;
    const std::int32_t frontZ = centerZ - halfSize;

    forEachPerimeterColumn(centerX, centerZ, halfSize, [&](std::int32_t x, std::int32_t z) {
        const bool corner = std::abs(x - centerX) == halfSize && std::abs(z - centerZ) == halfSize;
        const bool entrance = z == frontZ && std::abs(x - centerX) <= entranceHalfWidth;
        const std::int32_t height = corner ? config.towerHeight : config.wallHeight;
        for (std::int32_t row = 0; row < height; ++row) {
            if (entrance && row < config.entranceHeight) {
                continue;
            }
            cells.emplace_back(x, groundCellY + row, z);
        }
    });
    return cells;
}

int countCastleObstructions(
    const WorldContext& context,
    std::int32_t centerX,
    std::int32_t centerZ,
    std::int32_t groundCellY
) {
    int count = 0;
    forEachPerimeterColumn(centerX, centerZ, context.config.castle.halfSize, [&](std::int32_t x, std::int32_t z) {
        for (std::int32_t row = 0; row < 2; ++row) {
            if (context.blocks.solidBlockAtCell(core::Cell3i{x, groundCellY + row, z}) != nullptr) {
                ++count;
            }
        }
    });
    return count;
}

const char* castleOutcomeName(CastleOutcome outcome) {
    switch (outcome) {
    case CastleOutcome::Built:
        return "built";
    case CastleOutcome::NotEnoughWood:
        return "not-enough-wood";
    case CastleOutcome::Obstructed:
        return "obstructed";
    case CastleOutcome::NoGround:
        return "no-ground";
    default:
        return "unknown";
    }
}

CastleResult tryBuildCastleAt(WorldContext& context, std::int32_t centerX, std::int32_t centerZ) {
    const CastleConfig& config = context.config.castle;
    Player& player = context.player;
    CastleResult result{};
    result.center = core::Cell3i{centerX, 0, centerZ};

    if (player.wood < config.woodCost) {
        result.outcome = CastleOutcome::NotEnoughWood;
        LF_LOGD("sim") << "castle refused: " << player.wood << "/" << config.woodCost << " wood";
        return result;
    }

    const world::WorldLayer* layer = context.blocks.layerForHeight(player.bottom());
    if (layer == nullptr) {
        result.outcome = CastleOutcome::NoGround;
        LF_LOGW("sim") << "castle refused: no layer under the player";
        return result;
    }

    const float groundTop = world::terrainSnapHeight(
        context.blocks,
        static_cast<float>(result.center.x),
        static_cast<float>(result.center.z),
        layer->id
    );
    const std::int32_t groundCellY = static_cast<std::int32_t>(std::lround(groundTop));
    result.center.y = groundCellY;

    result.obstructions = countCastleObstructions(context, result.center.x, result.center.z, groundCellY);
    if (result.obstructions > config.maxObstructions) {
        result.outcome = CastleOutcome::Obstructed;
        LF_LOGD("sim") << "castle refused: " << result.obstructions << " obstructed perimeter cells";
        return result;
    }

    player.wood -= config.woodCost;
    for (const core::Cell3i& cell : castleBlueprint(result.center.x, result.center.z, groundCellY, config)) {
        const world::PlaceOutcome placed =
            context.blocks.placeBlock(cell, world::BlockMaterial::Stone, player.position, 0.0f);
        if (placed == world::PlaceOutcome::Placed) {
            ++result.blocksPlaced;
        }
    }

    result.outcome = CastleOutcome::Built;
    context.emit(SimEventKind::CastleBuilt, core::cellCenter(result.center), result.blocksPlaced);
    LF_LOGI("sim") << "castle built at (" << result.center.x << ", " << result.center.y << ", "
                   << result.center.z << ") with " << result.blocksPlaced << " blocks";
    return result;
}

CastleResult tryBuildCastle(WorldContext& context) {
    const Player& player = context.player;
    return tryBuildCastleAt(
        context,
        static_cast<std::int32_t>(std::lround(player.position.x)),
        static_cast<std::int32_t>(std::lround(player.position.z))
    );
}

} // namespace layerfall::sim
