#pragma once

#include <cstdint>
#include <vector>

#include "core/grid3.h"
#include "sim/sim_config.h"
#include "sim/world_context.h"

// Simulation Construction subsystem
// Responsible for: the castle blueprint and stamping it into the block store around the player.
// Should NOT do: single block placement along the view ray (see mining).
namespace layerfall::sim {

enum class CastleOutcome : std::uint8_t {
    Built = 0,
    NotEnoughWood = 1,
    Obstructed = 2,
    NoGround = 3
};

struct CastleResult {
    CastleOutcome outcome = CastleOutcome::NoGround;
    core::Cell3i center{};
    int blocksPlaced = 0;
    int obstructions = 0;
};

// Wall and tower cells of a castle centered on (centerX, centerZ) whose lowest row sits at groundCellY.
// Corners rise to towerHeight, the rest of the perimeter to wallHeight, and the front wall keeps an entrance.
[[nodiscard]] std::vector<core::Cell3i> castleBlueprint(
    std::int32_t centerX,
    std::int32_t centerZ,
    std::int32_t groundCellY,
    const CastleConfig& config
);

// Counts occupied perimeter cells in the two rows above the ground surface.
[[nodiscard]] int countCastleObstructions(
    const WorldContext& context,
    std::int32_t centerX,
    std::int32_t centerZ,
    std::int32_t groundCellY
);

[[nodiscard]] const char* castleOutcomeName(CastleOutcome outcome);

// Spends the wood and builds a stone castle centered on the given column, on the player's layer.
CastleResult tryBuildCastleAt(WorldContext& context, std::int32_t centerX, std::int32_t centerZ);
// tryBuildCastleAt the player's rounded position.
CastleResult tryBuildCastle(WorldContext& context);

} // namespace layerfall::sim
