#pragma once

#include <cstdint>
#include <limits>

#include "core/grid3.h"
#include "world/aabb.h"

namespace layerfall::world {

using BlockId = std::uint32_t;
using LayerId = std::uint32_t;

inline constexpr BlockId kInvalidBlockId = std::numeric_limits<BlockId>::max();
inline constexpr LayerId kInvalidLayerId = std::numeric_limits<LayerId>::max();

enum class BlockState : std::uint8_t {
    Solid = 0,
    Void = 1,
    Placed = 2
};

// Presentation only; collision treats every material alike.
enum class BlockMaterial : std::uint8_t {
    Ground = 0,
    Platform = 1,
    Wood = 2,
    Stone = 3
};

struct Block {
    BlockId id = kInvalidBlockId;
    core::Cell3i cell{};
    LayerId layer = kInvalidLayerId;
    BlockState state = BlockState::Solid;
    BlockMaterial material = BlockMaterial::Ground;

    [[nodiscard]] bool isVoid() const { return state == BlockState::Void; }
    [[nodiscard]] float bottom() const { return static_cast<float>(cell.y); }
    [[nodiscard]] float top() const { return static_cast<float>(cell.y + 1); }
    [[nodiscard]] math::Vector3 center() const { return core::cellCenter(cell); }

    [[nodiscard]] Aabb3f bounds() const {
        return Aabb3f{
            static_cast<float>(cell.x), static_cast<float>(cell.x + 1),
            static_cast<float>(cell.y), static_cast<float>(cell.y + 1),
            static_cast<float>(cell.z), static_cast<float>(cell.z + 1)
        };
    }
};

struct WorldLayer {
    LayerId id = kInvalidLayerId;
    // Ground surface height of the layer.
    float baseY = 0.0f;
    // Vertical cell span of member blocks, for column scans.
    std::int32_t minCellY = 0;
    std::int32_t maxCellY = -1;
};

[[nodiscard]] const char* blockStateName(BlockState state);

} // namespace layerfall::world
