#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "core/grid3.h"
#include "math/math.h"
#include "world/aabb.h"
#include "world/block.h"

// World Block Store subsystem
// Responsible for: owning block records, their grid-cell index, and the ordered layer registry.
// Should NOT do: collision policy, actor state, or ray targeting.
namespace layerfall::world {

enum class PlaceOutcome : std::uint8_t {
    Placed = 0,
    Occupied = 1,
    TooCloseToActor = 2
};

struct BlockCounts {
    std::size_t solid = 0;
    std::size_t placed = 0;
    std::size_t voids = 0;

    [[nodiscard]] std::size_t total() const { return solid + placed + voids; }
    bool operator==(const BlockCounts&) const = default;
};

class BlockStore {
public:
    // Registers a layer whose ground surface sits at baseY. Layers stay sorted from highest to lowest.
    LayerId addLayer(float baseY);
    [[nodiscard]] const std::vector<WorldLayer>& layers() const { return m_layers; }
    [[nodiscard]] const WorldLayer* layer(LayerId id) const;
    // Highest layer with baseY strictly below y, else the lowest layer. Null when no layers exist.
    [[nodiscard]] const WorldLayer* layerBelow(float y) const;
    // Highest layer with baseY at or below y, else the lowest layer. Null when no layers exist.
    [[nodiscard]] const WorldLayer* layerForHeight(float y) const;
    [[nodiscard]] std::int32_t lowestCellY() const;

    // World generation entry point. Reuses the record already at the cell, reviving it if void.
    BlockId addBlock(const core::Cell3i& cell, BlockMaterial material, LayerId layerId);
    PlaceOutcome placeBlock(
        const core::Cell3i& cell,
        BlockMaterial material,
        const math::Vector3& actorPosition,
        float keepOutRadius,
        BlockId* outId = nullptr
    );
    // Solid or Placed becomes Void. Returns false for unknown ids and blocks that are already void.
    bool breakBlock(BlockId id);

    [[nodiscard]] const Block* block(BlockId id) const;
    [[nodiscard]] const Block* blockAtCell(const core::Cell3i& cell) const;
    [[nodiscard]] const Block* solidBlockAtCell(const core::Cell3i& cell) const;
    [[nodiscard]] const std::vector<Block>& blocks() const { return m_blocks; }

    // Non-void blocks strictly overlapping the box.
    void queryOverlapping(const Aabb3f& box, std::vector<BlockId>& outIds) const;
    // Void blocks strictly overlapping the box.
    void queryVoidOverlapping(const Aabb3f& box, std::vector<BlockId>& outIds) const;
    [[nodiscard]] bool overlapsVoid(const Aabb3f& box) const;

    [[nodiscard]] BlockCounts counts() const { return m_counts; }
    // Re-derives counters and the cell index from the records. Logs and returns false on mismatch.
    [[nodiscard]] bool checkIntegrity() const;
    void clear();

private:
    template <typename Fn>
    void forEachCellInBox(const Aabb3f& box, Fn&& fn) const;
    void trackLayerExtent(LayerId id, std::int32_t cellY);
    void adjustCount(BlockState state, int delta);

    std::vector<Block> m_blocks;
    std::unordered_map<std::uint64_t, BlockId> m_cellIndex;
    std::vector<WorldLayer> m_layers;
    BlockCounts m_counts{};
};

} // namespace layerfall::world
