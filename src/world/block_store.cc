#include "world/block_store.h"

#include "core/log.h"

#include <algorithm>
#include <cmath>

namespace layerfall::world {

const char* blockStateName(BlockState state) {
    switch (state) {
    case BlockState::Solid:
        return "solid";
    case BlockState::Void:
        return "void";
    case BlockState::Placed:
        return "placed";
    default:
        return "unknown";
    }
}

template <typename Fn>
void BlockStore::forEachCellInBox(const Aabb3f& box, Fn&& fn) const {
    const int startX = static_cast<int>(std::floor(box.minX));
    const int endX = static_cast<int>(std::ceil(box.maxX)) - 1;
    const int startY = static_cast<int>(std::floor(box.minY));
    const int endY = static_cast<int>(std::ceil(box.maxY)) - 1;
    const int startZ = static_cast<int>(std::floor(box.minZ));
    const int endZ = static_cast<int>(std::ceil(box.maxZ)) - 1;

    for (int y = startY; y <= endY; ++y) {
        for (int z = startZ; z <= endZ; ++z) {
            for (int x = startX; x <= endX; ++x) {
                const auto it = m_cellIndex.find(core::cellKey(core::Cell3i{x, y, z}));
                if (it == m_cellIndex.end()) {
                    continue;
                }
                const Block& candidate = m_blocks[it->second];
                if (aabbOverlaps(box, candidate.bounds())) {
                    fn(candidate);
                }
            }
        }
    }
}

LayerId BlockStore::addLayer(float baseY) {
    for (const WorldLayer& existing : m_layers) {
        if (existing.baseY == baseY) {
            return existing.id;
        }
    }

    WorldLayer layerRecord{};
    layerRecord.id = static_cast<LayerId>(m_layers.size());
    layerRecord.baseY = baseY;
    m_layers.push_back(layerRecord);
    std::sort(m_layers.begin(), m_layers.end(), [](const WorldLayer& lhs, const WorldLayer& rhs) {
        return lhs.baseY > rhs.baseY;
    });
    LF_LOGD("world") << "layer " << layerRecord.id << " registered at y=" << baseY;
    return layerRecord.id;
}

const WorldLayer* BlockStore::layer(LayerId id) const {
    for (const WorldLayer& candidate : m_layers) {
        if (candidate.id == id) {
            return &candidate;
        }
    }
    return nullptr;
}

const WorldLayer* BlockStore::layerBelow(float y) const {
    if (m_layers.empty()) {
        return nullptr;
    }
    for (const WorldLayer& candidate : m_layers) {
        if (candidate.baseY < y) {
            return &candidate;
        }
    }
    return &m_layers.back();
}

const WorldLayer* BlockStore::layerForHeight(float y) const {
    if (m_layers.empty()) {
        return nullptr;
    }
    for (const WorldLayer& candidate : m_layers) {
        if (candidate.baseY <= y) {
            return &candidate;
        }
    }
    return &m_layers.back();
}

std::int32_t BlockStore::lowestCellY() const {
    std::int32_t lowest = 0;
    bool any = false;
    for (const WorldLayer& candidate : m_layers) {
        if (candidate.maxCellY < candidate.minCellY) {
            continue;
        }
        lowest = any ? std::min(lowest, candidate.minCellY) : candidate.minCellY;
        any = true;
    }
    return lowest;
}

void BlockStore::trackLayerExtent(LayerId id, std::int32_t cellY) {
    for (WorldLayer& candidate : m_layers) {
        if (candidate.id != id) {
            continue;
        }
        if (candidate.maxCellY < candidate.minCellY) {
            candidate.minCellY = cellY;
            candidate.maxCellY = cellY;
        } else {
            candidate.minCellY = std::min(candidate.minCellY, cellY);
            candidate.maxCellY = std::max(candidate.maxCellY, cellY);
        }
        return;
    }
}

void BlockStore::adjustCount(BlockState state, int delta) {
    std::size_t* counter = nullptr;
    switch (state) {
    case BlockState::Solid:
        counter = &m_counts.solid;
        break;
    case BlockState::Placed:
        counter = &m_counts.placed;
        break;
    case BlockState::Void:
        counter = &m_counts.voids;
        break;
    }
    if (counter == nullptr) {
        return;
    }
    if (delta < 0 && *counter == 0) {
        LF_LOGE("world") << "block counter underflow for state " << blockStateName(state);
        return;
    }
    *counter = static_cast<std::size_t>(static_cast<long long>(*counter) + delta);
}

BlockId BlockStore::addBlock(const core::Cell3i& cell, BlockMaterial material, LayerId layerId) {
    const std::uint64_t key = core::cellKey(cell);
    const auto it = m_cellIndex.find(key);
    if (it != m_cellIndex.end()) {
        Block& existing = m_blocks[it->second];
        if (existing.isVoid()) {
            adjustCount(BlockState::Void, -1);
            adjustCount(BlockState::Solid, +1);
            existing.state = BlockState::Solid;
            existing.material = material;
        }
        return existing.id;
    }

    Block record{};
    record.id = static_cast<BlockId>(m_blocks.size());
    record.cell = cell;
    record.layer = layerId;
    record.state = BlockState::Solid;
    record.material = material;
    m_blocks.push_back(record);
    m_cellIndex.emplace(key, record.id);
    adjustCount(BlockState::Solid, +1);
    trackLayerExtent(layerId, cell.y);
    return record.id;
}

PlaceOutcome BlockStore::placeBlock(
    const core::Cell3i& cell,
    BlockMaterial material,
    const math::Vector3& actorPosition,
    float keepOutRadius,
    BlockId* outId
) {
    const std::uint64_t key = core::cellKey(cell);
    const auto it = m_cellIndex.find(key);
    if (it != m_cellIndex.end() && !m_blocks[it->second].isVoid()) {
        LF_LOGT("world") << "place refused, cell (" << cell.x << "," << cell.y << "," << cell.z << ") occupied";
        return PlaceOutcome::Occupied;
    }
    if (math::distance(core::cellCenter(cell), actorPosition) < keepOutRadius) {
        LF_LOGT("world") << "place refused, cell (" << cell.x << "," << cell.y << "," << cell.z << ") inside actor keep-out";
        return PlaceOutcome::TooCloseToActor;
    }

    const WorldLayer* owner = layerForHeight(static_cast<float>(cell.y + 1));
    const LayerId ownerId = owner != nullptr ? owner->id : kInvalidLayerId;

    BlockId placedId = kInvalidBlockId;
    if (it != m_cellIndex.end()) {
        Block& revived = m_blocks[it->second];
        adjustCount(BlockState::Void, -1);
        revived.state = BlockState::Placed;
        revived.material = material;
        placedId = revived.id;
    } else {
        Block record{};
        record.id = static_cast<BlockId>(m_blocks.size());
        record.cell = cell;
        record.layer = ownerId;
        record.state = BlockState::Placed;
        record.material = material;
        m_blocks.push_back(record);
        m_cellIndex.emplace(key, record.id);
        trackLayerExtent(ownerId, cell.y);
        placedId = record.id;
    }
    adjustCount(BlockState::Placed, +1);

    if (outId != nullptr) {
        *outId = placedId;
    }
    return PlaceOutcome::Placed;
}

bool BlockStore::breakBlock(BlockId id) {
    if (id >= m_blocks.size()) {
        LF_LOGW("world") << "break requested for unknown block " << id;
        return false;
    }
    Block& target = m_blocks[id];
    if (target.isVoid()) {
        return false;
    }
    adjustCount(target.state, -1);
    adjustCount(BlockState::Void, +1);
    target.state = BlockState::Void;
    return true;
}

const Block* BlockStore::block(BlockId id) const {
    if (id >= m_blocks.size()) {
        return nullptr;
    }
    return &m_blocks[id];
}

const Block* BlockStore::blockAtCell(const core::Cell3i& cell) const {
    const auto it = m_cellIndex.find(core::cellKey(cell));
    if (it == m_cellIndex.end()) {
        return nullptr;
    }
    return &m_blocks[it->second];
}

const Block* BlockStore::solidBlockAtCell(const core::Cell3i& cell) const {
    const Block* found = blockAtCell(cell);
    if (found == nullptr || found->isVoid()) {
        return nullptr;
    }
    return found;
}

void BlockStore::queryOverlapping(const Aabb3f& box, std::vector<BlockId>& outIds) const {
    outIds.clear();
    forEachCellInBox(box, [&outIds](const Block& candidate) {
        if (!candidate.isVoid()) {
            outIds.push_back(candidate.id);
        }
    });
}

void BlockStore::queryVoidOverlapping(const Aabb3f& box, std::vector<BlockId>& outIds) const {
    outIds.clear();
    forEachCellInBox(box, [&outIds](const Block& candidate) {
        if (candidate.isVoid()) {
            outIds.push_back(candidate.id);
        }
    });
}

bool BlockStore::overlapsVoid(const Aabb3f& box) const {
    bool found = false;
    forEachCellInBox(box, [&found](const Block& candidate) {
        if (candidate.isVoid()) {
            found = true;
        }
    });
    return found;
}

bool BlockStore::checkIntegrity() const {
    bool ok = true;
    BlockCounts derived{};
    for (std::size_t index = 0; index < m_blocks.size(); ++index) {
        const Block& record = m_blocks[index];
        if (record.id != index) {
            LF_LOGE("world") << "block record " << index << " carries id " << record.id;
            ok = false;
        }
        switch (record.state) {
        case BlockState::Solid:
            ++derived.solid;
            break;
        case BlockState::Placed:
            ++derived.placed;
            break;
        case BlockState::Void:
            ++derived.voids;
            break;
        }

        const auto it = m_cellIndex.find(core::cellKey(record.cell));
        if (it == m_cellIndex.end() || it->second != record.id) {
            LF_LOGE("world") << "cell index does not resolve block " << record.id;
            ok = false;
        }
    }

    if (m_cellIndex.size() != m_blocks.size()) {
        LF_LOGE("world") << "cell index holds " << m_cellIndex.size()
                         << " entries for " << m_blocks.size() << " blocks";
        ok = false;
    }
    if (!(derived == m_counts)) {
        LF_LOGE("world") << "block counters out of sync: solid " << m_counts.solid << "/" << derived.solid
                         << ", placed " << m_counts.placed << "/" << derived.placed
                         << ", void " << m_counts.voids << "/" << derived.voids;
        ok = false;
    }
    return ok;
}

void BlockStore::clear() {
    m_blocks.clear();
    m_cellIndex.clear();
    m_layers.clear();
    m_counts = BlockCounts{};
}

} // namespace layerfall::world
