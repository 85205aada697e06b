#pragma once

#include "math/math.h"

namespace layerfall::world {

struct Aabb3f {
    float minX = 0.0f;
    float maxX = 0.0f;
    float minY = 0.0f;
    float maxY = 0.0f;
    float minZ = 0.0f;
    float maxZ = 0.0f;

    [[nodiscard]] constexpr Aabb3f translated(const math::Vector3& delta) const {
        return Aabb3f{
            minX + delta.x, maxX + delta.x,
            minY + delta.y, maxY + delta.y,
            minZ + delta.z, maxZ + delta.z
        };
    }
};

// Body box of an actor at `position`, given as offsets from that position.
inline constexpr Aabb3f makeBodyAabb(const math::Vector3& position, const math::Vector3& bodyMin, const math::Vector3& bodyMax) {
    return Aabb3f{
        position.x + bodyMin.x, position.x + bodyMax.x,
        position.y + bodyMin.y, position.y + bodyMax.y,
        position.z + bodyMin.z, position.z + bodyMax.z
    };
}

// Touching faces do not count as overlap.
inline constexpr bool aabbOverlaps(const Aabb3f& lhs, const Aabb3f& rhs) {
    return
        lhs.maxX > rhs.minX && lhs.minX < rhs.maxX &&
        lhs.maxY > rhs.minY && lhs.minY < rhs.maxY &&
        lhs.maxZ > rhs.minZ && lhs.minZ < rhs.maxZ;
}

inline constexpr bool aabbOverlapsXZ(const Aabb3f& lhs, const Aabb3f& rhs) {
    return lhs.maxX > rhs.minX && lhs.minX < rhs.maxX &&
           lhs.maxZ > rhs.minZ && lhs.minZ < rhs.maxZ;
}

// Faces are inclusive.
inline constexpr bool aabbContains(const Aabb3f& box, const math::Vector3& point) {
    return point.x >= box.minX && point.x <= box.maxX &&
           point.y >= box.minY && point.y <= box.maxY &&
           point.z >= box.minZ && point.z <= box.maxZ;
}

} // namespace layerfall::world
