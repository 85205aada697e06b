#pragma once

#include <cmath>
#include <cstdint>

#include "math/math.h"

// Core Grid subsystem
// Responsible for: integer block-grid primitives shared by world and simulation code.
// Should NOT do: block ownership, collision policy, or actor state.
namespace layerfall::core {

struct Cell3i {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t z = 0;

    constexpr Cell3i() = default;
    constexpr Cell3i(std::int32_t xIn, std::int32_t yIn, std::int32_t zIn) : x(xIn), y(yIn), z(zIn) {}

    constexpr bool operator==(const Cell3i&) const = default;

    constexpr Cell3i operator+(const Cell3i& rhs) const {
        return Cell3i{x + rhs.x, y + rhs.y, z + rhs.z};
    }

    constexpr Cell3i operator-(const Cell3i& rhs) const {
        return Cell3i{x - rhs.x, y - rhs.y, z - rhs.z};
    }
};

// Packs a cell into a 64-bit key with 21 bits per axis. Coordinates must stay within +/-2^20.
inline constexpr std::uint64_t cellKey(const Cell3i& cell) {
    constexpr std::uint64_t kMask = (1ull << 21u) - 1ull;
    const std::uint64_t x = static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.x)) & kMask;
    const std::uint64_t y = static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.y)) & kMask;
    const std::uint64_t z = static_cast<std::uint64_t>(static_cast<std::uint32_t>(cell.z)) & kMask;
    return x | (y << 21u) | (z << 42u);
}

// Cell (i, j, k) spans [i, i + 1) on each axis.
inline Cell3i cellContaining(const math::Vector3& point) {
    return Cell3i{
        static_cast<std::int32_t>(std::floor(point.x)),
        static_cast<std::int32_t>(std::floor(point.y)),
        static_cast<std::int32_t>(std::floor(point.z))
    };
}

inline constexpr math::Vector3 cellCenter(const Cell3i& cell) {
    return math::Vector3{
        static_cast<float>(cell.x) + 0.5f,
        static_cast<float>(cell.y) + 0.5f,
        static_cast<float>(cell.z) + 0.5f
    };
}

} // namespace layerfall::core
