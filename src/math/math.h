#pragma once

#include <cmath>

namespace layerfall::math {

constexpr float kPi = 3.14159265358979323846f;

struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float xIn, float yIn, float zIn) : x(xIn), y(yIn), z(zIn) {}

    constexpr bool operator==(const Vector3&) const = default;

    constexpr Vector3 operator+(const Vector3& rhs) const { return Vector3{x + rhs.x, y + rhs.y, z + rhs.z}; }
    constexpr Vector3 operator-(const Vector3& rhs) const { return Vector3{x - rhs.x, y - rhs.y, z - rhs.z}; }
    constexpr Vector3 operator-() const { return Vector3{-x, -y, -z}; }
    constexpr Vector3 operator*(float scalar) const { return Vector3{x * scalar, y * scalar, z * scalar}; }
    constexpr Vector3 operator/(float scalar) const { return Vector3{x / scalar, y / scalar, z / scalar}; }

    Vector3& operator+=(const Vector3& rhs) {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    Vector3& operator-=(const Vector3& rhs) {
        x -= rhs.x;
        y -= rhs.y;
        z -= rhs.z;
        return *this;
    }

    Vector3& operator*=(float scalar) {
        x *= scalar;
        y *= scalar;
        z *= scalar;
        return *this;
    }
};

inline constexpr Vector3 operator*(float scalar, const Vector3& v) {
    return v * scalar;
}

inline float dot(const Vector3& a, const Vector3& b) {
    return (a.x * b.x) + (a.y * b.y) + (a.z * b.z);
}

inline float lengthSquared(const Vector3& v) {
    return dot(v, v);
}

inline float length(const Vector3& v) {
    return std::sqrt(lengthSquared(v));
}

inline float distance(const Vector3& a, const Vector3& b) {
    return length(a - b);
}

// Distance on the ground plane, ignoring height.
inline float distanceXZ(const Vector3& a, const Vector3& b) {
    const float dx = a.x - b.x;
    const float dz = a.z - b.z;
    return std::sqrt((dx * dx) + (dz * dz));
}

inline Vector3 normalize(const Vector3& v) {
    const float len = length(v);
    if (len <= 0.0f) {
        return Vector3{};
    }
    return v / len;
}

} // namespace layerfall::math
