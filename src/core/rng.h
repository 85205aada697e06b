#pragma once

#include <cstdint>

namespace layerfall::core {

class Pcg32 {
public:
    explicit Pcg32(std::uint64_t seed = 0x853c49e6748fea9bULL) : m_state(seed) {}

    std::uint32_t nextU32() {
        const std::uint64_t old = m_state;
        m_state = old * 6364136223846793005ULL + 1442695040888963407ULL;
        const std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        const std::uint32_t rot = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((~rot + 1u) & 31u));
    }

    float nextFloat01() {
        return static_cast<float>(nextU32() >> 8u) * (1.0f / 16777216.0f);
    }

    // Uniform in [minValue, maxValue).
    float nextFloat(float minValue, float maxValue) {
        return minValue + ((maxValue - minValue) * nextFloat01());
    }

    // Uniform in [minValue, maxValue], both inclusive.
    int nextInt(int minValue, int maxValue) {
        if (maxValue <= minValue) {
            return minValue;
        }
        const std::uint32_t span = static_cast<std::uint32_t>(maxValue - minValue) + 1u;
        return minValue + static_cast<int>(nextU32() % span);
    }

    bool chance(float probability) {
        return nextFloat01() < probability;
    }

private:
    std::uint64_t m_state;
};

} // namespace layerfall::core
