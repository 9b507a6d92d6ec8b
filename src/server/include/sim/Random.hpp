#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

// [ZONE_AGENT] Seedable random source shared by the simulation systems.
// A fixed seed makes loot, spawns and crits reproducible in tests.

namespace Midgard {

class RandomSource {
public:
    explicit RandomSource(uint32_t seed = std::random_device{}()) : engine_(seed) {}

    void reseed(uint32_t seed) { engine_.seed(seed); }

    // Uniform in [0, 1)
    double unit() { return std::uniform_real_distribution<double>(0.0, 1.0)(engine_); }

    // Uniform in [min, max]
    float range(float min, float max) {
        if (max <= min) return min;
        return std::uniform_real_distribution<float>(min, max)(engine_);
    }

    // Uniform integer in [min, max]
    int between(int min, int max) {
        if (max <= min) return min;
        return std::uniform_int_distribution<int>(min, max)(engine_);
    }

    // Uniform index in [0, count); count must be > 0
    size_t index(size_t count) {
        return std::uniform_int_distribution<size_t>(0, count - 1)(engine_);
    }

    // True with probability p
    bool chance(double p) { return unit() < p; }

private:
    std::mt19937 engine_;
};

} // namespace Midgard
