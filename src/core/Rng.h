// src/core/Rng.h
#pragma once
#include <cstdint>

namespace lore::rng {

using Seed = std::uint64_t;

// SplitMix64 finalizer. Spreads low-entropy inputs (name hashes, clock ticks,
// small player-chosen seeds) across all 64 bits before they reach a stream.
inline std::uint64_t mix64(std::uint64_t x) {
    constexpr std::uint64_t kGolden = 0x9E3779B97F4A7C15ull;
    constexpr std::uint64_t kMulA   = 0xBF58476D1CE4E5B9ull;
    constexpr std::uint64_t kMulB   = 0x94D049BB133111EBull;

    std::uint64_t z = x + kGolden;
    z = (z ^ (z >> 30)) * kMulA;
    z = (z ^ (z >> 27)) * kMulB;
    return z ^ (z >> 31);
}

// PCG32, XSH-RR output. One instance per StoryEngine; every scene pick, name
// pick and drift roll comes out of it, in call order.
class Pcg32 {
public:
    Pcg32() = default;
    explicit Pcg32(Seed seedValue, Seed stream = 0) { seed(seedValue, stream); }

    void seed(Seed seedValue, Seed stream = 0) {
        m_state = 0;
        m_inc   = (mix64(stream) << 1u) | 1u;
        step();
        m_state += mix64(seedValue);
        step();
    }

    std::uint32_t next_u32() {
        const std::uint64_t prev = step();
        const auto xorshifted = static_cast<std::uint32_t>(((prev >> 18u) ^ prev) >> 27u);
        return rotr(xorshifted, static_cast<unsigned>(prev >> 59u));
    }

    // [0,1) with 32 bits of resolution.
    double next_double01() {
        constexpr double kInv2Pow32 = 1.0 / 4294967296.0;
        return static_cast<double>(next_u32()) * kInv2Pow32;
    }

    // Unbiased [0, bound). A zero bound yields 0 and leaves the stream untouched.
    std::uint32_t next_bounded(std::uint32_t bound) {
        if (bound == 0)
            return 0;

        // Values below 2^32 mod bound are rejected.
        const std::uint32_t floor = (0u - bound) % bound;
        std::uint32_t r = next_u32();
        while (r < floor)
            r = next_u32();
        return r % bound;
    }

    // Exactly one draw, whatever pTrue is.
    bool chance(double pTrue) {
        return next_double01() < pTrue;
    }

private:
    // Advances the LCG and returns the state it held before.
    std::uint64_t step() {
        constexpr std::uint64_t kMultiplier = 6364136223846793005ull;
        const std::uint64_t prev = m_state;
        m_state = prev * kMultiplier + m_inc;
        return prev;
    }

    static std::uint32_t rotr(std::uint32_t v, unsigned r) {
        return (v >> r) | (v << ((0u - r) & 31u));
    }

    std::uint64_t m_state = 0;
    std::uint64_t m_inc   = 1; // odd
};

} // namespace lore::rng
