// include/maze/core/Rng.hpp
#pragma once
#include <cstdint>
#include <limits>

namespace maze::rng {

using Seed = std::uint64_t;

// SplitMix64 finalizer: spreads small seeds (1, 2, 3...) over the state space.
[[nodiscard]] inline std::uint64_t mix64(std::uint64_t x) noexcept {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

// PCG32, XSH-RR output. The generator is written out in full so a seed yields
// the same maze on every platform and standard library, which
// std::uniform_int_distribution does not guarantee.
class Pcg32 {
public:
    using result_type = std::uint32_t;

    Pcg32() = default;
    explicit Pcg32(Seed seed_value, Seed stream = 0) { seed(seed_value, stream); }

    // Restarts the sequence. `stream` picks one of 2^63 independent sequences.
    void seed(Seed seed_value, Seed stream = 0) {
        _state = 0;
        _inc = (mix64(stream) << 1u) | 1u;
        step();
        _state += mix64(seed_value);
        step();
    }

    std::uint32_t next_u32() {
        const std::uint64_t old = step();
        const auto xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        const auto rot = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((0u - rot) & 31u));
    }

    std::uint64_t next_u64() {
        const std::uint64_t hi = next_u32();
        return (hi << 32) | next_u32();
    }

    // Uniform in [0, bound), rejection sampling against modulo bias.
    // bound <= 1 returns 0 and leaves the stream where it was.
    std::uint32_t next_bounded(std::uint32_t bound) {
        if (bound <= 1) return 0;
        const std::uint32_t threshold = (0u - bound) % bound;
        for (;;) {
            const std::uint32_t r = next_u32();
            if (r >= threshold) return r % bound;
        }
    }

    static constexpr result_type min() noexcept { return std::numeric_limits<result_type>::min(); }
    static constexpr result_type max() noexcept { return std::numeric_limits<result_type>::max(); }
    result_type operator()() { return next_u32(); }

private:
    static constexpr std::uint64_t kMultiplier = 6364136223846793005ull;

    // LCG advance; returns the state before the step.
    std::uint64_t step() {
        const std::uint64_t old = _state;
        _state = old * kMultiplier + _inc;
        return old;
    }

    std::uint64_t _state = 0;
    std::uint64_t _inc = 1;
};

} // namespace maze::rng
