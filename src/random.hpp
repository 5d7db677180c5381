#pragma once

#include "common.hpp"

#include <cstdint>

namespace cmhsim
{
    inline std::uint64_t splitmix64(std::uint64_t x) noexcept
    {
        x += 0x9e3779b97f4a7c15ULL;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
        return x ^ (x >> 31);
    }

    inline std::uint64_t mix_u64(std::uint64_t a, std::uint64_t b) noexcept
    {
        return splitmix64(a ^ splitmix64(b));
    }

    // Deterministic 64-bit value for the `draw`-th draw of `actor` under `seed`.
    inline std::uint64_t rng_u64(std::uint64_t seed, ActorId actor, std::uint64_t draw) noexcept
    {
        std::uint64_t x = seed;
        x = mix_u64(x, static_cast<std::uint64_t>(actor));
        x = mix_u64(x, draw);
        return splitmix64(x);
    }

    // Source of the choices an actor makes when it picks resources to request.
    // Swapped out in tests to script exact contention patterns.
    class IRandomSource
    {
    public:
        virtual ~IRandomSource() = default;

        // Uniform integer in [lo, hi] (inclusive). Undefined if lo > hi.
        virtual std::uint64_t uniform(std::uint64_t lo, std::uint64_t hi) = 0;
    };

    // Per-actor stream: the n-th call returns a pure function of (seed, actor, n).
    class SplitMixRandom final : public IRandomSource
    {
    public:
        SplitMixRandom(std::uint64_t seed, ActorId actor) : m_seed(seed), m_actor(actor) {}

        std::uint64_t uniform(std::uint64_t lo, std::uint64_t hi) override
        {
            const std::uint64_t span = (hi - lo) + 1;
            const std::uint64_t r = rng_u64(m_seed, m_actor, m_draw++);
            // Modulo bias is acceptable here: spans are tiny (pool size).
            return lo + (r % span);
        }

        std::uint64_t draws() const noexcept { return m_draw; }

    private:
        std::uint64_t m_seed = 1;
        ActorId m_actor = NoActor;
        std::uint64_t m_draw = 0;
    };
}
