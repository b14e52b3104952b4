#pragma once

#include "common.hpp"

#include <cmath>
#include <cstdint>
#include <numbers>

namespace occsim
{
    // Small deterministic RNG used by the engine.
    //
    // Every run owns its own Rng, seeded from stable identifiers, so a run is
    // reproducible from its seed alone and independent runs never contend on a
    // shared generator.

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

    // Seed for one run of a sweep. Depends only on the identifiers, never on
    // which rank or in which order the run executes.
    inline std::uint64_t derive_seed(std::uint64_t seed,
                                     std::uint32_t population,
                                     std::uint32_t variant,
                                     std::uint32_t repetition) noexcept
    {
        std::uint64_t x = seed;
        x = mix_u64(x, static_cast<std::uint64_t>(population));
        x = mix_u64(x, static_cast<std::uint64_t>(variant));
        x = mix_u64(x, static_cast<std::uint64_t>(repetition));
        return splitmix64(x);
    }

    class Rng
    {
    public:
        explicit Rng(std::uint64_t seed = 1) noexcept : m_state(seed) {}

        std::uint64_t next_u64() noexcept
        {
            m_state += 0x9e3779b97f4a7c15ULL;
            std::uint64_t z = m_state;
            z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
            z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
            return z ^ (z >> 31);
        }

        // Uniform in [0,1).
        double unit_double() noexcept
        {
            const std::uint64_t mantissa = next_u64() >> 11;                   // 53 bits
            return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0); // 2^53
        }

        // Uniform in [lo, hi). Either bound may be the larger one.
        double uniform(double lo, double hi) noexcept
        {
            return lo + (hi - lo) * unit_double();
        }

        // Box-Muller; the second variate is cached for the next call.
        double normal(double mean, double stddev) noexcept
        {
            if (m_hasSpare)
            {
                m_hasSpare = false;
                return mean + stddev * m_spare;
            }

            double u1 = unit_double();
            while (u1 <= 0.0)
            {
                u1 = unit_double();
            }
            const double u2 = unit_double();
            const double r = std::sqrt(-2.0 * std::log(u1));
            const double theta = 2.0 * std::numbers::pi * u2;

            m_spare = r * std::sin(theta);
            m_hasSpare = true;
            return mean + stddev * (r * std::cos(theta));
        }

    private:
        std::uint64_t m_state = 0;
        double m_spare = 0.0;
        bool m_hasSpare = false;
    };
}
