#pragma once

#include "common.hpp"

namespace occsim
{
    // Counters shared by the server and the clients of a single run.
    struct RunStats
    {
        std::uint64_t calls = 0;
        std::uint64_t failures = 0;
        // Clients that hit SimulationConfig::maxAttempts. Always 0 when retries are unbounded.
        std::uint64_t abandoned = 0;

        std::uint64_t successes() const noexcept { return calls - failures; }
    };

    struct RunResult
    {
        SimTime elapsed = 0.0;
        std::uint64_t calls = 0;
        std::uint64_t failures = 0;
        std::uint64_t abandoned = 0;
        Version finalVersion = 0;
        std::uint64_t eventsProcessed = 0;
        std::uint64_t digest = 0;
    };
}
