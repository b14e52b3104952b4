#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace occsim
{
    // Simulated time. Units are whatever the delay model is expressed in.
    using SimTime = double;

    using ClientId = std::uint32_t;
    using Version = std::uint64_t;

    inline constexpr ClientId NoClient = std::numeric_limits<ClientId>::max();

    inline bool iequals(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i)
        {
            const auto lower = [](char c)
            { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; };
            if (lower(a[i]) != lower(b[i]))
            {
                return false;
            }
        }
        return true;
    }

    // Thrown when the engine detects a scheduling or state-machine defect.
    // A run that throws this has corrupt statistics and must be discarded.
    class InvariantViolation : public std::logic_error
    {
    public:
        explicit InvariantViolation(const std::string &what) : std::logic_error(what) {}
    };
}
