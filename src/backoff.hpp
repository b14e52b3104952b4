#pragma once

#include "random.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace occsim
{
    enum class BackoffVariant : std::uint8_t
    {
        None = 0,
        Exponential = 1,
        EqualJitter = 2,
        FullJitter = 3,
        Decorrelated = 4,
    };

    // Order used by the sweep and in report columns.
    inline constexpr std::array<BackoffVariant, 5> AllBackoffVariants = {
        BackoffVariant::Exponential,
        BackoffVariant::Decorrelated,
        BackoffVariant::EqualJitter,
        BackoffVariant::FullJitter,
        BackoffVariant::None,
    };

    inline const char *backoff_variant_name(BackoffVariant v) noexcept
    {
        switch (v)
        {
        case BackoffVariant::None:
            return "None";
        case BackoffVariant::Exponential:
            return "Exponential";
        case BackoffVariant::EqualJitter:
            return "EqualJitter";
        case BackoffVariant::FullJitter:
            return "FullJitter";
        case BackoffVariant::Decorrelated:
            return "Decorr";
        }
        return "Unknown";
    }

    inline std::optional<BackoffVariant> parse_backoff_variant(std::string_view text) noexcept
    {
        for (const BackoffVariant v : AllBackoffVariants)
        {
            if (iequals(text, backoff_variant_name(v)))
            {
                return v;
            }
        }
        if (iequals(text, "Decorrelated"))
        {
            return BackoffVariant::Decorrelated;
        }
        return std::nullopt;
    }

    // Computes how long a client waits before retrying after a failed write.
    //
    // One instance per client: implementations may keep state across calls
    // (see DecorrelatedJitterBackoff), so a policy is never shared.
    class IBackoffPolicy
    {
    public:
        IBackoffPolicy(double base, double cap) : m_base(base), m_cap(cap)
        {
            if (!(base > 0.0) || !(cap > 0.0) || !std::isfinite(base) || !std::isfinite(cap))
            {
                throw std::invalid_argument("backoff: base and cap must be finite and > 0");
            }
        }

        virtual ~IBackoffPolicy() = default;

        virtual BackoffVariant variant() const noexcept = 0;

        // Wait before retry number `attempt` (1 for the first retry). Always in [0, cap].
        virtual SimTime backoff(std::uint32_t attempt, Rng &rng) = 0;

        double base() const noexcept { return m_base; }
        double cap() const noexcept { return m_cap; }

        // min(cap, base * 2^attempt); saturates instead of overflowing.
        SimTime expo(std::uint32_t attempt) const noexcept
        {
            const int e = static_cast<int>(std::min<std::uint32_t>(attempt, 1023));
            const double v = std::ldexp(m_base, e);
            return std::min(m_cap, v);
        }

    private:
        double m_base = 0.0;
        double m_cap = 0.0;
    };

    class NoBackoff final : public IBackoffPolicy
    {
    public:
        using IBackoffPolicy::IBackoffPolicy;

        BackoffVariant variant() const noexcept override { return BackoffVariant::None; }
        SimTime backoff(std::uint32_t, Rng &) override { return 0.0; }
    };

    class ExponentialBackoff final : public IBackoffPolicy
    {
    public:
        using IBackoffPolicy::IBackoffPolicy;

        BackoffVariant variant() const noexcept override { return BackoffVariant::Exponential; }
        SimTime backoff(std::uint32_t attempt, Rng &) override { return expo(attempt); }
    };

    class EqualJitterBackoff final : public IBackoffPolicy
    {
    public:
        using IBackoffPolicy::IBackoffPolicy;

        BackoffVariant variant() const noexcept override { return BackoffVariant::EqualJitter; }

        SimTime backoff(std::uint32_t attempt, Rng &rng) override
        {
            const double half = expo(attempt) / 2.0;
            return half + rng.uniform(0.0, half);
        }
    };

    class FullJitterBackoff final : public IBackoffPolicy
    {
    public:
        using IBackoffPolicy::IBackoffPolicy;

        BackoffVariant variant() const noexcept override { return BackoffVariant::FullJitter; }

        SimTime backoff(std::uint32_t attempt, Rng &rng) override
        {
            return rng.uniform(0.0, expo(attempt));
        }
    };

    // sleep = min(cap, uniform(base, sleep * 3)), starting from sleep = base.
    // The attempt number is ignored; the value depends only on this instance's history.
    class DecorrelatedJitterBackoff final : public IBackoffPolicy
    {
    public:
        DecorrelatedJitterBackoff(double base, double cap) : IBackoffPolicy(base, cap), m_lastSleep(base) {}

        BackoffVariant variant() const noexcept override { return BackoffVariant::Decorrelated; }

        SimTime backoff(std::uint32_t, Rng &rng) override
        {
            m_lastSleep = std::min(cap(), rng.uniform(base(), m_lastSleep * 3.0));
            return m_lastSleep;
        }

        SimTime last_sleep() const noexcept { return m_lastSleep; }

    private:
        SimTime m_lastSleep = 0.0;
    };

    inline std::unique_ptr<IBackoffPolicy> make_backoff(BackoffVariant variant, double base, double cap)
    {
        switch (variant)
        {
        case BackoffVariant::None:
            return std::make_unique<NoBackoff>(base, cap);
        case BackoffVariant::Exponential:
            return std::make_unique<ExponentialBackoff>(base, cap);
        case BackoffVariant::EqualJitter:
            return std::make_unique<EqualJitterBackoff>(base, cap);
        case BackoffVariant::FullJitter:
            return std::make_unique<FullJitterBackoff>(base, cap);
        case BackoffVariant::Decorrelated:
            return std::make_unique<DecorrelatedJitterBackoff>(base, cap);
        }
        throw std::invalid_argument("make_backoff: unknown BackoffVariant");
    }
}
