#pragma once

#include "random.hpp"

#include <cmath>
#include <stdexcept>

namespace occsim
{
    // Network delay: |N(mean, stddev)|.
    //
    // Folding the left tail is an approximation, not rejection sampling; it keeps
    // every sample non-negative while staying close to the configured normal when
    // mean >> stddev.
    class DelayModel
    {
    public:
        DelayModel(double mean, double stddev) : m_mean(mean), m_stddev(stddev)
        {
            if (!std::isfinite(mean) || !std::isfinite(stddev) || stddev < 0.0)
            {
                throw std::invalid_argument("DelayModel: mean must be finite and stddev finite and >= 0");
            }
        }

        double mean() const noexcept { return m_mean; }
        double stddev() const noexcept { return m_stddev; }

        SimTime delay(Rng &rng) const noexcept
        {
            return std::fabs(rng.normal(m_mean, m_stddev));
        }

    private:
        double m_mean = 0.0;
        double m_stddev = 0.0;
    };
}
