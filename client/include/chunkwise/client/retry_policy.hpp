#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>

namespace chunkwise::client
{

    /// Exponential backoff for transient failures.
    struct RetryPolicy
    {
        /// Attempts per operation, the first one included.
        std::size_t max_attempts{5};
        std::chrono::milliseconds initial_backoff{std::chrono::milliseconds{200}};
        double multiplier{2.0};
        std::chrono::milliseconds max_backoff{std::chrono::seconds{10}};

        /// Delay after failed attempt number `attempt` (1-based).
        std::chrono::milliseconds backoff_for(std::size_t attempt) const
        {
            const auto exponent = static_cast<double>(attempt > 0 ? attempt - 1 : 0);
            const auto delay = static_cast<double>(initial_backoff.count()) * std::pow(multiplier, exponent);
            const auto capped = std::min(delay, static_cast<double>(max_backoff.count()));
            return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(capped)};
        }
    };

} // namespace chunkwise::client
