#pragma once

/// @file rate_limiting_sampler.h
/// @brief Lock-free token bucket sampler bounding traces per second

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <absl/status/statusor.h>

#include "sampling/types.h"

namespace axonsentry::sampling {

/// Monotonic time source; injectable so tests can control refills
using Clock = std::function<std::chrono::steady_clock::time_point()>;

/// Clock backed by std::chrono::steady_clock::now
Clock SteadyClock();

/// Rate-limiting sampler using a token bucket
///
/// The bucket holds up to `burst_capacity` tokens, starts full and refills
/// at `traces_per_second` tokens per second. Each kept trace consumes one
/// token. All bucket updates are compare-and-swap loops on atomics, so
/// concurrent callers never block each other.
///
/// Refill and consume are two separate atomic steps, always in that order:
/// the refill timestamp only advances when at least one whole token has
/// accrued, and only the thread that wins the timestamp CAS adds tokens.
class RateLimitingSampler {
public:
    /// Create sampler with given rate limit
    /// @param traces_per_second Maximum sustained traces per second (> 0)
    /// @param burst_capacity Bucket size (> 0), defaults to traces_per_second
    /// @param clock Time source
    /// @return InvalidArgument if either value is not positive
    static absl::StatusOr<RateLimitingSampler> Create(
        int traces_per_second,
        std::optional<int> burst_capacity = std::nullopt,
        Clock clock = SteadyClock());

    /// Refill, then try to consume one token
    SamplingDecision ShouldSample() const;

    int TracesPerSecond() const { return traces_per_second_; }
    int BurstCapacity() const { return burst_capacity_; }

    /// Get current token count (without refilling)
    double AvailableTokens() const;

    std::string Description() const;

private:
    struct TokenBucket {
        std::atomic<double> available_tokens;
        std::atomic<int64_t> last_refill_ns;
    };

    RateLimitingSampler(int traces_per_second, int burst_capacity, Clock clock);

    int64_t NowNanos() const;
    void RefillTokens() const;
    bool TryConsumeToken() const;

    int traces_per_second_;
    int burst_capacity_;
    Clock clock_;
    std::unique_ptr<TokenBucket> bucket_;
};

}  // namespace axonsentry::sampling
