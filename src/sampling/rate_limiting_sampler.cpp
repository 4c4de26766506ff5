/// @file rate_limiting_sampler.cpp
/// @brief Token bucket sampler implementation

#include "sampling/rate_limiting_sampler.h"

#include <algorithm>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace axonsentry::sampling {

namespace {

constexpr double kNanosPerSecond = 1'000'000'000.0;

}  // namespace

Clock SteadyClock() {
    return [] { return std::chrono::steady_clock::now(); };
}

absl::StatusOr<RateLimitingSampler> RateLimitingSampler::Create(
    int traces_per_second, std::optional<int> burst_capacity, Clock clock) {
    if (traces_per_second <= 0) {
        return MakeError(ErrorCode::kInvalidRate,
                         absl::StrCat("tracesPerSecond must be positive, got ",
                                      traces_per_second));
    }
    const int burst = burst_capacity.value_or(traces_per_second);
    if (burst <= 0) {
        return MakeError(ErrorCode::kInvalidBurstCapacity,
                         absl::StrCat("burstCapacity must be positive, got ", burst));
    }
    if (!clock) {
        clock = SteadyClock();
    }
    return RateLimitingSampler(traces_per_second, burst, std::move(clock));
}

RateLimitingSampler::RateLimitingSampler(int traces_per_second, int burst_capacity,
                                         Clock clock)
    : traces_per_second_(traces_per_second),
      burst_capacity_(burst_capacity),
      clock_(std::move(clock)),
      bucket_(std::make_unique<TokenBucket>()) {
    bucket_->available_tokens.store(static_cast<double>(burst_capacity_));
    bucket_->last_refill_ns.store(NowNanos());
}

int64_t RateLimitingSampler::NowNanos() const {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               clock_().time_since_epoch())
        .count();
}

void RateLimitingSampler::RefillTokens() const {
    const int64_t now = NowNanos();
    int64_t last_refill = bucket_->last_refill_ns.load(std::memory_order_acquire);
    const int64_t elapsed = now - last_refill;
    if (elapsed <= 0) {
        return;
    }

    const double tokens_to_add =
        static_cast<double>(elapsed) * traces_per_second_ / kNanosPerSecond;
    if (tokens_to_add < 1.0) {
        return;
    }

    // Only the thread that advances the timestamp credits the elapsed interval.
    if (!bucket_->last_refill_ns.compare_exchange_strong(
            last_refill, now, std::memory_order_acq_rel, std::memory_order_acquire)) {
        return;
    }

    const double capacity = static_cast<double>(burst_capacity_);
    double current = bucket_->available_tokens.load(std::memory_order_acquire);
    while (!bucket_->available_tokens.compare_exchange_weak(
        current, std::min(current + tokens_to_add, capacity),
        std::memory_order_acq_rel, std::memory_order_acquire)) {
    }
}

bool RateLimitingSampler::TryConsumeToken() const {
    double current = bucket_->available_tokens.load(std::memory_order_acquire);
    while (current >= 1.0) {
        if (bucket_->available_tokens.compare_exchange_weak(
                current, current - 1.0,
                std::memory_order_acq_rel, std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

SamplingDecision RateLimitingSampler::ShouldSample() const {
    RefillTokens();
    return TryConsumeToken() ? SamplingDecision::kKeep : SamplingDecision::kDrop;
}

double RateLimitingSampler::AvailableTokens() const {
    return bucket_->available_tokens.load(std::memory_order_acquire);
}

std::string RateLimitingSampler::Description() const {
    return absl::StrCat("RateLimitingSampler{tracesPerSecond=", traces_per_second_,
                        ", burstCapacity=", burst_capacity_, "}");
}

}  // namespace axonsentry::sampling
