#pragma once

/// @file sampler.h
/// @brief Sampler handle over the closed set of sampling strategies

#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "sampling/composite_sampler.h"
#include "sampling/probability_sampler.h"
#include "sampling/rate_limiting_sampler.h"
#include "sampling/types.h"

namespace axonsentry::sampling {

/// Always keeps; used when sampling is disabled or unconfigured
class PassThroughSampler {
public:
    SamplingDecision ShouldSample() const { return SamplingDecision::kKeep; }
    std::string Description() const { return "PassThroughSampler"; }
};

/// Sampler over a closed set of strategies
///
/// Wraps one of {PassThrough, Probability, RateLimiting, Composite} and
/// dispatches ShouldSample to it. Move-only: a rate-limiting sampler owns
/// its token bucket exclusively.
class Sampler {
public:
    using Variant = std::variant<PassThroughSampler,
                                 ProbabilitySampler,
                                 RateLimitingSampler,
                                 CompositeSampler>;

    Sampler(PassThroughSampler sampler) : impl_(std::move(sampler)) {}
    Sampler(ProbabilitySampler sampler) : impl_(std::move(sampler)) {}
    Sampler(RateLimitingSampler sampler) : impl_(std::move(sampler)) {}
    Sampler(CompositeSampler sampler) : impl_(std::move(sampler)) {}

    /// Determine if a trace should be kept
    /// @param params Trace ID and span metadata of the starting span
    /// @return Sampling decision
    SamplingDecision ShouldSample(const SamplingParameters& params) const;

    /// Convenience overload when only the trace ID is known
    SamplingDecision ShouldSample(std::string_view trace_id) const;

    /// Human-readable description for logging
    std::string Description() const;

    /// Access the wrapped strategy, or nullptr if it is not a T
    template <typename T>
    const T* As() const {
        return std::get_if<T>(&impl_);
    }

private:
    Variant impl_;
};

}  // namespace axonsentry::sampling
