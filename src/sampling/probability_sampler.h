#pragma once

/// @file probability_sampler.h
/// @brief Deterministic trace-ID based probability sampling

#include <cstdint>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

#include "sampling/types.h"

namespace axonsentry::sampling {

/// Probability sampler using trace ID hashing for consistency
///
/// The decision is a pure function of the trace ID, so every service that
/// sees the same trace makes the same decision and traces stay complete.
class ProbabilitySampler {
public:
    /// Create sampler with given probability
    /// @param probability Sampling probability (0.0 to 1.0)
    /// @return InvalidArgument if the probability is outside [0, 1]
    static absl::StatusOr<ProbabilitySampler> Create(double probability);

    SamplingDecision ShouldSample(std::string_view trace_id) const;

    double GetProbability() const { return probability_; }

    std::string Description() const;

    /// Polynomial rolling hash (multiplier 31) over the trace ID bytes,
    /// masked to stay non-negative
    static uint64_t HashTraceId(std::string_view trace_id);

private:
    explicit ProbabilitySampler(double probability) : probability_(probability) {}

    double probability_;
};

}  // namespace axonsentry::sampling
