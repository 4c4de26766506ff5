#pragma once

/// @file composite_sampler.h
/// @brief AND/OR composition of samplers

#include <cstddef>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "sampling/types.h"

namespace axonsentry::sampling {

class Sampler;

/// Combines an ordered list of samplers with AND or OR logic
///
/// Evaluation is in list order and short-circuits: AND stops at the first
/// DROP, OR stops at the first KEEP. Samplers after the deciding one are
/// not invoked, so a rate limiter placed late in an AND chain only spends
/// tokens on traces every earlier sampler kept. Reordering the list
/// therefore changes the effective rate-limit behavior.
///
/// Example:
/// @code
///   // Sample 10% of traces, but never more than 100 per second
///   std::vector<Sampler> samplers;
///   samplers.emplace_back(*ProbabilitySampler::Create(0.1));
///   samplers.emplace_back(*RateLimitingSampler::Create(100));
///   auto sampler = CompositeSampler::And(std::move(samplers));
/// @endcode
class CompositeSampler {
public:
    /// @return InvalidArgument if `samplers` is empty
    static absl::StatusOr<CompositeSampler> Create(std::vector<Sampler> samplers,
                                                   CombineStrategy strategy);

    static absl::StatusOr<CompositeSampler> And(std::vector<Sampler> samplers);
    static absl::StatusOr<CompositeSampler> Or(std::vector<Sampler> samplers);

    CompositeSampler(CompositeSampler&& other) noexcept;
    CompositeSampler& operator=(CompositeSampler&& other) noexcept;
    ~CompositeSampler();

    SamplingDecision ShouldSample(const SamplingParameters& params) const;

    CombineStrategy Strategy() const { return strategy_; }
    size_t Size() const;

    /// Child sampler at `index` in evaluation order
    const Sampler& At(size_t index) const;

    std::string Description() const;

private:
    CompositeSampler(std::vector<Sampler> samplers, CombineStrategy strategy);

    std::vector<Sampler> samplers_;
    CombineStrategy strategy_;
};

}  // namespace axonsentry::sampling
