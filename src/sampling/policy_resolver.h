#pragma once

/// @file policy_resolver.h
/// @brief Assembles a sampler from declarative configuration

#include <string_view>

#include <absl/status/statusor.h>

#include "sampling/rate_limiting_sampler.h"
#include "sampling/sampler.h"
#include "sampling/sampler_config.h"

namespace axonsentry {
class Config;
}  // namespace axonsentry

namespace axonsentry::sampling {

/// Build the sampler described by `config`
///
/// - disabled: pass-through (keep everything)
/// - probability only: ProbabilitySampler
/// - traces_per_second only: RateLimitingSampler
/// - both: CompositeSampler [probability, rate limit] with combine_strategy
/// - neither: pass-through
///
/// @param config Sampling configuration
/// @param clock Time source for the rate limiter
/// @return InvalidArgument if any configured value is out of range
absl::StatusOr<Sampler> ResolveSampler(const SamplerConfig& config,
                                       Clock clock = SteadyClock());

/// Load the sampler configuration under `prefix` and resolve it
absl::StatusOr<Sampler> ResolveSamplerFromConfig(const Config& config,
                                                 std::string_view prefix = "sampling");

}  // namespace axonsentry::sampling
