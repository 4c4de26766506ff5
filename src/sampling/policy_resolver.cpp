/// @file policy_resolver.cpp
/// @brief Sampling policy resolution

#include "sampling/policy_resolver.h"

#include <utility>
#include <vector>

#include "common/config.h"
#include "common/error.h"
#include "common/logging.h"

namespace axonsentry::sampling {

absl::StatusOr<Sampler> ResolveSampler(const SamplerConfig& config, Clock clock) {
    if (!config.enabled) {
        AXONSENTRY_LOG_DEBUG("Sampling disabled, keeping all traces");
        return Sampler(PassThroughSampler{});
    }

    AXONSENTRY_RETURN_IF_ERROR(config.Validate());

    std::vector<Sampler> samplers;

    if (config.probability.has_value()) {
        AXONSENTRY_ASSIGN_OR_RETURN(ProbabilitySampler probability_sampler,
                                    ProbabilitySampler::Create(*config.probability));
        samplers.emplace_back(std::move(probability_sampler));
    }

    if (config.traces_per_second.has_value()) {
        AXONSENTRY_ASSIGN_OR_RETURN(
            RateLimitingSampler rate_sampler,
            RateLimitingSampler::Create(*config.traces_per_second, config.burst_capacity,
                                        std::move(clock)));
        samplers.emplace_back(std::move(rate_sampler));
    }

    if (samplers.empty()) {
        AXONSENTRY_LOG_DEBUG("No sampling strategy configured, keeping all traces");
        return Sampler(PassThroughSampler{});
    }

    if (samplers.size() == 1) {
        Sampler sampler = std::move(samplers.front());
        AXONSENTRY_LOG_INFO("Resolved sampler: {}", sampler.Description());
        return std::move(sampler);
    }

    AXONSENTRY_ASSIGN_OR_RETURN(
        CompositeSampler composite,
        CompositeSampler::Create(std::move(samplers), config.combine_strategy));
    Sampler sampler(std::move(composite));
    AXONSENTRY_LOG_INFO("Resolved sampler: {}", sampler.Description());
    return std::move(sampler);
}

absl::StatusOr<Sampler> ResolveSamplerFromConfig(const Config& config,
                                                 std::string_view prefix) {
    AXONSENTRY_ASSIGN_OR_RETURN(SamplerConfig sampler_config,
                                LoadSamplerConfig(config, prefix));
    return ResolveSampler(sampler_config);
}

}  // namespace axonsentry::sampling
