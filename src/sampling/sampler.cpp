/// @file sampler.cpp
/// @brief Sampler dispatch

#include "sampling/sampler.h"

#include <type_traits>

namespace axonsentry::sampling {

SamplingDecision Sampler::ShouldSample(const SamplingParameters& params) const {
    return std::visit(
        [&params](const auto& sampler) -> SamplingDecision {
            using T = std::decay_t<decltype(sampler)>;
            if constexpr (std::is_same_v<T, ProbabilitySampler>) {
                return sampler.ShouldSample(params.trace_id);
            } else if constexpr (std::is_same_v<T, CompositeSampler>) {
                return sampler.ShouldSample(params);
            } else {
                return sampler.ShouldSample();
            }
        },
        impl_);
}

SamplingDecision Sampler::ShouldSample(std::string_view trace_id) const {
    SamplingParameters params;
    params.trace_id = std::string(trace_id);
    return ShouldSample(params);
}

std::string Sampler::Description() const {
    return std::visit([](const auto& sampler) { return sampler.Description(); }, impl_);
}

}  // namespace axonsentry::sampling
