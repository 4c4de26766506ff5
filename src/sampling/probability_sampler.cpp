/// @file probability_sampler.cpp
/// @brief Probability sampler implementation

#include "sampling/probability_sampler.h"

#include <cmath>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace axonsentry::sampling {

namespace {

constexpr uint64_t kHashMultiplier = 31;
constexpr uint64_t kHashModulus = 100000;
constexpr uint64_t kKeepPositiveMask = 0x7FFFFFFFFFFFFFFFULL;

}  // namespace

absl::StatusOr<ProbabilitySampler> ProbabilitySampler::Create(double probability) {
    if (std::isnan(probability) || probability < 0.0 || probability > 1.0) {
        return MakeError(ErrorCode::kInvalidProbability,
                         absl::StrCat("Probability must be between 0.0 and 1.0, got ",
                                      probability));
    }
    return ProbabilitySampler(probability);
}

uint64_t ProbabilitySampler::HashTraceId(std::string_view trace_id) {
    // Unsigned arithmetic wraps modulo 2^64, matching two's complement
    // overflow, so the mask yields the same value on every platform.
    uint64_t hash = 0;
    for (char c : trace_id) {
        hash = (hash * kHashMultiplier + static_cast<unsigned char>(c)) & kKeepPositiveMask;
    }
    return hash;
}

SamplingDecision ProbabilitySampler::ShouldSample(std::string_view trace_id) const {
    const double normalized =
        static_cast<double>(HashTraceId(trace_id) % kHashModulus) /
        static_cast<double>(kHashModulus);

    return normalized < probability_ ? SamplingDecision::kKeep : SamplingDecision::kDrop;
}

std::string ProbabilitySampler::Description() const {
    return absl::StrCat("ProbabilitySampler{", probability_, "}");
}

}  // namespace axonsentry::sampling
