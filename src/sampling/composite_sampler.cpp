/// @file composite_sampler.cpp
/// @brief Composite sampler implementation

#include "sampling/composite_sampler.h"

#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "sampling/sampler.h"

namespace axonsentry::sampling {

absl::StatusOr<CompositeSampler> CompositeSampler::Create(std::vector<Sampler> samplers,
                                                          CombineStrategy strategy) {
    if (samplers.empty()) {
        return MakeError(ErrorCode::kEmptyComposite,
                         "CompositeSampler requires at least one sampler");
    }
    return CompositeSampler(std::move(samplers), strategy);
}

absl::StatusOr<CompositeSampler> CompositeSampler::And(std::vector<Sampler> samplers) {
    return Create(std::move(samplers), CombineStrategy::kAnd);
}

absl::StatusOr<CompositeSampler> CompositeSampler::Or(std::vector<Sampler> samplers) {
    return Create(std::move(samplers), CombineStrategy::kOr);
}

CompositeSampler::CompositeSampler(std::vector<Sampler> samplers, CombineStrategy strategy)
    : samplers_(std::move(samplers)), strategy_(strategy) {}

CompositeSampler::CompositeSampler(CompositeSampler&& other) noexcept = default;
CompositeSampler& CompositeSampler::operator=(CompositeSampler&& other) noexcept = default;
CompositeSampler::~CompositeSampler() = default;

size_t CompositeSampler::Size() const {
    return samplers_.size();
}

const Sampler& CompositeSampler::At(size_t index) const {
    return samplers_.at(index);
}

SamplingDecision CompositeSampler::ShouldSample(const SamplingParameters& params) const {
    switch (strategy_) {
        case CombineStrategy::kAnd:
            for (const auto& sampler : samplers_) {
                if (sampler.ShouldSample(params) != SamplingDecision::kKeep) {
                    return SamplingDecision::kDrop;
                }
            }
            return SamplingDecision::kKeep;

        case CombineStrategy::kOr:
            for (const auto& sampler : samplers_) {
                if (sampler.ShouldSample(params) == SamplingDecision::kKeep) {
                    return SamplingDecision::kKeep;
                }
            }
            return SamplingDecision::kDrop;
    }
    return SamplingDecision::kDrop;
}

std::string CompositeSampler::Description() const {
    return absl::StrCat(
        "CompositeSampler{logic=",
        absl::string_view(CombineStrategyToString(strategy_).data(),
                          CombineStrategyToString(strategy_).size()),
        ", samplers=[",
        absl::StrJoin(samplers_, ", ",
                      [](std::string* out, const Sampler& sampler) {
                          absl::StrAppend(out, sampler.Description());
                      }),
        "]}");
}

}  // namespace axonsentry::sampling
