#pragma once

/// @file types.h
/// @brief Common types for trace sampling decisions

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace axonsentry::sampling {

/// Attribute value type
using AttributeValue = std::variant<
    std::string,
    bool,
    int64_t,
    double,
    std::vector<std::string>,
    std::vector<int64_t>,
    std::vector<double>,
    std::vector<bool>>;

/// Span attribute set
using Attributes = std::map<std::string, AttributeValue>;

/// Span kind
enum class SpanKind {
    kInternal = 0,
    kServer = 1,
    kClient = 2,
    kProducer = 3,
    kConsumer = 4
};

/// Sampling decision
enum class SamplingDecision {
    kDrop,  ///< Discard the trace
    kKeep   ///< Record and export the trace
};

/// How a composite sampler merges the decisions of its children
enum class CombineStrategy {
    kAnd,  ///< Every sampler must keep
    kOr    ///< Any sampler keeping is sufficient
};

/// Inputs available to a sampler when a span starts
struct SamplingParameters {
    std::string trace_id;  // 16 bytes hex encoded
    std::string span_name;
    SpanKind span_kind = SpanKind::kInternal;
    Attributes attributes;
};

/// Convert a sampling decision to string
std::string_view SamplingDecisionToString(SamplingDecision decision);

/// Convert a combine strategy to its canonical name ("AND" / "OR")
std::string_view CombineStrategyToString(CombineStrategy strategy);

}  // namespace axonsentry::sampling
