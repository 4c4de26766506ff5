#pragma once

/// @file span_filter.h
/// @brief Export filters applied to finished spans by message type

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "sampling/types.h"

namespace axonsentry {
class Config;
}  // namespace axonsentry

namespace axonsentry::sampling {

/// Attribute carrying the Axon message type of a span
inline constexpr std::string_view kMessageTypeAttribute = "axon.message_type";

inline constexpr std::string_view kMessageTypeCommand = "command";
inline constexpr std::string_view kMessageTypeEvent = "event";
inline constexpr std::string_view kMessageTypeQuery = "query";

/// Finished span as seen by export filters
struct SpanData {
    std::string trace_id;
    std::string name;
    SpanKind kind = SpanKind::kInternal;
    Attributes attributes;
};

/// Which message types are traced
struct TracingOptions {
    bool enabled = true;
    bool trace_commands = true;
    bool trace_events = true;
    bool trace_queries = true;

    /// Trace nothing but let errors through to error reporting
    static TracingOptions ErrorsOnly();
};

/// Read tracing options from the "tracing.*" keys
absl::StatusOr<TracingOptions> LoadTracingOptions(const Config& config);

/// Base span filter interface
class SpanFilter {
public:
    virtual ~SpanFilter() = default;

    /// Determine if a finished span should be exported
    virtual bool ShouldExport(const SpanData& span) const = 0;
};

/// Filters spans by their message type attribute
///
/// Commands, events and queries follow their TracingOptions flag; spans
/// without a recognized message type are exported. Nothing is exported
/// while tracing is disabled.
class MessageTypeSpanFilter : public SpanFilter {
public:
    explicit MessageTypeSpanFilter(TracingOptions options);

    bool ShouldExport(const SpanData& span) const override;

    const TracingOptions& GetOptions() const { return options_; }

private:
    TracingOptions options_;
};

/// Exports a span only if every child filter agrees
class CompositeSpanFilter : public SpanFilter {
public:
    explicit CompositeSpanFilter(std::vector<std::unique_ptr<SpanFilter>> filters);

    bool ShouldExport(const SpanData& span) const override;

private:
    std::vector<std::unique_ptr<SpanFilter>> filters_;
};

}  // namespace axonsentry::sampling
