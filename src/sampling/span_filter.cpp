/// @file span_filter.cpp
/// @brief Span export filter implementations

#include "sampling/span_filter.h"

#include <algorithm>
#include <utility>

#include "common/config.h"
#include "common/error.h"

namespace axonsentry::sampling {

TracingOptions TracingOptions::ErrorsOnly() {
    TracingOptions options;
    options.trace_commands = false;
    options.trace_events = false;
    options.trace_queries = false;
    return options;
}

absl::StatusOr<TracingOptions> LoadTracingOptions(const Config& config) {
    TracingOptions options;

    const std::pair<const char*, bool*> fields[] = {
        {"tracing.enabled", &options.enabled},
        {"tracing.trace_commands", &options.trace_commands},
        {"tracing.trace_events", &options.trace_events},
        {"tracing.trace_queries", &options.trace_queries},
    };

    for (const auto& [key, field] : fields) {
        if (config.HasKey(key)) {
            AXONSENTRY_ASSIGN_OR_RETURN(*field, config.TryGetBool(key));
        }
    }

    return options;
}

MessageTypeSpanFilter::MessageTypeSpanFilter(TracingOptions options)
    : options_(options) {}

bool MessageTypeSpanFilter::ShouldExport(const SpanData& span) const {
    if (!options_.enabled) {
        return false;
    }

    auto it = span.attributes.find(std::string(kMessageTypeAttribute));
    if (it == span.attributes.end()) {
        return true;
    }

    const auto* message_type = std::get_if<std::string>(&it->second);
    if (message_type == nullptr) {
        return true;
    }

    if (*message_type == kMessageTypeCommand) {
        return options_.trace_commands;
    }
    if (*message_type == kMessageTypeEvent) {
        return options_.trace_events;
    }
    if (*message_type == kMessageTypeQuery) {
        return options_.trace_queries;
    }

    // Export unknown types by default
    return true;
}

CompositeSpanFilter::CompositeSpanFilter(std::vector<std::unique_ptr<SpanFilter>> filters)
    : filters_(std::move(filters)) {}

bool CompositeSpanFilter::ShouldExport(const SpanData& span) const {
    return std::all_of(filters_.begin(), filters_.end(),
                       [&span](const std::unique_ptr<SpanFilter>& filter) {
                           return filter && filter->ShouldExport(span);
                       });
}

}  // namespace axonsentry::sampling
