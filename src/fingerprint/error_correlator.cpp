/// @file error_correlator.cpp
/// @brief Error correlation implementation

#include "fingerprint/error_correlator.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/time/time.h>
#include <nlohmann/json.hpp>

#include "common/error.h"
#include "common/logging.h"

namespace axonsentry::fingerprint {

using json = nlohmann::json;

namespace {

constexpr size_t kTraceIdLength = 32;
constexpr size_t kSpanIdLength = 16;

void AddEventTimestamp(ErrorReport& report, const MessageContext& message) {
    if (!message.timestamp) {
        return;
    }
    report.tags["axon.event_timestamp"] =
        absl::FormatTime("%Y-%m-%d%ET%H:%M:%E*SZ", absl::FromChrono(*message.timestamp),
                         absl::UTCTimeZone());
}

bool IsNonZeroHex(const std::string& id, size_t expected_length) {
    if (id.size() != expected_length) {
        return false;
    }
    const bool all_hex = std::all_of(id.begin(), id.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
    const bool all_zero = std::all_of(id.begin(), id.end(), [](char c) { return c == '0'; });
    return all_hex && !all_zero;
}

}  // namespace

bool TraceContext::IsValid() const {
    return IsNonZeroHex(trace_id, kTraceIdLength) && IsNonZeroHex(span_id, kSpanIdLength);
}

std::string_view MessageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::kCommand:
            return "command";
        case MessageType::kEvent:
        case MessageType::kDomainEvent:
            return "event";
        case MessageType::kQuery:
            return "query";
        case MessageType::kGeneric:
            return "message";
    }
    return "message";
}

ErrorCorrelator::ErrorCorrelator(FingerprintGenerator generator)
    : generator_(std::move(generator)) {}

ErrorReport ErrorCorrelator::Correlate(const ExceptionRecord& exception,
                                       const TraceContext& trace,
                                       const std::optional<MessageContext>& message) const {
    ErrorReport report;
    report.type_name = exception.type_name;
    report.message = exception.message;

    AddTraceContext(report, trace);

    std::optional<std::string_view> aggregate_type;
    std::optional<std::string_view> aggregate_id;
    if (message) {
        AddMessageContext(report, *message);
        if (message->aggregate_type) aggregate_type = *message->aggregate_type;
        if (message->aggregate_id) aggregate_id = *message->aggregate_id;
    }

    if (exception.category == ErrorCategory::kCommandExecution) {
        report.tags["axon.exception_type"] = "CommandExecutionException";
    }

    report.fingerprint = generator_.GenerateFingerprint(exception, aggregate_type, aggregate_id);

    AXONSENTRY_LOG_DEBUG("Correlated {} with trace={} fingerprint_size={}",
                         exception.type_name, trace.trace_id, report.fingerprint.size());
    return report;
}

void ErrorCorrelator::AddTraceContext(ErrorReport& report, const TraceContext& trace) {
    if (!trace.IsValid()) {
        return;
    }
    report.tags["trace_id"] = trace.trace_id;
    report.tags["span_id"] = trace.span_id;
    report.tags["trace_sampled"] = trace.sampled ? "true" : "false";
}

void ErrorCorrelator::AddMessageContext(ErrorReport& report, const MessageContext& message) {
    report.tags["axon.message_id"] = message.message_id;
    report.tags["axon.message_name"] = message.payload_type;
    report.tags["axon.message_type"] = std::string(MessageTypeToString(message.type));

    switch (message.type) {
        case MessageType::kCommand:
            report.tags["axon.command_name"] = message.command_name;
            break;
        case MessageType::kDomainEvent:
            if (message.aggregate_type) {
                report.tags["axon.aggregate_type"] = *message.aggregate_type;
            }
            if (message.aggregate_id) {
                report.tags["axon.aggregate_id"] = *message.aggregate_id;
            }
            if (message.sequence_number) {
                report.tags["axon.sequence_number"] = absl::StrCat(*message.sequence_number);
            }
            AddEventTimestamp(report, message);
            break;
        case MessageType::kQuery:
            report.tags["axon.query_name"] = message.query_name;
            report.tags["axon.query_response_type"] = message.response_type;
            break;
        case MessageType::kEvent:
            AddEventTimestamp(report, message);
            break;
        case MessageType::kGeneric:
            break;
    }

    for (const auto& [key, value] : message.metadata) {
        report.extras[absl::StrCat("axon.metadata.", key)] = value;
    }
}

std::string SerializeErrorReport(const ErrorReport& report) {
    json j;
    j["type"] = report.type_name;
    if (report.message) {
        j["message"] = *report.message;
    } else {
        j["message"] = nullptr;
    }
    j["fingerprint"] = report.fingerprint;
    j["tags"] = report.tags;
    j["extras"] = report.extras;
    // what() text is arbitrary bytes; invalid UTF-8 becomes U+FFFD.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

absl::StatusOr<ErrorReport> DeserializeErrorReport(const std::string& json_str) {
    try {
        auto j = json::parse(json_str);

        ErrorReport report;
        report.type_name = j.at("type").get<std::string>();
        if (j.contains("message") && !j["message"].is_null()) {
            report.message = j["message"].get<std::string>();
        }
        report.fingerprint = j.value("fingerprint", Fingerprint{});
        report.tags = j.value("tags", std::map<std::string, std::string>{});
        report.extras = j.value("extras", std::map<std::string, std::string>{});
        return report;
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kMalformedReport,
                         absl::StrCat("Failed to parse error report: ", e.what()));
    }
}

}  // namespace axonsentry::fingerprint
