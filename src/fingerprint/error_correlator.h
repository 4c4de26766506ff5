#pragma once

/// @file error_correlator.h
/// @brief Correlates captured exceptions with trace and message context
///
/// Produces an ErrorReport that an error-tracking integration attaches to
/// its outgoing event:
/// - trace correlation tags (trace_id, span_id, trace_sampled)
/// - Axon message context tags (message id/name/type and per-type details)
/// - message metadata as extras
/// - the grouping fingerprint

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

#include "fingerprint/exception_record.h"
#include "fingerprint/fingerprint_generator.h"

namespace axonsentry::fingerprint {

/// Span context of the operation that failed
struct TraceContext {
    std::string trace_id;  // 32 hex chars
    std::string span_id;   // 16 hex chars
    bool sampled = false;

    /// True if both IDs are well-formed and not all zeros
    bool IsValid() const;
};

/// Kind of Axon message being handled when the error occurred
enum class MessageType {
    kGeneric,
    kCommand,
    kEvent,
    kDomainEvent,
    kQuery
};

/// Axon message being handled when the error occurred
struct MessageContext {
    MessageType type = MessageType::kGeneric;
    std::string message_id;
    std::string payload_type;

    // Event and domain event; reported as ISO-8601 UTC
    std::optional<std::chrono::system_clock::time_point> timestamp;

    // Command
    std::string command_name;

    // Domain event
    std::optional<std::string> aggregate_type;
    std::optional<std::string> aggregate_id;
    std::optional<int64_t> sequence_number;

    // Query
    std::string query_name;
    std::string response_type;

    std::map<std::string, std::string> metadata;
};

/// Error data ready to attach to an outgoing error event
struct ErrorReport {
    std::string type_name;
    std::optional<std::string> message;
    Fingerprint fingerprint;
    std::map<std::string, std::string> tags;
    std::map<std::string, std::string> extras;
};

/// Builds error reports from exceptions and their context
class ErrorCorrelator {
public:
    ErrorCorrelator() = default;
    explicit ErrorCorrelator(FingerprintGenerator generator);

    /// Correlate an exception with its trace and message context
    /// @param exception Captured exception
    /// @param trace Span context; tags are only added if it is valid
    /// @param message Message being handled, if any
    /// @return Report with tags, extras and fingerprint
    ErrorReport Correlate(const ExceptionRecord& exception,
                          const TraceContext& trace,
                          const std::optional<MessageContext>& message = std::nullopt) const;

private:
    static void AddTraceContext(ErrorReport& report, const TraceContext& trace);
    static void AddMessageContext(ErrorReport& report, const MessageContext& message);

    FingerprintGenerator generator_;
};

/// Serialize an error report to JSON
std::string SerializeErrorReport(const ErrorReport& report);

/// Deserialize an error report from JSON
absl::StatusOr<ErrorReport> DeserializeErrorReport(const std::string& json);

/// Convert message type to the tag value used in reports
std::string_view MessageTypeToString(MessageType type);

}  // namespace axonsentry::fingerprint
