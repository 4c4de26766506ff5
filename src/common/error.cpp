#include "error.h"

#include <optional>

#include <absl/strings/cord.h>
#include <absl/types/optional.h>

namespace axonsentry {

namespace {

constexpr absl::string_view kErrorCodePayloadUrl = "type.axonsentry.dev/error_code";

constexpr ErrorCode kAllCodes[] = {
    ErrorCode::kOk,
    ErrorCode::kUnknown,
    ErrorCode::kInvalidProbability,
    ErrorCode::kInvalidRate,
    ErrorCode::kInvalidBurstCapacity,
    ErrorCode::kInvalidCombineStrategy,
    ErrorCode::kEmptyComposite,
    ErrorCode::kConfigNotFound,
    ErrorCode::kConfigParseError,
    ErrorCode::kConfigTypeMismatch,
    ErrorCode::kInvalidLogLevel,
    ErrorCode::kMalformedReport,
};

}  // namespace

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidProbability:
        case ErrorCode::kInvalidRate:
        case ErrorCode::kInvalidBurstCapacity:
        case ErrorCode::kInvalidCombineStrategy:
        case ErrorCode::kEmptyComposite:
        case ErrorCode::kConfigParseError:
        case ErrorCode::kConfigTypeMismatch:
        case ErrorCode::kInvalidLogLevel:
        case ErrorCode::kMalformedReport:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kConfigNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kUnknown:
            return absl::StatusCode::kUnknown;
    }
    return absl::StatusCode::kUnknown;
}

std::string_view ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "OK";
        case ErrorCode::kUnknown: return "UNKNOWN";
        case ErrorCode::kInvalidProbability: return "INVALID_PROBABILITY";
        case ErrorCode::kInvalidRate: return "INVALID_RATE";
        case ErrorCode::kInvalidBurstCapacity: return "INVALID_BURST_CAPACITY";
        case ErrorCode::kInvalidCombineStrategy: return "INVALID_COMBINE_STRATEGY";
        case ErrorCode::kEmptyComposite: return "EMPTY_COMPOSITE";
        case ErrorCode::kConfigNotFound: return "CONFIG_NOT_FOUND";
        case ErrorCode::kConfigParseError: return "CONFIG_PARSE_ERROR";
        case ErrorCode::kConfigTypeMismatch: return "CONFIG_TYPE_MISMATCH";
        case ErrorCode::kInvalidLogLevel: return "INVALID_LOG_LEVEL";
        case ErrorCode::kMalformedReport: return "MALFORMED_REPORT";
    }
    return "UNKNOWN";
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
    if (!status.ok()) {
        status.SetPayload(kErrorCodePayloadUrl, absl::Cord(absl::string_view(ErrorCodeToString(code).data(), ErrorCodeToString(code).size())));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }
    absl::optional<absl::Cord> payload = status.GetPayload(kErrorCodePayloadUrl);
    if (!payload) {
        return ErrorCode::kUnknown;
    }
    for (ErrorCode code : kAllCodes) {
        if (*payload == absl::string_view(ErrorCodeToString(code).data(), ErrorCodeToString(code).size())) {
            return code;
        }
    }
    return ErrorCode::kUnknown;
}

}  // namespace axonsentry
