#pragma once

/// @file error.h
/// @brief axonsentry error codes carried on absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace axonsentry {

/// @brief Error codes specific to axonsentry
///
/// Every error produced by the library is an absl::Status whose canonical
/// code comes from ToAbslCode; the axonsentry code travels with it as a
/// payload so callers can tell, e.g., a bad probability from a bad burst.
enum class ErrorCode {
    kOk = 0,
    kUnknown,

    // Sampling policy
    kInvalidProbability,
    kInvalidRate,
    kInvalidBurstCapacity,
    kInvalidCombineStrategy,
    kEmptyComposite,

    // Configuration layer
    kConfigNotFound,
    kConfigParseError,
    kConfigTypeMismatch,
    kInvalidLogLevel,

    // Error reports
    kMalformedReport,
};

/// @brief Convert axonsentry error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Stable name of an error code, e.g. "INVALID_PROBABILITY"
std::string_view ErrorCodeToString(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the code attached by MakeError
/// @return kOk for OK, kUnknown for statuses not created by MakeError
ErrorCode GetErrorCode(const absl::Status& status);

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define AXONSENTRY_RETURN_IF_ERROR(expr)                                       \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define AXONSENTRY_ASSIGN_OR_RETURN(lhs, rhs)                                  \
    AXONSENTRY_ASSIGN_OR_RETURN_IMPL(                                          \
        AXONSENTRY_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define AXONSENTRY_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                   \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define AXONSENTRY_CONCAT(a, b) AXONSENTRY_CONCAT_IMPL(a, b)
#define AXONSENTRY_CONCAT_IMPL(a, b) a##b

}  // namespace axonsentry
