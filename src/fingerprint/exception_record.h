#pragma once

/// @file exception_record.h
/// @brief Read-only view of a captured exception used for fingerprinting

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace axonsentry::fingerprint {

/// Type name recorded when the thrown type cannot be determined
inline constexpr std::string_view kUnknownExceptionType = "UnknownException";

/// One frame of a stack trace
struct StackFrame {
    std::string declaring_unit;  ///< Class or translation unit
    std::string operation;       ///< Function or method name
};

/// Axon failure category of an exception
enum class ErrorCategory {
    kNone,
    kCommandExecution,
    kEventProcessing,
    kQueryExecution
};

/// Failure raised while a command handler executed
class CommandExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Failure raised while an event processor handled an event
class EventProcessingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Failure raised while a query handler executed
class QueryExecutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Exception data consumed by the fingerprint generator
struct ExceptionRecord {
    std::string type_name;               ///< Short type name, e.g. "InvalidArgument"
    std::optional<std::string> message;  ///< Unset if the exception carries none
    std::vector<StackFrame> stack_trace; ///< Most recent frame first
    ErrorCategory category = ErrorCategory::kNone;

    /// Build a record from a caught exception
    ///
    /// The type name is the demangled dynamic type without namespaces or
    /// template arguments; the category follows the Axon error hierarchy;
    /// an empty what() yields no message.
    static ExceptionRecord FromException(const std::exception& exception,
                                         std::vector<StackFrame> stack_trace = {});

    /// Build a record from any thrown object
    ///
    /// Objects not derived from std::exception are recorded as
    /// "UnknownException" without a message.
    static ExceptionRecord FromExceptionPtr(const std::exception_ptr& exception,
                                            std::vector<StackFrame> stack_trace = {});
};

/// Demangle an RTTI type name; returns the input unchanged on failure
std::string DemangleTypeName(const char* mangled);

/// Strip namespaces and template arguments: "a::b::Foo<int>" -> "Foo"
std::string ShortTypeName(std::string_view qualified_name);

/// Convert error category to string
std::string_view ErrorCategoryToString(ErrorCategory category);

}  // namespace axonsentry::fingerprint
