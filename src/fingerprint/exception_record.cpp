/// @file exception_record.cpp
/// @brief Exception record extraction

#include "fingerprint/exception_record.h"

#include <cstdlib>
#include <memory>
#include <typeinfo>
#include <utility>

#include <cxxabi.h>

namespace axonsentry::fingerprint {

namespace {

ErrorCategory CategoryOf(const std::exception& exception) {
    if (dynamic_cast<const CommandExecutionError*>(&exception) != nullptr) {
        return ErrorCategory::kCommandExecution;
    }
    if (dynamic_cast<const EventProcessingError*>(&exception) != nullptr) {
        return ErrorCategory::kEventProcessing;
    }
    if (dynamic_cast<const QueryExecutionError*>(&exception) != nullptr) {
        return ErrorCategory::kQueryExecution;
    }
    return ErrorCategory::kNone;
}

}  // namespace

std::string DemangleTypeName(const char* mangled) {
    if (mangled == nullptr) {
        return std::string(kUnknownExceptionType);
    }
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);
    if (status != 0 || !demangled) {
        return mangled;
    }
    return demangled.get();
}

std::string ShortTypeName(std::string_view qualified_name) {
    // Drop template arguments, keeping nested "<...>" balanced.
    std::string without_templates;
    without_templates.reserve(qualified_name.size());
    int depth = 0;
    for (char c : qualified_name) {
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            if (depth > 0) --depth;
        } else if (depth == 0) {
            without_templates.push_back(c);
        }
    }

    const size_t separator = without_templates.rfind("::");
    if (separator == std::string::npos) {
        return without_templates;
    }
    return without_templates.substr(separator + 2);
}

std::string_view ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::kNone:
            return "none";
        case ErrorCategory::kCommandExecution:
            return "command_execution";
        case ErrorCategory::kEventProcessing:
            return "event_processing";
        case ErrorCategory::kQueryExecution:
            return "query_execution";
    }
    return "unknown";
}

ExceptionRecord ExceptionRecord::FromException(const std::exception& exception,
                                               std::vector<StackFrame> stack_trace) {
    ExceptionRecord record;
    record.type_name = ShortTypeName(DemangleTypeName(typeid(exception).name()));
    record.category = CategoryOf(exception);
    record.stack_trace = std::move(stack_trace);

    const char* what = exception.what();
    if (what != nullptr && *what != '\0') {
        record.message = std::string(what);
    }
    return record;
}

ExceptionRecord ExceptionRecord::FromExceptionPtr(const std::exception_ptr& exception,
                                                  std::vector<StackFrame> stack_trace) {
    try {
        if (exception) {
            std::rethrow_exception(exception);
        }
    } catch (const std::exception& e) {
        return FromException(e, std::move(stack_trace));
    } catch (...) {
        // Non-standard payload: only the fact that something was thrown is known.
    }

    ExceptionRecord record;
    record.type_name = std::string(kUnknownExceptionType);
    record.stack_trace = std::move(stack_trace);
    return record;
}

}  // namespace axonsentry::fingerprint
