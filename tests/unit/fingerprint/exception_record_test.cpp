/// @file exception_record_test.cpp
/// @brief Tests for exception record extraction

#include <stdexcept>
#include <string>
#include <typeinfo>

#include <gtest/gtest.h>

#include "fingerprint/exception_record.h"

namespace axonsentry::fingerprint {
namespace {

class AccountNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InsufficientFundsError : public CommandExecutionError {
public:
    using CommandExecutionError::CommandExecutionError;
};

// what() returning an empty string
class SilentError : public std::exception {
public:
    const char* what() const noexcept override { return ""; }
};

template <typename T>
struct Wrapper {};

// ============================================================================
// Type names
// ============================================================================

TEST(ExceptionRecordTest, DemangleTypeName) {
    EXPECT_EQ(DemangleTypeName(typeid(std::invalid_argument).name()), "std::invalid_argument");
    EXPECT_EQ(DemangleTypeName(nullptr), "UnknownException");
}

TEST(ExceptionRecordTest, DemangleReturnsInputOnFailure) {
    EXPECT_EQ(DemangleTypeName("not a mangled name!"), "not a mangled name!");
}

TEST(ExceptionRecordTest, ShortTypeName) {
    EXPECT_EQ(ShortTypeName("std::runtime_error"), "runtime_error");
    EXPECT_EQ(ShortTypeName("AccountNotFound"), "AccountNotFound");
    EXPECT_EQ(ShortTypeName("a::b::Foo<int, std::vector<int>>"), "Foo");
    EXPECT_EQ(ShortTypeName("ns::Outer<int>::Inner"), "Inner");
    EXPECT_EQ(ShortTypeName(DemangleTypeName(typeid(Wrapper<std::string>).name())), "Wrapper");
}

// ============================================================================
// FromException
// ============================================================================

TEST(ExceptionRecordTest, FromStandardException) {
    const auto record = ExceptionRecord::FromException(std::runtime_error("Account 123 not found"));

    EXPECT_EQ(record.type_name, "runtime_error");
    ASSERT_TRUE(record.message.has_value());
    EXPECT_EQ(*record.message, "Account 123 not found");
    EXPECT_EQ(record.category, ErrorCategory::kNone);
    EXPECT_TRUE(record.stack_trace.empty());
}

TEST(ExceptionRecordTest, UsesDynamicType) {
    AccountNotFoundError error("missing");
    const std::exception& base = error;

    EXPECT_EQ(ExceptionRecord::FromException(base).type_name, "AccountNotFoundError");
}

TEST(ExceptionRecordTest, DetectsAxonCategories) {
    EXPECT_EQ(ExceptionRecord::FromException(CommandExecutionError("x")).category,
              ErrorCategory::kCommandExecution);
    EXPECT_EQ(ExceptionRecord::FromException(EventProcessingError("x")).category,
              ErrorCategory::kEventProcessing);
    EXPECT_EQ(ExceptionRecord::FromException(QueryExecutionError("x")).category,
              ErrorCategory::kQueryExecution);

    const auto derived = ExceptionRecord::FromException(InsufficientFundsError("low balance"));
    EXPECT_EQ(derived.type_name, "InsufficientFundsError");
    EXPECT_EQ(derived.category, ErrorCategory::kCommandExecution);
}

TEST(ExceptionRecordTest, EmptyWhatHasNoMessage) {
    EXPECT_FALSE(ExceptionRecord::FromException(SilentError()).message.has_value());
}

TEST(ExceptionRecordTest, KeepsStackTrace) {
    const auto record = ExceptionRecord::FromException(
        std::logic_error("bad"), {{"AccountService", "withdraw"}, {"CommandBus", "dispatch"}});

    ASSERT_EQ(record.stack_trace.size(), 2u);
    EXPECT_EQ(record.stack_trace[0].declaring_unit, "AccountService");
    EXPECT_EQ(record.stack_trace[0].operation, "withdraw");
}

// ============================================================================
// FromExceptionPtr
// ============================================================================

TEST(ExceptionRecordTest, FromExceptionPtr) {
    std::exception_ptr captured;
    try {
        throw std::out_of_range("index 7");
    } catch (...) {
        captured = std::current_exception();
    }

    const auto record = ExceptionRecord::FromExceptionPtr(captured);
    EXPECT_EQ(record.type_name, "out_of_range");
    EXPECT_EQ(record.message.value_or(""), "index 7");
}

TEST(ExceptionRecordTest, NonStandardPayloadIsUnknown) {
    const auto record =
        ExceptionRecord::FromExceptionPtr(std::make_exception_ptr(42), {{"Main", "run"}});

    EXPECT_EQ(record.type_name, "UnknownException");
    EXPECT_FALSE(record.message.has_value());
    EXPECT_EQ(record.stack_trace.size(), 1u);
}

TEST(ExceptionRecordTest, NullExceptionPtrIsUnknown) {
    EXPECT_EQ(ExceptionRecord::FromExceptionPtr(nullptr).type_name, "UnknownException");
}

TEST(ExceptionRecordTest, ErrorCategoryToString) {
    EXPECT_EQ(ErrorCategoryToString(ErrorCategory::kNone), "none");
    EXPECT_EQ(ErrorCategoryToString(ErrorCategory::kCommandExecution), "command_execution");
    EXPECT_EQ(ErrorCategoryToString(ErrorCategory::kQueryExecution), "query_execution");
}

}  // namespace
}  // namespace axonsentry::fingerprint
