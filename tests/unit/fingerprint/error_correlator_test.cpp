/// @file error_correlator_test.cpp
/// @brief Tests for correlating errors with trace and message context

#include <chrono>
#include <stdexcept>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "fingerprint/error_correlator.h"

namespace axonsentry::fingerprint {
namespace {

using ::testing::ElementsAre;
using ::testing::Contains;
using ::testing::Key;
using ::testing::Not;
using ::testing::Pair;

constexpr char kTraceId[] = "4bf92f3577b34da6a3ce929d0e0e4736";
constexpr char kSpanId[] = "00f067aa0ba902b7";

// 2025-11-19T10:00:00Z
const auto kEventTime = std::chrono::system_clock::from_time_t(1763546400);

TraceContext ValidTrace(bool sampled = true) {
    return TraceContext{kTraceId, kSpanId, sampled};
}

MessageContext CommandMessage() {
    MessageContext message;
    message.type = MessageType::kCommand;
    message.message_id = "msg-1";
    message.payload_type = "com.bank.WithdrawMoneyCommand";
    message.command_name = "WithdrawMoneyCommand";
    message.aggregate_type = "BankAccount";
    message.aggregate_id = "acc-42";
    message.metadata = {{"correlationId", "corr-7"}, {"traceId", kTraceId}};
    return message;
}

// ============================================================================
// TraceContext
// ============================================================================

TEST(TraceContextTest, Validity) {
    EXPECT_TRUE(ValidTrace().IsValid());
    EXPECT_FALSE((TraceContext{}).IsValid());
    EXPECT_FALSE((TraceContext{std::string(32, '0'), kSpanId, true}).IsValid());
    EXPECT_FALSE((TraceContext{kTraceId, std::string(16, '0'), true}).IsValid());
    EXPECT_FALSE((TraceContext{"xyz", kSpanId, true}).IsValid());
    EXPECT_FALSE((TraceContext{std::string(31, 'a') + "g", kSpanId, true}).IsValid());
}

// ============================================================================
// ErrorCorrelator
// ============================================================================

TEST(ErrorCorrelatorTest, AddsTraceTags) {
    ErrorCorrelator correlator;
    const auto record = ExceptionRecord::FromException(std::runtime_error("boom"));

    const auto report = correlator.Correlate(record, ValidTrace(false));

    EXPECT_THAT(report.tags, Contains(Pair("trace_id", kTraceId)));
    EXPECT_THAT(report.tags, Contains(Pair("span_id", kSpanId)));
    EXPECT_THAT(report.tags, Contains(Pair("trace_sampled", "false")));
    EXPECT_EQ(report.type_name, "runtime_error");
    EXPECT_EQ(report.message.value_or(""), "boom");
}

TEST(ErrorCorrelatorTest, InvalidTraceAddsNoTraceTags) {
    ErrorCorrelator correlator;
    const auto record = ExceptionRecord::FromException(std::runtime_error("boom"));

    const auto report = correlator.Correlate(record, TraceContext{});

    EXPECT_THAT(report.tags, Not(Contains(Key("trace_id"))));
    EXPECT_THAT(report.tags, Not(Contains(Key("span_id"))));
    EXPECT_THAT(report.fingerprint, ElementsAre("runtime_error", "boom"));
}

TEST(ErrorCorrelatorTest, CommandContext) {
    ErrorCorrelator correlator;
    const auto record = ExceptionRecord::FromException(
        CommandExecutionError("Balance 10 below 20"), {{"BankAccount", "handle"}});

    const auto report = correlator.Correlate(record, ValidTrace(), CommandMessage());

    EXPECT_THAT(report.tags, Contains(Pair("axon.message_id", "msg-1")));
    EXPECT_THAT(report.tags, Contains(Pair("axon.message_name", "com.bank.WithdrawMoneyCommand")));
    EXPECT_THAT(report.tags, Contains(Pair("axon.message_type", "command")));
    EXPECT_THAT(report.tags, Contains(Pair("axon.command_name", "WithdrawMoneyCommand")));
    EXPECT_THAT(report.tags, Contains(Pair("axon.exception_type", "CommandExecutionException")));
    EXPECT_THAT(report.tags, Not(Contains(Key("axon.aggregate_id"))));

    EXPECT_THAT(report.extras, Contains(Pair("axon.metadata.correlationId", "corr-7")));
    EXPECT_THAT(report.extras, Contains(Pair("axon.metadata.traceId", kTraceId)));

    EXPECT_THAT(report.fingerprint,
                ElementsAre("CommandExecutionError", "CommandExecution", "BankAccount",
                            "Balance {number} below {number}", "BankAccount.handle"));
}

TEST(ErrorCorrelatorTest, DomainEventContext) {
    MessageContext message;
    message.type = MessageType::kDomainEvent;
    message.message_id = "evt-9";
    message.payload_type = "MoneyWithdrawnEvent";
    message.aggregate_type = "BankAccount";
    message.aggregate_id = "acc-42";
    message.sequence_number = 17;
    message.timestamp = kEventTime;

    ErrorCorrelator correlator;
    const auto record = ExceptionRecord::FromException(EventProcessingError("Projection failed"));
    const auto report = correlator.Correlate(record, ValidTrace(), message);

    EXPECT_THAT(report.tags, Contains(Pair("axon.message_type", "event")));
    EXPECT_THAT(report.tags, Contains(Pair("axon.aggregate_type", "BankAccount")));
    EXPECT_THAT(report.tags, Contains(Pair("axon.aggregate_id", "acc-42")));
    EXPECT_THAT(report.tags, Contains(Pair("axon.sequence_number", "17")));
    EXPECT_THAT(report.tags, Contains(Pair("axon.event_timestamp", "2025-11-19T10:00:00Z")));
    EXPECT_THAT(report.tags, Not(Contains(Key("axon.exception_type"))));

    EXPECT_THAT(report.fingerprint,
                ElementsAre("EventProcessingError", "EventProcessing", "BankAccount",
                            "Projection failed"));
}

TEST(ErrorCorrelatorTest, EventContextCarriesTimestamp) {
    MessageContext message;
    message.type = MessageType::kEvent;
    message.message_id = "evt-10";
    message.payload_type = "RatesPublishedEvent";
    message.timestamp = kEventTime + std::chrono::hours(2) + std::chrono::minutes(30);

    ErrorCorrelator correlator;
    const auto record = ExceptionRecord::FromException(EventProcessingError("Stale rates"));
    const auto report = correlator.Correlate(record, ValidTrace(), message);

    EXPECT_THAT(report.tags, Contains(Pair("axon.message_type", "event")));
    EXPECT_THAT(report.tags, Contains(Pair("axon.event_timestamp", "2025-11-19T12:30:00Z")));
    EXPECT_THAT(report.tags, Not(Contains(Key("axon.aggregate_type"))));
}

TEST(ErrorCorrelatorTest, TimestampOnlyTaggedForEvents) {
    auto message = CommandMessage();
    message.timestamp = kEventTime;

    ErrorCorrelator correlator;
    const auto record = ExceptionRecord::FromException(CommandExecutionError("Rejected"));
    const auto report = correlator.Correlate(record, ValidTrace(), message);

    EXPECT_THAT(report.tags, Not(Contains(Key("axon.event_timestamp"))));

    MessageContext untimed;
    untimed.type = MessageType::kEvent;
    EXPECT_THAT(correlator.Correlate(record, ValidTrace(), untimed).tags,
                Not(Contains(Key("axon.event_timestamp"))));
}

TEST(ErrorCorrelatorTest, QueryContext) {
    MessageContext message;
    message.type = MessageType::kQuery;
    message.message_id = "q-3";
    message.payload_type = "FindAccountQuery";
    message.query_name = "FindAccountQuery";
    message.response_type = "AccountView";

    ErrorCorrelator correlator;
    const auto record = ExceptionRecord::FromException(QueryExecutionError("Timed out"));
    const auto report = correlator.Correlate(record, ValidTrace(), message);

    EXPECT_THAT(report.tags, Contains(Pair("axon.message_type", "query")));
    EXPECT_THAT(report.tags, Contains(Pair("axon.query_name", "FindAccountQuery")));
    EXPECT_THAT(report.tags, Contains(Pair("axon.query_response_type", "AccountView")));
}

TEST(ErrorCorrelatorTest, GenericMessageType) {
    EXPECT_EQ(MessageTypeToString(MessageType::kGeneric), "message");
    EXPECT_EQ(MessageTypeToString(MessageType::kEvent), "event");
}

TEST(ErrorCorrelatorTest, SameFailureOnDifferentAggregatesGroupsTogether) {
    ErrorCorrelator correlator;
    const auto record = ExceptionRecord::FromException(CommandExecutionError("Account closed"));

    auto first_message = CommandMessage();
    auto second_message = CommandMessage();
    second_message.aggregate_id = "acc-99";

    EXPECT_EQ(correlator.Correlate(record, ValidTrace(), first_message).fingerprint,
              correlator.Correlate(record, ValidTrace(), second_message).fingerprint);
}

// ============================================================================
// Serialization
// ============================================================================

TEST(ErrorReportSerializationTest, RoundTrip) {
    ErrorCorrelator correlator;
    const auto record = ExceptionRecord::FromException(CommandExecutionError("Account closed"));
    const auto report = correlator.Correlate(record, ValidTrace(), CommandMessage());

    auto parsed = DeserializeErrorReport(SerializeErrorReport(report));
    ASSERT_TRUE(parsed.ok()) << parsed.status().message();
    EXPECT_EQ(parsed->type_name, report.type_name);
    EXPECT_EQ(parsed->message, report.message);
    EXPECT_EQ(parsed->fingerprint, report.fingerprint);
    EXPECT_EQ(parsed->tags, report.tags);
    EXPECT_EQ(parsed->extras, report.extras);
}

TEST(ErrorReportSerializationTest, NullMessage) {
    ErrorReport report;
    report.type_name = "NullPointer";
    report.fingerprint = {"NullPointer"};

    const std::string json = SerializeErrorReport(report);
    EXPECT_NE(json.find("\"message\":null"), std::string::npos);

    auto parsed = DeserializeErrorReport(json);
    ASSERT_TRUE(parsed.ok());
    EXPECT_FALSE(parsed->message.has_value());
}

TEST(ErrorReportSerializationTest, InvalidUtf8MessageIsReplaced) {
    ErrorCorrelator correlator;
    const auto record =
        ExceptionRecord::FromException(std::runtime_error("bad byte \xff in payload"));
    const auto report = correlator.Correlate(record, ValidTrace());

    std::string json;
    EXPECT_NO_THROW(json = SerializeErrorReport(report));

    auto parsed = DeserializeErrorReport(json);
    ASSERT_TRUE(parsed.ok()) << parsed.status().message();
    ASSERT_TRUE(parsed->message.has_value());
    EXPECT_EQ(*parsed->message, "bad byte \xEF\xBF\xBD in payload");
}

TEST(ErrorReportSerializationTest, MalformedJson) {
    EXPECT_EQ(DeserializeErrorReport("{not json").status().code(),
              absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(DeserializeErrorReport("{\"message\": \"no type\"}").status().code(),
              absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace axonsentry::fingerprint
