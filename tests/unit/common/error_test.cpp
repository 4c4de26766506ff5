/// @file error_test.cpp
/// @brief Tests for axonsentry error codes and status helpers

#include <gtest/gtest.h>

#include "common/error.h"

namespace axonsentry {
namespace {

absl::StatusOr<int> ParseRate(int value) {
    if (value <= 0) {
        return MakeError(ErrorCode::kInvalidRate, "rate must be positive");
    }
    return value;
}

absl::StatusOr<int> DoubleRate(int value) {
    AXONSENTRY_ASSIGN_OR_RETURN(int parsed, ParseRate(value));
    return parsed * 2;
}

absl::Status CheckRate(int value) {
    AXONSENTRY_RETURN_IF_ERROR(ParseRate(value).status());
    return absl::OkStatus();
}

TEST(ErrorTest, ToAbslCode) {
    EXPECT_EQ(ToAbslCode(ErrorCode::kOk), absl::StatusCode::kOk);
    EXPECT_EQ(ToAbslCode(ErrorCode::kInvalidProbability), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kEmptyComposite), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kConfigParseError), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(ToAbslCode(ErrorCode::kConfigNotFound), absl::StatusCode::kNotFound);
    EXPECT_EQ(ToAbslCode(ErrorCode::kUnknown), absl::StatusCode::kUnknown);
}

TEST(ErrorTest, MakeErrorCarriesCode) {
    absl::Status status = MakeError(ErrorCode::kInvalidBurstCapacity, "burst too small");
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(status.message(), "burst too small");
    EXPECT_EQ(GetErrorCode(status), ErrorCode::kInvalidBurstCapacity);
}

TEST(ErrorTest, GetErrorCodeForForeignStatus) {
    EXPECT_EQ(GetErrorCode(absl::OkStatus()), ErrorCode::kOk);
    EXPECT_EQ(GetErrorCode(absl::InvalidArgumentError("plain")), ErrorCode::kUnknown);
}

TEST(ErrorTest, MakeErrorWithOkCodeIsOk) {
    EXPECT_TRUE(MakeError(ErrorCode::kOk, "").ok());
}

TEST(ErrorTest, ErrorCodeToString) {
    EXPECT_EQ(ErrorCodeToString(ErrorCode::kInvalidCombineStrategy), "INVALID_COMBINE_STRATEGY");
    EXPECT_EQ(ErrorCodeToString(ErrorCode::kMalformedReport), "MALFORMED_REPORT");
}

TEST(ErrorTest, AssignOrReturn) {
    auto ok = DoubleRate(4);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ(*ok, 8);

    auto failed = DoubleRate(-1);
    EXPECT_EQ(GetErrorCode(failed.status()), ErrorCode::kInvalidRate);
}

TEST(ErrorTest, ReturnIfError) {
    EXPECT_TRUE(CheckRate(1).ok());
    EXPECT_EQ(CheckRate(0).message(), "rate must be positive");
}

}  // namespace
}  // namespace axonsentry
