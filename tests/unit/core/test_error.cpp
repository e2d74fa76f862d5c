//
// Created by gregorian on 19/10/2026.
//

#include <gtest/gtest.h>
#include "insight/core/error.h"
#include "insight/core/result.h"
#include <stdexcept>
#include <string>

using namespace insight::core;

TEST(ErrorTest, MakeErrorUsesDefaultSeverity) {
    const auto error = make_error(ErrorCode::INVALID_ARGUMENT, "bad value");

    EXPECT_EQ(error.code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(error.message, "bad value");
    EXPECT_EQ(error.severity, ErrorSeverity::ERROR);
    EXPECT_TRUE(error.is_recoverable());
    EXPECT_FALSE(error.is_fatal());
}

TEST(ErrorTest, StateCorruptIsOnlyAWarning) {
    EXPECT_EQ(error_code_to_severity(ErrorCode::STATE_CORRUPT), ErrorSeverity::WARNING);
    EXPECT_EQ(error_code_to_severity(ErrorCode::PATTERN_NOT_FOUND), ErrorSeverity::WARNING);
    EXPECT_EQ(error_code_to_severity(ErrorCode::INTERNAL_ERROR), ErrorSeverity::FATAL);
}

TEST(ErrorTest, CapturesSourceLocation) {
    const auto error = make_error(ErrorCode::GRAPH_ERROR, "broken");

    EXPECT_NE(std::string(error.file).find("test_error.cpp"), std::string::npos);
    EXPECT_GT(error.line, 0u);
}

TEST(ErrorTest, ToStringIncludesSuggestions) {
    const auto error = make_error_with_suggestions(ErrorCode::INVALID_CONFIG, "bad layer",
                                                   {"declare the layer first"});
    const auto text = error.to_string();

    EXPECT_NE(text.find("[ERROR]"), std::string::npos);
    EXPECT_NE(text.find("Invalid configuration: bad layer"), std::string::npos);
    EXPECT_NE(text.find("declare the layer first"), std::string::npos);
}

TEST(ErrorTest, EveryCodeHasDisplayName) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::STATE_CORRUPT), "Learning state corrupt");
    EXPECT_STREQ(error_code_to_string(ErrorCode::NODE_NOT_FOUND), "Node not found");
    EXPECT_STREQ(error_code_to_string(ErrorCode::JSON_PARSE_ERROR), "JSON parse error");
}

TEST(ResultTest, SuccessHoldsValue) {
    const auto result = Result<int>::success(42);

    ASSERT_TRUE(result.is_success());
    EXPECT_FALSE(result.is_failure());
    EXPECT_EQ(result.value(), 42);
    EXPECT_THROW((void)result.error(), std::logic_error);
}

TEST(ResultTest, FailureHoldsError) {
    const auto result = Result<int>::failure(ErrorCode::FILE_NOT_FOUND, "missing");

    ASSERT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(result.value_or(7), 7);
    EXPECT_THROW((void)result.value(), std::logic_error);
}

TEST(ResultTest, MapAndThenPropagateFailure) {
    const auto doubled = Result<int>::success(21).map([](const int v) { return v * 2; });
    ASSERT_TRUE(doubled.is_success());
    EXPECT_EQ(doubled.value(), 42);

    const auto failed = Result<int>::failure(ErrorCode::PARSE_ERROR, "nope")
        .and_then([](const int v) { return Result<std::string>::success(std::to_string(v)); });
    ASSERT_TRUE(failed.is_failure());
    EXPECT_EQ(failed.error().code, ErrorCode::PARSE_ERROR);
}

TEST(ResultTest, VoidResult) {
    EXPECT_TRUE(Ok().is_success());

    const auto failed = Result<void>::failure(ErrorCode::FILE_WRITE_ERROR, "disk full");
    ASSERT_TRUE(failed.is_failure());
    EXPECT_EQ(failed.error().message, "disk full");

    const auto err = Err<double>(ErrorCode::INVALID_ARGUMENT, "bad");
    EXPECT_TRUE(err.is_failure());
}
