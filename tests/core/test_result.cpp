#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "fund_ngin/core/error.hpp"

using namespace fund_ngin;

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, SuccessfulResults) {
    Result<int> int_result(42);
    EXPECT_TRUE(int_result.is_ok());
    EXPECT_FALSE(int_result.is_error());
    EXPECT_EQ(int_result.value(), 42);

    Result<std::string> string_result("success");
    EXPECT_TRUE(string_result.is_ok());
    EXPECT_EQ(string_result.value(), "success");

    Result<std::vector<double>> vector_result(std::vector<double>{1.0, 2.0});
    ASSERT_TRUE(vector_result.is_ok());
    EXPECT_EQ(vector_result.value().size(), 2u);
}

TEST_F(ResultTest, ErrorCase) {
    auto error_result =
        make_error<int>(ErrorCode::INSUFFICIENT_POSITION, "Sell exceeds holding", "PositionLedger");

    EXPECT_TRUE(error_result.is_error());
    EXPECT_FALSE(error_result.is_ok());
    EXPECT_EQ(error_result.error()->code(), ErrorCode::INSUFFICIENT_POSITION);
    EXPECT_STREQ(error_result.error()->what(), "Sell exceeds holding");
    EXPECT_EQ(error_result.error()->component(), "PositionLedger");
}

TEST_F(ResultTest, ValueOfErrorThrows) {
    auto error_result = make_error<double>(ErrorCode::DATA_NOT_FOUND, "No price", "Cache");
    EXPECT_THROW(error_result.value(), FundError);

    auto void_error = make_error<void>(ErrorCode::INVALID_STATE, "Already paid", "FeeEngine");
    EXPECT_THROW(void_error.value(), FundError);
}

TEST_F(ResultTest, ForwardErrorKeepsCodeMessageAndComponent) {
    auto original = make_error<std::string>(ErrorCode::STALE_VERSION, "Expected version 3",
                                            "PortfolioAggregator");
    auto forwarded = forward_error<int>(original);

    ASSERT_TRUE(forwarded.is_error());
    EXPECT_EQ(forwarded.error()->code(), ErrorCode::STALE_VERSION);
    EXPECT_STREQ(forwarded.error()->what(), "Expected version 3");
    EXPECT_EQ(forwarded.error()->component(), "PortfolioAggregator");
}

TEST_F(ResultTest, ErrorToStringNamesComponent) {
    FundError error(ErrorCode::PRECONDITION_FAILED, "NAV unavailable", "FeeEngine");
    const std::string text = error.to_string();
    EXPECT_NE(text.find("FeeEngine"), std::string::npos);
    EXPECT_NE(text.find("NAV unavailable"), std::string::npos);
}

TEST_F(ResultTest, MoveOnlyType) {
    auto ptr = std::make_unique<int>(42);
    Result<std::unique_ptr<int>> result(std::move(ptr));

    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(*result.value(), 42);
}

TEST_F(ResultTest, MoveSemantics) {
    Result<std::string> str_result(std::string("test"));
    Result<std::string> moved_str = std::move(str_result);

    EXPECT_TRUE(moved_str.is_ok());
    EXPECT_EQ(moved_str.value(), "test");

    auto failed = make_error<std::string>(ErrorCode::TIMEOUT_ERROR, "timed out");
    Result<std::string> moved_error = std::move(failed);
    ASSERT_TRUE(moved_error.is_error());
    EXPECT_EQ(moved_error.error()->code(), ErrorCode::TIMEOUT_ERROR);
}

TEST_F(ResultTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.is_ok());
    EXPECT_FALSE(success.is_error());

    auto error = make_error<void>(ErrorCode::INVALID_ARGUMENT, "Void error", "Test");
    EXPECT_TRUE(error.is_error());
    EXPECT_FALSE(error.is_ok());
}
