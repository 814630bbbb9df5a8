#include <gtest/gtest.h>
#include "infrastructure/error_handling.h"

using namespace paycore;

class ErrorHandlerTest : public ::testing::Test {
protected:
    void SetUp() override { ErrorHandler::instance().clear(); }
    void TearDown() override { ErrorHandler::instance().clear(); }
};

TEST(ErrorCodeTest, NamesAreStable) {
    EXPECT_STREQ(errorCodeName(ErrorCode::INSUFFICIENT_FUNDS), "INSUFFICIENT_FUNDS");
    EXPECT_EQ(errorCodeFromName("SELF_TRANSFER_NOT_ALLOWED"), ErrorCode::SELF_TRANSFER_NOT_ALLOWED);
    EXPECT_EQ(errorCodeFromName("OK"), ErrorCode::OK);
    EXPECT_EQ(errorCodeFromName("insufficient_funds"), ErrorCode::UNKNOWN);
    EXPECT_STREQ(errorCodeName(ErrorCode::UNKNOWN), "UNKNOWN");
}

TEST(ErrorCodeTest, OnlyTransientFailuresAreRetryable) {
    EXPECT_TRUE(isRetryable(ErrorCode::CONCURRENCY_CONFLICT));
    EXPECT_TRUE(isRetryable(ErrorCode::DATABASE_ERROR));
    EXPECT_FALSE(isRetryable(ErrorCode::INSUFFICIENT_FUNDS));
    EXPECT_FALSE(isRetryable(ErrorCode::INVALID_AMOUNT));
    EXPECT_FALSE(isRetryable(ErrorCode::OK));
    EXPECT_EQ(classifyError(ErrorCode::MISSING_IDEMPOTENCY_KEY), ErrorClass::VALIDATION);
    EXPECT_EQ(classifyError(ErrorCode::INSUFFICIENT_FUNDS), ErrorClass::BUSINESS);
    EXPECT_EQ(classifyError(ErrorCode::INTERNAL_ERROR), ErrorClass::INTERNAL);
}

TEST(ResultTest, CarriesValueOrError) {
    Result<int> good(42);
    ASSERT_TRUE(good.ok());
    EXPECT_EQ(good.value(), 42);

    Result<int> bad(makeError(ErrorCode::NOT_FOUND, "no wallet", "wallet_1"));
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().code, ErrorCode::NOT_FOUND);
    EXPECT_EQ(bad.error().context, "wallet_1");
    EXPECT_GT(bad.error().timestamp, 0u);

    Result<void> done;
    EXPECT_TRUE(done.ok());
}

TEST_F(ErrorHandlerTest, CountsAndKeepsRecentFirst) {
    auto& handler = ErrorHandler::instance();
    handler.handle(makeError(ErrorCode::DATABASE_ERROR, "disk I/O error"));
    handler.handle(makeError(ErrorCode::INTERNAL_ERROR, "unbalanced posting"));
    handler.handle(makeError(ErrorCode::DATABASE_ERROR, "database is locked"));

    EXPECT_EQ(handler.count(), 3u);
    EXPECT_EQ(handler.count(ErrorCode::DATABASE_ERROR), 2u);
    EXPECT_EQ(handler.count(ErrorCode::NOT_FOUND), 0u);

    auto recent = handler.recent(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].message, "database is locked");
    EXPECT_EQ(recent[1].code, ErrorCode::INTERNAL_ERROR);
}

TEST_F(ErrorHandlerTest, RecentIsBounded) {
    for (int i = 0; i < 150; ++i) {
        ErrorHandler::instance().handle(Error(ErrorCode::DATABASE_ERROR, "e" + std::to_string(i)));
    }
    EXPECT_EQ(ErrorHandler::instance().count(), 150u);
    auto recent = ErrorHandler::instance().recent(1000);
    EXPECT_EQ(recent.size(), 100u);
    EXPECT_EQ(recent.front().message, "e149");
}
