#include "tg/exceptions.hpp"

#include <gtest/gtest.h>

namespace tg {
namespace {

// Test exception hierarchy
TEST(ExceptionsTest, RateLimitIsOperationException) {
    RateLimitException e(std::chrono::seconds{7});
    const OperationException& base = e;

    EXPECT_EQ(e.retry_after(), std::chrono::seconds{7});
    EXPECT_STREQ(base.what(), "Rate limit exceeded, retry after 7 seconds");
}

TEST(ExceptionsTest, RateLimitWithoutDelay) {
    RateLimitException e;
    EXPECT_EQ(e.retry_after(), std::chrono::seconds{0});
    EXPECT_EQ(e.message(), "Rate limit exceeded");
}

TEST(ExceptionsTest, InvalidTokenIsAuthentication) {
    InvalidTokenException e("revoked");
    const AuthenticationException* base = &e;
    EXPECT_NE(base, nullptr);
    EXPECT_EQ(e.message(), "Bot token is invalid: revoked");
}

TEST(ExceptionsTest, TdLibKeepsCode) {
    TdLibException e(500, "Internal");
    EXPECT_EQ(e.code(), 500);
    EXPECT_EQ(e.message(), "TDLib error [500]: Internal");
}

TEST(ExceptionsTest, ChatNotFoundMessages) {
    EXPECT_EQ(ChatNotFoundException(int64_t{-100}).message(), "Chat not found: -100");
    EXPECT_EQ(ChatNotFoundException(std::string("@ghost")).message(), "Chat not found: @ghost");
}

// Test retry-after parsing
TEST(ExceptionsTest, ParseRetryAfterBotApiText) {
    EXPECT_EQ(parse_retry_after("Too Many Requests: retry after 35"), std::chrono::seconds{35});
}

TEST(ExceptionsTest, ParseRetryAfterFloodWait) {
    EXPECT_EQ(parse_retry_after("FLOOD_WAIT_12"), std::chrono::seconds{12});
}

TEST(ExceptionsTest, ParseRetryAfterIgnoresCase) {
    EXPECT_EQ(parse_retry_after("Retry After 3"), std::chrono::seconds{3});
}

TEST(ExceptionsTest, ParseRetryAfterMissing) {
    EXPECT_FALSE(parse_retry_after("Bad Request: chat not found").has_value());
    EXPECT_FALSE(parse_retry_after("").has_value());
}

TEST(ExceptionsTest, ParseRetryAfterOverflow) {
    EXPECT_FALSE(parse_retry_after("retry after 99999999999999999999999").has_value());
}

}  // namespace
}  // namespace tg
