#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "tokenkeeper/core/result.h"

namespace tokenkeeper {
namespace {

TEST(ResultTest, SuccessHoldsValue) {
  auto result = makeSuccess(std::string("token"));
  EXPECT_TRUE(isSuccess(result));
  EXPECT_FALSE(isError(result));
  EXPECT_EQ(getValue(result), "token");
}

TEST(ResultTest, ErrorHoldsCodeAndMessage) {
  auto result = makeError<int>(ErrorCode::PROVIDER_UNAVAILABLE, "down");
  EXPECT_TRUE(isError(result));
  EXPECT_EQ(getError(result).code, ErrorCode::PROVIDER_UNAVAILABLE);
  EXPECT_EQ(getError(result).message, "down");
}

TEST(ResultTest, MoveOnlyValue) {
  auto result = makeSuccess(std::unique_ptr<int>(new int(7)));
  ASSERT_TRUE(isSuccess(result));
  std::unique_ptr<int> owned = std::move(getValue(result));
  EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, VoidResult) {
  EXPECT_TRUE(isSuccess(makeVoidSuccess()));

  auto failed = makeVoidError(Error(ErrorCode::CONFIG_INVALID, "bad"));
  ASSERT_TRUE(isError(failed));
  EXPECT_EQ(getError(failed), Error(ErrorCode::CONFIG_INVALID, "bad"));
}

TEST(ErrorTest, ToString) {
  EXPECT_EQ(Error(ErrorCode::JWT_EXPIRED, "exp passed").toString(),
            "JWT_EXPIRED: exp passed");
  EXPECT_EQ(Error(ErrorCode::TOKEN_EXPIRED, "").toString(), "TOKEN_EXPIRED");
}

// Unavailable and invalid must stay distinguishable for callers choosing
// their own fail-open or fail-closed policy
TEST(ErrorTest, FamiliesAreDistinct) {
  EXPECT_NE(ErrorCode::INTROSPECTION_UNAVAILABLE,
            ErrorCode::INTROSPECTION_INVALID);
  EXPECT_STREQ(errorCodeName(ErrorCode::INTROSPECTION_UNAVAILABLE),
               "INTROSPECTION_UNAVAILABLE");
  EXPECT_STREQ(errorCodeName(ErrorCode::INTROSPECTION_INVALID),
               "INTROSPECTION_INVALID");
  EXPECT_STREQ(errorCodeName(ErrorCode::CREDENTIALS_MALFORMED),
               "CREDENTIALS_MALFORMED");
  EXPECT_STREQ(errorCodeName(static_cast<ErrorCode>(-42)), "UNKNOWN");
}

}  // namespace
}  // namespace tokenkeeper
