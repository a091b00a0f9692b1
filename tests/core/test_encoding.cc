#include <string>

#include <gtest/gtest.h>

#include "tokenkeeper/core/encoding.h"

namespace tokenkeeper {
namespace {

TEST(EncodingTest, Base64KnownVectors) {
  EXPECT_EQ(base64Encode(""), "");
  EXPECT_EQ(base64Encode("f"), "Zg==");
  EXPECT_EQ(base64Encode("fo"), "Zm8=");
  EXPECT_EQ(base64Encode("foo"), "Zm9v");
  EXPECT_EQ(base64Encode("foobar"), "Zm9vYmFy");
  EXPECT_EQ(base64Encode("my-client:client-secret"),
            "bXktY2xpZW50OmNsaWVudC1zZWNyZXQ=");
}

TEST(EncodingTest, Base64UrlUsesSafeAlphabetWithoutPadding) {
  const std::string bytes("\xfb\xff\xbf", 3);
  EXPECT_EQ(base64Encode(bytes), "+/+/");
  EXPECT_EQ(base64UrlEncode(bytes), "-_-_");
  EXPECT_EQ(base64UrlEncode("f"), "Zg");
}

TEST(EncodingTest, Base64UrlDecode) {
  EXPECT_EQ(base64UrlDecode("Zm9vYmFy").value_or("?"), "foobar");
  EXPECT_EQ(base64UrlDecode("Zg").value_or("?"), "f");
  EXPECT_EQ(base64UrlDecode("Zg==").value_or("?"), "f");
  EXPECT_EQ(base64UrlDecode("-_-_").value_or("?"), std::string("\xfb\xff\xbf", 3));
  EXPECT_EQ(base64UrlDecode("").value_or("?"), "");
}

TEST(EncodingTest, Base64UrlDecodeRejectsInvalidInput) {
  EXPECT_FALSE(base64UrlDecode("Z").has_value());
  EXPECT_FALSE(base64UrlDecode("Zm9v!").has_value());
  EXPECT_FALSE(base64UrlDecode("Zm 9v").has_value());
}

}  // namespace
}  // namespace tokenkeeper
