/***
 * Name: pyp::tests::ParseInt
 * Purpose: Validate strict integer parsing used for --seed.
 * Inputs: none
 * Outputs: Pass/fail test results.
 */
#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "pyp/support/parse.h"

using namespace pyp::support;

TEST(ParseInt, AcceptsSignedValuesAndSurroundingSpace) {
  long long value = 0;
  EXPECT_TRUE(ParseIntLiteralStrict("42", value));
  EXPECT_EQ(42, value);
  EXPECT_TRUE(ParseIntLiteralStrict("  -7 ", value));
  EXPECT_EQ(-7, value);
  EXPECT_TRUE(ParseIntLiteralStrict("+0", value));
  EXPECT_EQ(0, value);
}

TEST(ParseInt, FullSixtyFourBitRange) {
  long long value = 0;
  EXPECT_TRUE(ParseIntLiteralStrict("9223372036854775807", value));
  EXPECT_EQ(std::numeric_limits<long long>::max(), value);
  EXPECT_TRUE(ParseIntLiteralStrict("-9223372036854775808", value));
  EXPECT_EQ(std::numeric_limits<long long>::min(), value);
}

TEST(ParseInt, RejectsMalformedInput) {
  long long value = 5;
  std::string err;
  EXPECT_FALSE(ParseIntLiteralStrict("", value, &err));
  EXPECT_FALSE(ParseIntLiteralStrict("-", value, &err));
  EXPECT_FALSE(ParseIntLiteralStrict("12a", value, &err));
  EXPECT_EQ("invalid character in integer literal", err);
  EXPECT_FALSE(ParseIntLiteralStrict("1 2", value, &err));
  EXPECT_FALSE(ParseIntLiteralStrict("9223372036854775808", value, &err));
  EXPECT_EQ("integer out of range", err);
  EXPECT_EQ(5, value);
}
