#include "Money.h"
#include <gtest/gtest.h>

namespace pl {
namespace money {

TEST(MoneyParseTest, WholeAndFractionalValues) {
  Amount amount = 0;
  ASSERT_TRUE(parse("100", amount));
  EXPECT_EQ(amount, 10000);
  ASSERT_TRUE(parse("12.5", amount));
  EXPECT_EQ(amount, 1250);
  ASSERT_TRUE(parse("0.01", amount));
  EXPECT_EQ(amount, 1);
  ASSERT_TRUE(parse(".75", amount));
  EXPECT_EQ(amount, 75);
}

TEST(MoneyParseTest, SignsAndWhitespace) {
  Amount amount = 0;
  ASSERT_TRUE(parse("-12.34", amount));
  EXPECT_EQ(amount, -1234);
  ASSERT_TRUE(parse("+5", amount));
  EXPECT_EQ(amount, 500);
  ASSERT_TRUE(parse("  7.10 ", amount));
  EXPECT_EQ(amount, 710);
}

TEST(MoneyParseTest, RejectsMalformedInput) {
  Amount amount = 42;
  EXPECT_FALSE(parse("", amount));
  EXPECT_FALSE(parse("-", amount));
  EXPECT_FALSE(parse("1.234", amount));
  EXPECT_FALSE(parse("1.", amount));
  EXPECT_FALSE(parse("abc", amount));
  EXPECT_FALSE(parse("10 0", amount));
  EXPECT_FALSE(parse("1,50", amount));
  EXPECT_EQ(amount, 42);
}

TEST(MoneyParseTest, RejectsOversizedValues) {
  Amount amount = 0;
  EXPECT_FALSE(parse("99999999999999999", amount));
  EXPECT_TRUE(parse("10000000000000.00", amount));
  EXPECT_EQ(amount, MAX_AMOUNT);
  EXPECT_FALSE(parse("10000000000000.01", amount));
}

TEST(MoneyFormatTest, AlwaysTwoDecimals) {
  EXPECT_EQ(format(0), "0.00");
  EXPECT_EQ(format(5), "0.05");
  EXPECT_EQ(format(1250), "12.50");
  EXPECT_EQ(format(-1234), "-12.34");
  EXPECT_EQ(format(-7), "-0.07");
}

TEST(MoneyFormatTest, HandlesInt64Minimum) {
  EXPECT_EQ(format(INT64_MIN), "-92233720368547758.08");
}

TEST(MoneyFromJsonTest, AcceptsStringsIntegersAndExactFloats) {
  Amount amount = 0;
  ASSERT_TRUE(fromJson(nlohmann::json("19.90"), amount));
  EXPECT_EQ(amount, 1990);
  ASSERT_TRUE(fromJson(nlohmann::json(3), amount));
  EXPECT_EQ(amount, 300);
  ASSERT_TRUE(fromJson(nlohmann::json(0.1), amount));
  EXPECT_EQ(amount, 10);
  ASSERT_TRUE(fromJson(nlohmann::json(150.75), amount));
  EXPECT_EQ(amount, 15075);
}

TEST(MoneyFromJsonTest, RejectsSubCentFloatsAndOtherTypes) {
  Amount amount = 0;
  EXPECT_FALSE(fromJson(nlohmann::json(0.005), amount));
  EXPECT_FALSE(fromJson(nlohmann::json(true), amount));
  EXPECT_FALSE(fromJson(nlohmann::json(nullptr), amount));
  EXPECT_FALSE(fromJson(nlohmann::json::array(), amount));
}

} // namespace money
} // namespace pl
