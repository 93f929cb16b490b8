#include "Utilities.h"
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace pl {
namespace utl {

// SHA-256 tests
TEST(Sha256Test, EmptyStringProducesKnownHash) {
  EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  EXPECT_EQ(sha256("hello world"),
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, DifferentPayloadsProduceDifferentHashes) {
  EXPECT_NE(sha256("{\"status\":\"paid\"}"), sha256("{\"status\":\"failed\"}"));
}

// HMAC tests (RFC 4231 test case 2)
TEST(HmacSha256Test, MatchesReferenceVector) {
  EXPECT_EQ(hmacSha256Hex("Jefe", "what do ya want for nothing?"),
            "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(HmacSha256Test, KeyChangesDigest) {
  EXPECT_NE(hmacSha256Hex("secret-a", "payload"), hmacSha256Hex("secret-b", "payload"));
}

TEST(ConstantTimeEqualsTest, ComparesContentAndLength) {
  EXPECT_TRUE(constantTimeEquals("abcdef", "abcdef"));
  EXPECT_FALSE(constantTimeEquals("abcdef", "abcdeg"));
  EXPECT_FALSE(constantTimeEquals("abc", "abcd"));
  EXPECT_TRUE(constantTimeEquals("", ""));
}

TEST(RandomHexTest, LengthAndAlphabet) {
  std::string a = randomHex(12);
  std::string b = randomHex(12);
  EXPECT_EQ(a.size(), 24u);
  EXPECT_NE(a, b);
  for (char c : a) {
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
  }
}

TEST(HexTest, EncodeDecode) {
  EXPECT_EQ(hexEncode(std::string("\x01\xab\xff", 3)), "01abff");
  EXPECT_EQ(hexDecode("01ABff"), std::string("\x01\xab\xff", 3));
  EXPECT_EQ(hexDecode("abc"), "");
  EXPECT_EQ(hexDecode("zz"), "");
}

// Time helpers
TEST(Iso8601Test, FormatKnownTimestamp) {
  EXPECT_EQ(formatIso8601(0), "1970-01-01T00:00:00Z");
  EXPECT_EQ(formatIso8601(1714564800), "2024-05-01T12:00:00Z");
  EXPECT_EQ(formatDate(1714564800), "2024-05-01");
}

TEST(Iso8601Test, ParseVariants) {
  int64_t ts = 0;
  ASSERT_TRUE(parseIso8601("2024-05-01T12:00:00Z", ts));
  EXPECT_EQ(ts, 1714564800);
  ASSERT_TRUE(parseIso8601("2024-05-01T12:00:00.250Z", ts));
  EXPECT_EQ(ts, 1714564800);
  ASSERT_TRUE(parseIso8601("2024-05-01 12:00:00", ts));
  EXPECT_EQ(ts, 1714564800);
  ASSERT_TRUE(parseIso8601("2024-05-01", ts));
  EXPECT_EQ(ts, 1714521600);
}

TEST(Iso8601Test, RejectsMalformed) {
  int64_t ts = 7;
  EXPECT_FALSE(parseIso8601("", ts));
  EXPECT_FALSE(parseIso8601("2024-13-01", ts));
  EXPECT_FALSE(parseIso8601("2024-05-01T25:00:00Z", ts));
  EXPECT_FALSE(parseIso8601("2024-05-01T12:00:00+03:00", ts));
  EXPECT_FALSE(parseIso8601("yesterday", ts));
  EXPECT_EQ(ts, 7);
}

TEST(StartOfUtcDayTest, TruncatesToMidnight) {
  EXPECT_EQ(startOfUtcDay(1714564800), 1714521600);
  EXPECT_EQ(startOfUtcDay(1714521600), 1714521600);
  EXPECT_EQ(startOfUtcDay(-1), -86400);
}

// Parsing helpers
TEST(ParseIntTest, RejectsTrailingGarbage) {
  int value = 0;
  EXPECT_TRUE(parseInt("42", value));
  EXPECT_EQ(value, 42);
  EXPECT_FALSE(parseInt("42x", value));
  EXPECT_FALSE(parseInt("", value));

  uint64_t tenant = 0;
  EXPECT_TRUE(parseUInt64("18446744073709551615", tenant));
  EXPECT_FALSE(parseUInt64("-1", tenant));

  int64_t signedValue = 0;
  EXPECT_TRUE(parseInt64("-9000", signedValue));
  EXPECT_EQ(signedValue, -9000);
}

TEST(ParseJsonObjectTest, AcceptsObjectsOnly) {
  auto ok = parseJsonObject("{\"amount\":\"10.00\"}");
  ASSERT_TRUE(ok.isOk());
  EXPECT_EQ((*ok)["amount"], "10.00");

  EXPECT_TRUE(parseJsonObject("[1,2]").isError());
  EXPECT_TRUE(parseJsonObject("{broken").isError());
}

TEST(LoadJsonFileTest, ReadsFileAndReportsMissing) {
  auto path = std::filesystem::temp_directory_path() / "payledger_utilities_test.json";
  {
    std::ofstream out(path);
    out << "{\"port\": 8090}";
  }
  auto loaded = loadJsonFile(path.string());
  ASSERT_TRUE(loaded.isOk()) << loaded.error().message;
  EXPECT_EQ((*loaded)["port"], 8090);
  std::filesystem::remove(path);

  EXPECT_TRUE(loadJsonFile(path.string()).isError());
}

TEST(GetEnvTest, FallsBackWhenUnsetOrEmpty) {
  ::setenv("PAYLEDGER_TEST_ENV", "value", 1);
  EXPECT_EQ(getEnv("PAYLEDGER_TEST_ENV", "default"), "value");
  ::setenv("PAYLEDGER_TEST_ENV", "", 1);
  EXPECT_EQ(getEnv("PAYLEDGER_TEST_ENV", "default"), "default");
  ::unsetenv("PAYLEDGER_TEST_ENV");
  EXPECT_EQ(getEnv("PAYLEDGER_TEST_ENV", "default"), "default");
}

TEST(ToLowerTest, AsciiOnly) { EXPECT_EQ(toLower("PAID Ok"), "paid ok"); }

} // namespace utl
} // namespace pl
