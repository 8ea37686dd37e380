#include "Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>

namespace hv {
namespace utl {

TEST(Sha256Test, EmptyStringProducesKnownHash) {
  EXPECT_EQ(sha256(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  EXPECT_EQ(sha256("hello world"),
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, OutputIsLowercaseHex64) {
  EXPECT_TRUE(isLowerHex(sha256("test"), 64));
}

TEST(VoterHashTest, IsSha256OfIdentifier) {
  EXPECT_EQ(deriveVoterHash("alice"), sha256("alice"));
  EXPECT_NE(deriveVoterHash("alice"), deriveVoterHash("bob"));
}

TEST(TimestampTest, FormatsSixFractionalDigits) {
  EXPECT_EQ(formatIsoMicros(0), "1970-01-01T00:00:00.000000");
  EXPECT_EQ(formatIsoMicros(1700000000123456), "2023-11-14T22:13:20.123456");
  EXPECT_EQ(formatIsoMicros(1700000000000007), "2023-11-14T22:13:20.000007");
}

TEST(TimestampTest, FormatsInstantsBeforeEpoch) {
  EXPECT_EQ(formatIsoMicros(-1), "1969-12-31T23:59:59.999999");
}

TEST(TimestampTest, ParseInvertsFormat) {
  auto parsed = parseIsoMicros("2023-11-14T22:13:20.123456");
  ASSERT_TRUE(parsed.isOk());
  EXPECT_EQ(parsed.value(), 1700000000123456);

  auto shortFraction = parseIsoMicros("2023-11-14T22:13:20.5Z");
  ASSERT_TRUE(shortFraction.isOk());
  EXPECT_EQ(shortFraction.value(), 1700000000500000);

  auto noFraction = parseIsoMicros("1970-01-01T00:00:00");
  ASSERT_TRUE(noFraction.isOk());
  EXPECT_EQ(noFraction.value(), 0);
}

TEST(TimestampTest, ParseRejectsMalformedInput) {
  EXPECT_TRUE(parseIsoMicros("").isError());
  EXPECT_TRUE(parseIsoMicros("2023-11-14").isError());
  EXPECT_TRUE(parseIsoMicros("2023-13-14T22:13:20").isError());
  EXPECT_TRUE(parseIsoMicros("2023-11-14T22:13:20.").isError());
  EXPECT_TRUE(parseIsoMicros("2023-11-14T22:13:20.1234567").isError());
  EXPECT_TRUE(parseIsoMicros("2023-11-14T22:13:20+01:00").isError());
}

TEST(TimestampTest, FormatsDate) {
  EXPECT_EQ(formatDateUtc(1700000000123456), "2023-11-14");
}

TEST(HexTest, EncodeDecode) {
  EXPECT_EQ(hexEncode(std::string("\x00\xff\x10", 3)), "00ff10");
  EXPECT_EQ(hexDecode("00FF10"), std::string("\x00\xff\x10", 3));
  EXPECT_TRUE(hexDecode("0").empty());
  EXPECT_TRUE(hexDecode("zz").empty());
}

TEST(HexTest, IsLowerHexChecksLengthAndAlphabet) {
  EXPECT_TRUE(isLowerHex("0a1b", 4));
  EXPECT_FALSE(isLowerHex("0A1B", 4));
  EXPECT_FALSE(isLowerHex("0a1", 4));
  EXPECT_FALSE(isLowerHex("0a1g", 4));
}

TEST(StringTest, StartsWith) {
  EXPECT_TRUE(startsWith("test_poll", "test_"));
  EXPECT_FALSE(startsWith("tes", "test_"));
}

TEST(FileTest, WriteToNewFileAndLoadJson) {
  std::string dir = "/tmp/hashvote-utilities-test";
  std::filesystem::remove_all(dir);
  std::string path = dir + "/nested/config.json";

  ASSERT_TRUE(writeToNewFile(path, "{\"a\": 1}").isOk());
  EXPECT_TRUE(writeToNewFile(path, "{}").isError());

  auto json = loadJsonFile(path);
  ASSERT_TRUE(json.isOk());
  EXPECT_EQ(json.value()["a"].get<int>(), 1);

  EXPECT_TRUE(loadJsonFile(dir + "/missing.json").isError());
  std::filesystem::remove_all(dir);
}

} // namespace utl
} // namespace hv
