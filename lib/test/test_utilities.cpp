#include "Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <set>

namespace cl {
namespace utl {

// SHA-256 tests
TEST(Sha256Test, EmptyStringProducesKnownHash) {
  std::string hash = sha256("");
  // SHA-256 of empty string
  EXPECT_EQ(hash, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  std::string hash = sha256("hello world");
  EXPECT_EQ(hash, "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, DifferentInputsProduceDifferentHashes) {
  EXPECT_NE(sha256("test1"), sha256("test2"));
}

TEST(Sha256Test, OutputPassesDigestCheck) {
  EXPECT_TRUE(isSha256Hex(sha256("test")));
}

TEST(IsSha256HexTest, RejectsWrongLengthAndCase) {
  std::string valid = sha256("x");
  EXPECT_TRUE(isSha256Hex(valid));
  EXPECT_FALSE(isSha256Hex(valid.substr(1)));
  EXPECT_FALSE(isSha256Hex(valid + "0"));
  EXPECT_FALSE(isSha256Hex(std::string(64, 'A')));
  EXPECT_FALSE(isSha256Hex(std::string(64, 'g')));
  EXPECT_FALSE(isSha256Hex(""));
}

TEST(HexEncodeTest, EncodesBytesLowercase) {
  EXPECT_EQ(hexEncode(std::string("\x00\xab\xff", 3)), "00abff");
  EXPECT_EQ(hexEncode(""), "");
}

TEST(FormatIsoTimestampTest, FormatsUtcWithMilliseconds) {
  EXPECT_EQ(formatIsoTimestamp(1704067200000), "2024-01-01T00:00:00.000Z");
  EXPECT_EQ(formatIsoTimestamp(1704067200123), "2024-01-01T00:00:00.123Z");
  EXPECT_EQ(formatIsoTimestamp(0), "1970-01-01T00:00:00.000Z");
}

TEST(ParseUInt64Test, AcceptsOnlyWholeNumbers) {
  uint64_t value = 0;
  EXPECT_TRUE(parseUInt64("12345", value));
  EXPECT_EQ(value, 12345u);
  EXPECT_FALSE(parseUInt64("12a", value));
  EXPECT_FALSE(parseUInt64("", value));
  EXPECT_FALSE(parseUInt64("-1", value));
}

TEST(JoinTest, JoinsWithDelimiter) {
  EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
  EXPECT_EQ(join({}, ","), "");
  EXPECT_EQ(join({"only"}, ","), "only");
}

TEST(Utf8LengthTest, CountsCodePoints) {
  EXPECT_EQ(utf8Length(""), 0u);
  EXPECT_EQ(utf8Length("streetlight"), 11u);
  // 2-byte, 3-byte and 4-byte sequences
  EXPECT_EQ(utf8Length("\xC3\xA9t\xC3\xA9"), 3u);
  EXPECT_EQ(utf8Length("\xE0\xA4\xB8\xE0\xA4\xA1\xE0\xA4\xBC"), 3u);
  EXPECT_EQ(utf8Length("\xF0\x9F\x9A\xA8!"), 2u);
}

TEST(UuidV4Test, HasVersionAndVariantBits) {
  std::string uuid = uuidV4();
  ASSERT_EQ(uuid.size(), 36u);
  EXPECT_EQ(uuid[8], '-');
  EXPECT_EQ(uuid[13], '-');
  EXPECT_EQ(uuid[18], '-');
  EXPECT_EQ(uuid[23], '-');
  EXPECT_EQ(uuid[14], '4');
  EXPECT_TRUE(uuid[19] == '8' || uuid[19] == '9' || uuid[19] == 'a' || uuid[19] == 'b');
}

TEST(UuidV4Test, ValuesAreDistinct) {
  std::set<std::string> seen;
  for (int i = 0; i < 100; i++) {
    seen.insert(uuidV4());
  }
  EXPECT_EQ(seen.size(), 100u);
}

TEST(RandomInRangeTest, StaysWithinBounds) {
  for (int i = 0; i < 1000; i++) {
    uint32_t value = randomInRange(10000, 99999);
    EXPECT_GE(value, 10000u);
    EXPECT_LE(value, 99999u);
  }
  EXPECT_EQ(randomInRange(7, 7), 7u);
}

class FileUtilitiesTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir = std::filesystem::temp_directory_path() /
              ("civic_utl_" + std::string(::testing::UnitTest::GetInstance()
                                              ->current_test_info()
                                              ->name()));
    std::filesystem::remove_all(testDir);
    std::filesystem::create_directories(testDir);
  }

  void TearDown() override { std::filesystem::remove_all(testDir); }

  std::filesystem::path testDir;
};

TEST_F(FileUtilitiesTest, WriteFileAtomicCreatesParentsAndReplaces) {
  std::string path = (testDir / "nested" / "data.txt").string();

  auto first = writeFileAtomic(path, "first");
  ASSERT_TRUE(first.isOk()) << first.error().message;
  auto second = writeFileAtomic(path, "second");
  ASSERT_TRUE(second.isOk()) << second.error().message;

  auto content = readFile(path);
  ASSERT_TRUE(content.isOk());
  EXPECT_EQ(content.value(), "second");
  EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_F(FileUtilitiesTest, ReadFileFailsForMissingFile) {
  auto content = readFile((testDir / "missing.txt").string());
  EXPECT_TRUE(content.isError());
}

TEST_F(FileUtilitiesTest, LoadJsonFileParsesDocument) {
  std::string path = (testDir / "doc.json").string();
  ASSERT_TRUE(writeFileAtomic(path, R"({"difficulty": 3})").isOk());

  auto document = loadJsonFile(path);
  ASSERT_TRUE(document.isOk()) << document.error().message;
  EXPECT_EQ(document.value()["difficulty"].get<int>(), 3);
}

TEST_F(FileUtilitiesTest, LoadJsonFileReportsMissingAndInvalid) {
  auto missing = loadJsonFile((testDir / "missing.json").string());
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, 1);

  std::string path = (testDir / "broken.json").string();
  ASSERT_TRUE(writeFileAtomic(path, "{not json").isOk());
  auto broken = loadJsonFile(path);
  ASSERT_TRUE(broken.isError());
  EXPECT_EQ(broken.error().code, 3);
}

} // namespace utl
} // namespace cl
