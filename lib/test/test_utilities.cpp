#include "Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace icpt {
namespace utl {

// SHA-256 tests
TEST(Sha256Test, EmptyStringProducesKnownHash) {
  EXPECT_EQ(sha256(""),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, HelloWorldProducesKnownHash) {
  EXPECT_EQ(sha256("hello world"),
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(Sha256Test, DifferentInputsProduceDifferentHashes) {
  EXPECT_NE(sha256("test1"), sha256("test2"));
}

// Hex tests
TEST(HexTest, EncodeProducesLowercasePairs) {
  EXPECT_EQ(hexEncode(std::string("\x00\x01\xab\xff", 4)), "0001abff");
  EXPECT_EQ(hexEncode(""), "");
}

TEST(HexTest, DecodeAcceptsBothCases) {
  EXPECT_EQ(hexDecode("0001ABff"), std::string("\x00\x01\xab\xff", 4));
}

TEST(HexTest, DecodeRejectsInvalidInput) {
  EXPECT_EQ(hexDecode("abc"), "");
  EXPECT_EQ(hexDecode("zz"), "");
}

TEST(JsonSafeStringTest, PrintableTextIsUnchanged) {
  EXPECT_EQ(toJsonSafeString("alice"), "alice");
  EXPECT_EQ(fromJsonSafeString("alice"), "alice");
}

TEST(JsonSafeStringTest, BinaryIsHexEncoded) {
  std::string binary("\x01\x02\xfe", 3);
  std::string safe = toJsonSafeString(binary);
  EXPECT_EQ(safe, "0x0102fe");
  EXPECT_EQ(fromJsonSafeString(safe), binary);
}

TEST(JsonSafeStringTest, TextStartingWith0xIsEncoded) {
  std::string text = "0xabc";
  std::string safe = toJsonSafeString(text);
  EXPECT_NE(safe, text);
  EXPECT_EQ(fromJsonSafeString(safe), text);
}

// Time
TEST(TimeTest, CurrentTimeNanosIsEpochBased) {
  uint64_t first = getCurrentTimeNanos();
  EXPECT_GT(first, 1577836800ULL * 1000000000ULL); // 2020-01-01
  EXPECT_GE(getCurrentTimeNanos() + 1000000000ULL, first);
}

// JSON helpers
TEST(ParseJsonRequestTest, AcceptsTypedObject) {
  auto result = parseJsonRequest(R"({"type":"get_token_info"})");
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ((*result)["type"], "get_token_info");
}

TEST(ParseJsonRequestTest, RejectsBadRequests) {
  EXPECT_TRUE(parseJsonRequest("not json").isError());
  EXPECT_TRUE(parseJsonRequest("[1,2]").isError());
  EXPECT_TRUE(parseJsonRequest(R"({"caller":"a"})").isError());
  EXPECT_TRUE(parseJsonRequest(R"({"type":5})").isError());
}

class FileUtilitiesTest : public ::testing::Test {
protected:
  std::filesystem::path testDir;

  void SetUp() override {
    testDir = std::filesystem::temp_directory_path() / "icpt-utilities-test";
    std::filesystem::remove_all(testDir);
    std::filesystem::create_directories(testDir);
  }

  void TearDown() override { std::filesystem::remove_all(testDir); }
};

TEST_F(FileUtilitiesTest, WriteFileAtomicThenRead) {
  std::string path = (testDir / "nested" / "data.txt").string();
  ASSERT_TRUE(writeFileAtomic(path, "first").isOk());
  ASSERT_TRUE(writeFileAtomic(path, "second").isOk());

  auto content = readFile(path);
  ASSERT_TRUE(content.isOk());
  EXPECT_EQ(*content, "second");
  EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_F(FileUtilitiesTest, WriteFileAtomicFailureKeepsTargetAndCleansUp) {
  std::filesystem::path target = testDir / "occupied";
  std::filesystem::create_directories(target / "child");

  auto result = writeFileAtomic(target.string(), "content");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 4);
  EXPECT_TRUE(std::filesystem::is_directory(target / "child"));
  EXPECT_FALSE(std::filesystem::exists(target.string() + ".tmp"));
}

TEST_F(FileUtilitiesTest, ReadMissingFileFails) {
  EXPECT_TRUE(readFile((testDir / "missing.txt").string()).isError());
}

TEST_F(FileUtilitiesTest, LoadJsonFile) {
  std::string path = (testDir / "config.json").string();
  {
    std::ofstream out(path);
    out << R"({"owner": "alice", "token": {"decimals": 2}})";
  }
  auto result = loadJsonFile(path);
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ((*result)["owner"], "alice");
  EXPECT_EQ((*result)["token"]["decimals"], 2);
}

TEST_F(FileUtilitiesTest, LoadJsonFileErrors) {
  auto missing = loadJsonFile((testDir / "none.json").string());
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, 1);

  std::string path = (testDir / "broken.json").string();
  {
    std::ofstream out(path);
    out << "{ not json";
  }
  auto broken = loadJsonFile(path);
  ASSERT_TRUE(broken.isError());
  EXPECT_EQ(broken.error().code, 3);
}

} // namespace utl
} // namespace icpt
