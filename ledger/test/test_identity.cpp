#include "Identity.h"
#include <gtest/gtest.h>

using icpt::Identity;

TEST(IdentityTest, TextRoundTripForPrintableName) {
  auto result = Identity::fromText("alice");
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result->bytes(), "alice");
  EXPECT_EQ(result->toText(), "alice");
}

TEST(IdentityTest, BinaryIdentityUsesHexText) {
  Identity principal(std::string("\x00\x9a\xff", 3));
  EXPECT_EQ(principal.toText(), "0x009aff");

  auto parsed = Identity::fromText("0x009aff");
  ASSERT_TRUE(parsed.isOk());
  EXPECT_EQ(*parsed, principal);
}

TEST(IdentityTest, RejectsEmptyAndBadHex) {
  auto empty = Identity::fromText("");
  ASSERT_TRUE(empty.isError());
  EXPECT_EQ(empty.error().code, Identity::E_EMPTY);

  auto badHex = Identity::fromText("0xzz");
  ASSERT_TRUE(badHex.isError());
  EXPECT_EQ(badHex.error().code, Identity::E_HEX);

  auto barePrefix = Identity::fromText("0x");
  ASSERT_TRUE(barePrefix.isError());
  EXPECT_EQ(barePrefix.error().code, Identity::E_HEX);
}

TEST(IdentityTest, ComparesByBytes) {
  EXPECT_EQ(Identity("bob"), Identity("bob"));
  EXPECT_NE(Identity("bob"), Identity("Bob"));
  EXPECT_LT(Identity("alice"), Identity("bob"));
  EXPECT_TRUE(Identity().isEmpty());
}
