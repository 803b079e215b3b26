#include "ResultOrError.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

namespace {

struct TestError : icpt::RoeErrorBase {
  using icpt::RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = icpt::ResultOrError<T, TestError>;

Roe<int> half(int value) {
  if (value % 2 != 0) {
    return TestError(7, "odd value: " + std::to_string(value));
  }
  return value / 2;
}

Roe<void> checkPositive(int value) {
  if (value <= 0) {
    return TestError(3, "not positive");
  }
  return {};
}

} // namespace

TEST(ResultOrErrorTest, HoldsValue) {
  auto result = half(10);
  ASSERT_TRUE(result.isOk());
  EXPECT_FALSE(result.isError());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result.value(), 5);
  EXPECT_EQ(*result, 5);
}

TEST(ResultOrErrorTest, HoldsError) {
  auto result = half(3);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 7);
  EXPECT_EQ(result.error().message, "odd value: 3");
  EXPECT_EQ(result.valueOr(-1), -1);
}

TEST(ResultOrErrorTest, AccessingWrongSideThrows) {
  auto ok = half(4);
  auto err = half(5);
  EXPECT_THROW(ok.error(), std::runtime_error);
  EXPECT_THROW(err.value(), std::runtime_error);
}

TEST(ResultOrErrorTest, VoidSpecialization) {
  EXPECT_TRUE(checkPositive(1).isOk());
  auto result = checkPositive(0);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 3);
  EXPECT_THROW(checkPositive(2).error(), std::runtime_error);
}

TEST(ResultOrErrorTest, CopyAndMovePreserveContent) {
  Roe<std::string> original(std::string("ledger"));
  Roe<std::string> copy = original;
  EXPECT_EQ(*copy, "ledger");
  EXPECT_EQ(*original, "ledger");

  Roe<std::string> moved = std::move(copy);
  EXPECT_EQ(*moved, "ledger");

  Roe<std::string> failed = TestError(1, "boom");
  moved = failed;
  ASSERT_TRUE(moved.isError());
  EXPECT_EQ(moved.error().message, "boom");
}

TEST(ResultOrErrorTest, ArrowOperatorReachesMembers) {
  Roe<std::string> result(std::string("abc"));
  EXPECT_EQ(result->size(), 3u);
}

TEST(ResultOrErrorTest, DestroysHeldValue) {
  auto counter = std::make_shared<int>(0);
  {
    Roe<std::shared_ptr<int>> result(counter);
    EXPECT_EQ(counter.use_count(), 2);
  }
  EXPECT_EQ(counter.use_count(), 1);
}

TEST(RoeErrorBaseTest, MessageOnlyErrorHasDefaultCode) {
  icpt::RoeErrorBase err("plain message");
  EXPECT_EQ(err.code, -1);
  EXPECT_EQ(err.message, "plain message");

  std::ostringstream oss;
  oss << icpt::RoeErrorBase(4, "overflow");
  EXPECT_EQ(oss.str(), "[4] overflow");
}
