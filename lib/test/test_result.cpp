#include "../ResultOrError.hpp"
#include <gtest/gtest.h>

#include <string>

namespace {

struct AppError : pl::RoeErrorBase {
  using pl::RoeErrorBase::RoeErrorBase;
};

template <typename T> using AppRoe = pl::ResultOrError<T, AppError>;

AppRoe<int> divide(int a, int b) {
  if (b == 0) {
    return AppError(1, "Division by zero");
  }
  return a / b;
}

AppRoe<void> requirePositive(int value) {
  if (value <= 0) {
    return AppError(2, "Value must be positive");
  }
  return {};
}

} // namespace

TEST(ResultOrErrorTest, HoldsValue) {
  auto result = divide(10, 2);
  ASSERT_TRUE(result.isOk());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(*result, 5);
  EXPECT_EQ(result.valueOr(-1), 5);
  EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultOrErrorTest, HoldsError) {
  auto result = divide(1, 0);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 1);
  EXPECT_EQ(result.error().message, "Division by zero");
  EXPECT_EQ(result.valueOr(-1), -1);
  EXPECT_THROW(result.value(), std::runtime_error);
}

TEST(ResultOrErrorTest, VoidSpecialization) {
  EXPECT_TRUE(requirePositive(3).isOk());
  auto result = requirePositive(0);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 2);
}

TEST(ResultOrErrorTest, StringValueAndArrow) {
  AppRoe<std::string> result(std::string("ledger"));
  EXPECT_EQ(result->size(), 6u);
  AppRoe<std::string> copy = result;
  EXPECT_EQ(copy.value(), "ledger");
}

TEST(ResultOrErrorTest, MessageOnlyErrorHasDefaultCode) {
  AppError err("plain message");
  EXPECT_EQ(err.code, -1);
  EXPECT_EQ(err.message, "plain message");
}
