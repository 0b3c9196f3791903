#include "../Ledger.h"
#include "../Types.hpp"
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace pl;

class LedgerTest : public ::testing::Test {
protected:
  Ledger ledger;
  Address alice = Address::fromName("alice");
  Address bob = Address::fromName("bob");
};

TEST_F(LedgerTest, StartsEmpty) {
  EXPECT_EQ(ledger.getPooledBalance(), 0);
  EXPECT_EQ(ledger.getBalance(alice), 0);
  EXPECT_EQ(ledger.getAccountCount(), 0u);
  EXPECT_FALSE(ledger.hasAccount(alice));
}

TEST_F(LedgerTest, DepositIncreasesAccountAndPool) {
  ASSERT_TRUE(ledger.deposit(alice, 5).isOk());
  ASSERT_TRUE(ledger.deposit(alice, 7).isOk());
  ASSERT_TRUE(ledger.deposit(bob, 3).isOk());

  EXPECT_EQ(ledger.getBalance(alice), 12);
  EXPECT_EQ(ledger.getBalance(bob), 3);
  EXPECT_EQ(ledger.getPooledBalance(), 15);
  EXPECT_EQ(ledger.getAccountCount(), 2u);
}

TEST_F(LedgerTest, NonPositiveDepositRejected) {
  auto zero = ledger.deposit(alice, 0);
  ASSERT_TRUE(zero.isError());
  EXPECT_EQ(zero.error().code, E_VALIDATION);

  auto negative = ledger.deposit(alice, -1);
  ASSERT_TRUE(negative.isError());
  EXPECT_EQ(negative.error().code, E_VALIDATION);

  EXPECT_FALSE(ledger.hasAccount(alice));
  EXPECT_EQ(ledger.getPooledBalance(), 0);
}

TEST_F(LedgerTest, ZeroAddressDepositRejected) {
  auto result = ledger.deposit(Address::zero(), 10);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_VALIDATION);
}

TEST_F(LedgerTest, OverflowRejectedWithoutChange) {
  ASSERT_TRUE(ledger.deposit(alice, INT64_MAX).isOk());

  auto account = ledger.deposit(alice, 1);
  ASSERT_TRUE(account.isError());
  EXPECT_EQ(account.error().code, E_OVERFLOW);

  // bob's own balance fits, the pool does not
  auto pool = ledger.deposit(bob, 1);
  ASSERT_TRUE(pool.isError());
  EXPECT_EQ(pool.error().code, E_OVERFLOW);

  EXPECT_EQ(ledger.getBalance(alice), INT64_MAX);
  EXPECT_EQ(ledger.getBalance(bob), 0);
  EXPECT_EQ(ledger.getPooledBalance(), INT64_MAX);
}

TEST_F(LedgerTest, WithdrawDrainsPoolNotAccounts) {
  ASSERT_TRUE(ledger.deposit(alice, 10).isOk());
  ASSERT_TRUE(ledger.deposit(bob, 5).isOk());

  ASSERT_TRUE(ledger.withdrawPooled(12).isOk());
  EXPECT_EQ(ledger.getPooledBalance(), 3);
  EXPECT_EQ(ledger.getBalance(alice), 10);
  EXPECT_EQ(ledger.getBalance(bob), 5);
}

TEST_F(LedgerTest, WithdrawValidation) {
  ASSERT_TRUE(ledger.deposit(alice, 10).isOk());

  auto zero = ledger.withdrawPooled(0);
  ASSERT_TRUE(zero.isError());
  EXPECT_EQ(zero.error().code, E_VALIDATION);

  auto tooMuch = ledger.withdrawPooled(11);
  ASSERT_TRUE(tooMuch.isError());
  EXPECT_EQ(tooMuch.error().code, E_INSUFFICIENT);

  ASSERT_TRUE(ledger.withdrawPooled(10).isOk());
  EXPECT_EQ(ledger.getPooledBalance(), 0);
}

TEST_F(LedgerTest, StateRoundTrip) {
  ASSERT_TRUE(ledger.deposit(alice, 10).isOk());
  ASSERT_TRUE(ledger.deposit(bob, 4).isOk());
  ASSERT_TRUE(ledger.withdrawPooled(6).isOk());

  Ledger restored;
  ASSERT_TRUE(restored.ltsFromJson(ledger.ltsToJson()).isOk());
  EXPECT_EQ(restored.getBalance(alice), 10);
  EXPECT_EQ(restored.getBalance(bob), 4);
  EXPECT_EQ(restored.getPooledBalance(), 8);
}

TEST_F(LedgerTest, StateRejectsMalformedJson) {
  ASSERT_TRUE(ledger.deposit(alice, 1).isOk());
  nlohmann::json jd = ledger.ltsToJson();
  jd["balances"]["not-an-address"] = 3;

  EXPECT_TRUE(ledger.ltsFromJson(jd).isError());
  EXPECT_TRUE(ledger.ltsFromJson(nlohmann::json::object()).isError());
  EXPECT_EQ(ledger.getBalance(alice), 1);
}

TEST_F(LedgerTest, RefundReturnsValueToPool) {
  ASSERT_TRUE(ledger.deposit(alice, 10).isOk());
  ASSERT_TRUE(ledger.withdrawPooled(4).isOk());
  ASSERT_TRUE(ledger.refundPooled(4).isOk());
  EXPECT_EQ(ledger.getPooledBalance(), 10);
  EXPECT_EQ(ledger.getBalance(alice), 10);

  EXPECT_EQ(ledger.refundPooled(0).error().code, E_VALIDATION);
  EXPECT_EQ(ledger.refundPooled(std::numeric_limits<int64_t>::max())
                .error()
                .code,
            E_OVERFLOW);
  EXPECT_EQ(ledger.getPooledBalance(), 10);
}
