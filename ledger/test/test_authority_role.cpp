#include "../AuthorityRole.h"
#include "../ReentrancyGuard.h"
#include "../Types.hpp"
#include <gtest/gtest.h>

using namespace pl;

class AuthorityRoleTest : public ::testing::Test {
protected:
  Address alice = Address::fromName("alice");
  Address bob = Address::fromName("bob");
  AuthorityRole role{ alice, "authority" };
};

TEST_F(AuthorityRoleTest, InitialHolderIsAuthorized) {
  EXPECT_EQ(role.getHolder(), alice);
  EXPECT_TRUE(role.isHolder(alice));
  EXPECT_TRUE(role.require(alice).isOk());
}

TEST_F(AuthorityRoleTest, OthersAreRejected) {
  auto result = role.require(bob);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_AUTHORIZATION);
  EXPECT_NE(result.error().message.find("authority"), std::string::npos);
}

TEST_F(AuthorityRoleTest, TransferReturnsPreviousHolder) {
  auto result = role.transfer(alice, bob);
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(*result, alice);
  EXPECT_EQ(role.getHolder(), bob);
  EXPECT_TRUE(role.require(alice).isError());
}

TEST_F(AuthorityRoleTest, TransferByNonHolderRejected) {
  auto result = role.transfer(bob, bob);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_AUTHORIZATION);
  EXPECT_EQ(role.getHolder(), alice);
}

TEST_F(AuthorityRoleTest, TransferToZeroOrSelfRejected) {
  auto zero = role.transfer(alice, Address::zero());
  ASSERT_TRUE(zero.isError());
  EXPECT_EQ(zero.error().code, E_VALIDATION);

  auto same = role.transfer(alice, alice);
  ASSERT_TRUE(same.isError());
  EXPECT_EQ(same.error().code, E_VALIDATION);

  EXPECT_EQ(role.getHolder(), alice);
}

TEST(ReentrancyGuardTest, NestedGuardIsNotAcquired) {
  bool entered = false;
  {
    ReentrancyGuard outer(entered);
    EXPECT_TRUE(outer.isAcquired());
    EXPECT_TRUE(entered);
    {
      ReentrancyGuard inner(entered);
      EXPECT_FALSE(inner.isAcquired());
    }
    EXPECT_TRUE(entered);
  }
  EXPECT_FALSE(entered);
}
