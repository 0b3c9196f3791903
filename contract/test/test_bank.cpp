#include "../Bank.h"
#include "../ValueTransfer.h"
#include "../../chain/Chain.h"
#include "../../ledger/Types.hpp"
#include <gtest/gtest.h>

using namespace pl;

namespace {

// Receiver that refuses all incoming value
class Wall : public Contract {
public:
  Wall(Chain &chain, const Address &address, const Address &deployer)
      : Contract(chain, address, "test.wall") {}

  Roe<void> onReceive(const Address &from, int64_t amount) override {
    return Error(E_VALIDATION, "wall refuses value");
  }
  nlohmann::json ltsToJson() const override { return nlohmann::json::object(); }
  Roe<void> ltsFromJson(const nlohmann::json &jd) override { return {}; }
};

// Authority contract that calls back into the bank while being paid
class Echo : public Contract {
public:
  enum class Mode { WITHDRAW, DEPOSIT };

  Echo(Chain &chain, const Address &address, const Address &deployer)
      : Contract(chain, address, "test.echo") {}

  Roe<void> onReceive(const Address &from, int64_t amount) override {
    if (!spBank || from != spBank->getAddress()) {
      return {};
    }
    Roe<void> nested = mode == Mode::WITHDRAW
                           ? spBank->withdraw(getAddress(), 1)
                           : vt::sendValue(getChain(), getAddress(),
                                           spBank->getAddress(), 1);
    if (!nested) {
      nestedCode = nested.error().code;
      if (rejectOnNestedFailure) {
        return nested;
      }
    }
    return {};
  }

  nlohmann::json ltsToJson() const override { return nlohmann::json::object(); }
  Roe<void> ltsFromJson(const nlohmann::json &jd) override { return {}; }

  std::shared_ptr<Bank> spBank;
  Mode mode{ Mode::WITHDRAW };
  bool rejectOnNestedFailure{ true };
  int32_t nestedCode{ 0 };
};

} // namespace

class BankTest : public ::testing::Test {
protected:
  Chain chain;
  Address owner = Address::fromName("owner");
  Address alice = Address::fromName("alice");
  Address bob = Address::fromName("bob");
  Address carol = Address::fromName("carol");
  Address dave = Address::fromName("dave");
  std::shared_ptr<Bank> spBank;

  void SetUp() override {
    for (const auto &account : { owner, alice, bob, carol, dave }) {
      ASSERT_TRUE(chain.mint(account, 1000000).isOk());
    }
    spBank = chain.deploy<Bank>(owner);
  }

  Chain::Roe<void> deposit(const Address &from, int64_t amount) {
    return chain.transfer(from, spBank->getAddress(), amount);
  }

  Chain::Roe<void> withdraw(const Address &caller, int64_t amount) {
    return chain.execute([&]() -> Chain::Roe<void> {
      auto result = spBank->withdraw(caller, amount);
      if (!result) {
        return Chain::Error(result.error().code, result.error().message);
      }
      return {};
    });
  }
};

TEST_F(BankTest, DeployerIsInitialAuthority) {
  EXPECT_EQ(spBank->getAuthority(), owner);
  EXPECT_EQ(spBank->getPooledBalance(), 0);
  EXPECT_EQ(spBank->getMinimumDeposit(), 0);
}

TEST_F(BankTest, DepositCreditsSenderAndPool) {
  ASSERT_TRUE(deposit(alice, 500).isOk());
  ASSERT_TRUE(deposit(alice, 250).isOk());
  ASSERT_TRUE(deposit(bob, 100).isOk());

  EXPECT_EQ(spBank->getBalanceOf(alice), 750);
  EXPECT_EQ(spBank->getBalanceOf(bob), 100);
  EXPECT_EQ(spBank->getPooledBalance(), 850);
  EXPECT_EQ(chain.getBalance(spBank->getAddress()), 850);
  EXPECT_EQ(chain.getBalance(alice), 1000000 - 750);
  EXPECT_EQ(spBank->getDepositorCount(), 2u);

  auto events = chain.getEvents("Deposited");
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].args["account"], alice.toHex());
  EXPECT_EQ(events[0].args["amount"], 500);
}

TEST_F(BankTest, ZeroDepositRejected) {
  auto result = deposit(alice, 0);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_VALIDATION);
  EXPECT_EQ(spBank->getPooledBalance(), 0);
  EXPECT_TRUE(chain.getEvents("Deposited").empty());
}

TEST_F(BankTest, LeaderboardTracksTopDepositors) {
  ASSERT_TRUE(deposit(alice, 5).isOk());
  ASSERT_TRUE(deposit(bob, 3).isOk());
  ASSERT_TRUE(deposit(carol, 8).isOk());
  ASSERT_TRUE(deposit(dave, 1).isOk());

  auto board = spBank->getLeaderboard();
  EXPECT_EQ(board[0].account, carol);
  EXPECT_EQ(board[0].amount, 8);
  EXPECT_EQ(board[1].account, alice);
  EXPECT_EQ(board[2].account, bob);
  EXPECT_EQ(spBank->getRank(dave), 0u);
}

TEST_F(BankTest, EnforcedFloorRejectsSmallDeposits) {
  auto spFloored = chain.deploy<Bank>(owner, Bank::enforcedFloor(100));
  EXPECT_EQ(spFloored->getMinimumDeposit(), 100);

  auto below = chain.transfer(alice, spFloored->getAddress(), 99);
  ASSERT_TRUE(below.isError());
  EXPECT_EQ(below.error().code, E_VALIDATION);
  EXPECT_EQ(chain.getBalance(alice), 1000000);

  EXPECT_TRUE(chain.transfer(alice, spFloored->getAddress(), 100).isOk());
  EXPECT_EQ(spFloored->getBalanceOf(alice), 100);
}

TEST_F(BankTest, AuthorityWithdrawsFromPool) {
  ASSERT_TRUE(deposit(alice, 600).isOk());

  ASSERT_TRUE(withdraw(owner, 400).isOk());
  EXPECT_EQ(spBank->getPooledBalance(), 200);
  EXPECT_EQ(chain.getBalance(owner), 1000000 + 400);
  // contributions are a record, not a claim
  EXPECT_EQ(spBank->getBalanceOf(alice), 600);

  auto events = chain.getEvents("Withdrawn");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].args["authority"], owner.toHex());
  EXPECT_EQ(events[0].args["amount"], 400);
}

TEST_F(BankTest, WithdrawRejectsNonAuthority) {
  ASSERT_TRUE(deposit(alice, 600).isOk());
  auto result = withdraw(alice, 100);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_AUTHORIZATION);
  EXPECT_EQ(spBank->getPooledBalance(), 600);
}

TEST_F(BankTest, WithdrawRejectsExcessAndNonPositive) {
  ASSERT_TRUE(deposit(alice, 600).isOk());
  EXPECT_EQ(withdraw(owner, 601).error().code, E_INSUFFICIENT);
  EXPECT_EQ(withdraw(owner, 0).error().code, E_VALIDATION);
  EXPECT_EQ(withdraw(owner, -5).error().code, E_VALIDATION);
  EXPECT_EQ(spBank->getPooledBalance(), 600);
}

TEST_F(BankTest, FailedPayoutRevertsWithdrawal) {
  auto spWall = chain.deploy<Wall>(owner);
  ASSERT_TRUE(deposit(alice, 600).isOk());
  ASSERT_TRUE(spBank->transferAuthority(owner, spWall->getAddress()).isOk());

  auto result = withdraw(spWall->getAddress(), 100);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_TRANSPORT);
  EXPECT_EQ(spBank->getPooledBalance(), 600);
  EXPECT_EQ(chain.getBalance(spBank->getAddress()), 600);
  EXPECT_TRUE(chain.getEvents("Withdrawn").empty());
}

TEST_F(BankTest, TransferAuthorityHandsOverControl) {
  ASSERT_TRUE(deposit(alice, 600).isOk());
  ASSERT_TRUE(spBank->transferAuthority(owner, bob).isOk());

  EXPECT_EQ(spBank->getAuthority(), bob);
  EXPECT_EQ(withdraw(owner, 1).error().code, E_AUTHORIZATION);
  EXPECT_TRUE(withdraw(bob, 1).isOk());

  auto events = chain.getEvents("AuthorityTransferred");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].args["previous"], owner.toHex());
  EXPECT_EQ(events[0].args["new"], bob.toHex());
}

TEST_F(BankTest, TransferAuthorityValidation) {
  EXPECT_EQ(spBank->transferAuthority(alice, bob).error().code,
            E_AUTHORIZATION);
  EXPECT_EQ(spBank->transferAuthority(owner, Address::zero()).error().code,
            E_VALIDATION);
  EXPECT_EQ(spBank->transferAuthority(owner, owner).error().code,
            E_VALIDATION);
  EXPECT_EQ(spBank->getAuthority(), owner);
  EXPECT_TRUE(chain.getEvents("AuthorityTransferred").empty());
}

TEST_F(BankTest, StateRoundTrip) {
  ASSERT_TRUE(deposit(alice, 5).isOk());
  ASSERT_TRUE(deposit(bob, 9).isOk());
  auto saved = spBank->ltsToJson();

  ASSERT_TRUE(deposit(carol, 50).isOk());
  ASSERT_TRUE(spBank->transferAuthority(owner, carol).isOk());
  ASSERT_TRUE(spBank->ltsFromJson(saved).isOk());

  EXPECT_EQ(spBank->getAuthority(), owner);
  EXPECT_EQ(spBank->getPooledBalance(), 14);
  EXPECT_EQ(spBank->getRank(bob), 1u);
  EXPECT_EQ(spBank->getRank(carol), 0u);

  EXPECT_TRUE(spBank->ltsFromJson(nlohmann::json::object()).isError());
}

TEST_F(BankTest, FailedPayoutRestoresPoolWithoutHost) {
  auto spWall = chain.deploy<Wall>(owner);
  ASSERT_TRUE(deposit(alice, 600).isOk());
  ASSERT_TRUE(spBank->transferAuthority(owner, spWall->getAddress()).isOk());

  auto result = spBank->withdraw(spWall->getAddress(), 100);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, E_TRANSPORT);
  EXPECT_EQ(spBank->getPooledBalance(), 600);
  EXPECT_EQ(chain.getBalance(spBank->getAddress()), 600);
  EXPECT_TRUE(chain.getEvents("Withdrawn").empty());
}

TEST_F(BankTest, NestedWithdrawDuringPayoutIsRejected) {
  auto spEcho = chain.deploy<Echo>(owner);
  spEcho->spBank = spBank;
  ASSERT_TRUE(deposit(alice, 600).isOk());
  ASSERT_TRUE(spBank->transferAuthority(owner, spEcho->getAddress()).isOk());

  auto result = withdraw(spEcho->getAddress(), 100);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(spEcho->nestedCode, E_REENTRANT);
  EXPECT_EQ(result.error().code, E_TRANSPORT);
  EXPECT_EQ(spBank->getPooledBalance(), 600);
  EXPECT_EQ(chain.getBalance(spBank->getAddress()), 600);
  EXPECT_EQ(chain.getBalance(spEcho->getAddress()), 0);
  EXPECT_TRUE(chain.getEvents("Withdrawn").empty());
}

TEST_F(BankTest, NestedDepositDuringPayoutIsRejected) {
  auto spEcho = chain.deploy<Echo>(owner);
  spEcho->spBank = spBank;
  spEcho->mode = Echo::Mode::DEPOSIT;
  ASSERT_TRUE(deposit(alice, 600).isOk());
  ASSERT_TRUE(spBank->transferAuthority(owner, spEcho->getAddress()).isOk());

  auto result = withdraw(spEcho->getAddress(), 100);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(spEcho->nestedCode, E_REENTRANT);
  EXPECT_EQ(spBank->getPooledBalance(), 600);
  EXPECT_EQ(spBank->getBalanceOf(spEcho->getAddress()), 0);
  EXPECT_EQ(chain.getEvents("Deposited").size(), 1u);
  EXPECT_TRUE(chain.getEvents("Withdrawn").empty());
}

TEST_F(BankTest, IgnoredNestedWithdrawPaysOnlyOnce) {
  auto spEcho = chain.deploy<Echo>(owner);
  spEcho->spBank = spBank;
  spEcho->rejectOnNestedFailure = false;
  ASSERT_TRUE(deposit(alice, 600).isOk());
  ASSERT_TRUE(spBank->transferAuthority(owner, spEcho->getAddress()).isOk());

  ASSERT_TRUE(withdraw(spEcho->getAddress(), 100).isOk());
  EXPECT_EQ(spEcho->nestedCode, E_REENTRANT);
  EXPECT_EQ(spBank->getPooledBalance(), 500);
  EXPECT_EQ(chain.getBalance(spEcho->getAddress()), 100);
  EXPECT_EQ(chain.getEvents("Withdrawn").size(), 1u);
}
