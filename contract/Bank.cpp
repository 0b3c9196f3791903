#include "Bank.h"
#include "ValueTransfer.h"
#include "../chain/Chain.h"
#include "../ledger/ReentrancyGuard.h"
#include "../ledger/Types.hpp"

namespace pl {

Bank::MinimumDepositPolicy Bank::unrestricted() {
  return []() -> int64_t { return 0; };
}

Bank::MinimumDepositPolicy Bank::enforcedFloor(int64_t floor) {
  return [floor]() -> int64_t { return floor; };
}

Bank::Bank(Chain &chain, const Address &address, const Address &deployer,
           MinimumDepositPolicy minimumDeposit)
    : Contract(chain, address, "pool.bank"),
      minimumDeposit_(minimumDeposit ? std::move(minimumDeposit)
                                     : unrestricted()),
      authority_(deployer, "authority") {}

Bank::Roe<void> Bank::onReceive(const Address &from, int64_t amount) {
  return deposit(from, amount);
}

Bank::Roe<void> Bank::deposit(const Address &from, int64_t amount) {
  ReentrancyGuard guard(entered_);
  if (!guard.isAcquired()) {
    return Error(E_REENTRANT, "Bank operation already in progress");
  }

  int64_t floor = getMinimumDeposit();
  if (amount > 0 && amount < floor) {
    log().debug << "Rejected deposit of " << amount << " from " << from
                << " below minimum " << floor;
    return Error(E_VALIDATION, "Deposit of " + std::to_string(amount) +
                                   " is below the minimum of " +
                                   std::to_string(floor));
  }

  auto result = ledger_.deposit(from, amount);
  if (!result) {
    log().debug << "Rejected deposit from " << from << ": "
                << result.error().message;
    return Error(result.error().code, result.error().message);
  }
  leaderboard_.update(ledger_, from);

  emit("Deposited", {{"account", from.toHex()}, {"amount", amount}});
  log().info << "Deposit of " << amount << " from " << from << ", rank "
             << leaderboard_.getRank(from);
  return {};
}

Bank::Roe<void> Bank::withdraw(const Address &caller, int64_t amount) {
  ReentrancyGuard guard(entered_);
  if (!guard.isAcquired()) {
    return Error(E_REENTRANT, "Bank operation already in progress");
  }

  auto auth = authority_.require(caller);
  if (!auth) {
    log().warning << "Unauthorized withdrawal attempt by " << caller;
    return Error(auth.error().code, auth.error().message);
  }

  auto result = ledger_.withdrawPooled(amount);
  if (!result) {
    return Error(result.error().code, result.error().message);
  }

  // Pool is debited before value leaves
  auto sent = vt::transferValue(getChain(), getAddress(), caller, amount);
  if (!sent) {
    log().warning << "Payout of " << amount << " to " << caller
                  << " failed: " << sent.error().message;
    auto refunded = ledger_.refundPooled(amount);
    if (!refunded) {
      log().critical << "Failed to restore pool after failed payout: "
                     << refunded.error().message;
      return Error(refunded.error().code, refunded.error().message);
    }
    return sent;
  }

  emit("Withdrawn", {{"authority", caller.toHex()}, {"amount", amount}});
  log().info << "Withdrawn " << amount << " by " << caller << ", pool now "
             << ledger_.getPooledBalance();
  return {};
}

Bank::Roe<void> Bank::transferAuthority(const Address &caller,
                                        const Address &newAuthority) {
  ReentrancyGuard guard(entered_);
  if (!guard.isAcquired()) {
    return Error(E_REENTRANT, "Bank operation already in progress");
  }

  auto result = authority_.transfer(caller, newAuthority);
  if (!result) {
    return Error(result.error().code, result.error().message);
  }

  emit("AuthorityTransferred",
       {{"previous", result->toHex()}, {"new", newAuthority.toHex()}});
  log().info << "Authority transferred from " << *result << " to "
             << newAuthority;
  return {};
}

int64_t Bank::getPooledBalance() const { return ledger_.getPooledBalance(); }

Address Bank::getAuthority() const { return authority_.getHolder(); }

std::array<Bank::Standing, Leaderboard::CAPACITY> Bank::getLeaderboard() const {
  return leaderboard_.getStandings(ledger_);
}

uint32_t Bank::getRank(const Address &account) const {
  return leaderboard_.getRank(account);
}

int64_t Bank::getMinimumDeposit() const { return minimumDeposit_(); }

int64_t Bank::getBalanceOf(const Address &account) const {
  return ledger_.getBalance(account);
}

size_t Bank::getDepositorCount() const { return ledger_.getAccountCount(); }

nlohmann::json Bank::ltsToJson() const {
  nlohmann::json jd;
  jd["authority"] = authority_.getHolder().toHex();
  jd["minimumDeposit"] = getMinimumDeposit();
  jd["ledger"] = ledger_.ltsToJson();
  jd["leaderboard"] = leaderboard_.ltsToJson();
  return jd;
}

Bank::Roe<void> Bank::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.contains("authority") || !jd["authority"].is_string()) {
    return Error(E_VALIDATION, "Bank state is missing 'authority'");
  }
  auto authority = Address::fromHex(jd["authority"].get<std::string>());
  if (!authority) {
    return Error(authority.error().code, authority.error().message);
  }

  Ledger ledger;
  auto ledgerResult = ledger.ltsFromJson(jd.value("ledger", nlohmann::json()));
  if (!ledgerResult) {
    return Error(ledgerResult.error().code, ledgerResult.error().message);
  }

  Leaderboard leaderboard;
  auto boardResult =
      leaderboard.ltsFromJson(jd.value("leaderboard", nlohmann::json()));
  if (!boardResult) {
    return Error(boardResult.error().code, boardResult.error().message);
  }

  ledger_ = std::move(ledger);
  leaderboard_ = leaderboard;
  authority_.restore(*authority);
  return {};
}

} // namespace pl
