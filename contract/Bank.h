#ifndef POOL_LEDGER_BANK_H
#define POOL_LEDGER_BANK_H

#include "../chain/Contract.h"
#include "../interface/Bank.hpp"
#include "../ledger/Address.h"
#include "../ledger/AuthorityRole.h"
#include "../ledger/Leaderboard.h"
#include "../ledger/Ledger.h"

#include <array>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

namespace pl {

class Chain;

/**
 * Bank - pooled-balance contract with a top-3 depositor leaderboard.
 *
 * Any value sent to the bank is a deposit by the sender. The authority
 * (initially the deployer) may withdraw from the pool. A minimum-deposit
 * policy supplies the floor; the unrestricted policy returns 0.
 *
 * Events: Deposited{account, amount}, Withdrawn{authority, amount},
 * AuthorityTransferred{previous, new}.
 */
class Bank : public Contract, public iii::Bank {
public:
  using MinimumDepositPolicy = std::function<int64_t()>;
  using Standing = Leaderboard::Standing;

  // 0.001 of a 10^18-unit coin
  static constexpr int64_t DEFAULT_MINIMUM_DEPOSIT = 1000000000000000LL;

  static MinimumDepositPolicy unrestricted();
  static MinimumDepositPolicy enforcedFloor(int64_t floor);

  Bank(Chain &chain, const Address &address, const Address &deployer,
       MinimumDepositPolicy minimumDeposit = unrestricted());
  ~Bank() override = default;

  Roe<void> withdraw(const Address &caller, int64_t amount) override;
  Roe<void> transferAuthority(const Address &caller,
                              const Address &newAuthority);

  int64_t getPooledBalance() const override;
  Address getAuthority() const override;
  std::array<Standing, Leaderboard::CAPACITY> getLeaderboard() const;
  uint32_t getRank(const Address &account) const;
  int64_t getMinimumDeposit() const;

  /** Cumulative deposits recorded for account */
  int64_t getBalanceOf(const Address &account) const;
  size_t getDepositorCount() const;

  Roe<void> onReceive(const Address &from, int64_t amount) override;

  nlohmann::json ltsToJson() const override;
  Roe<void> ltsFromJson(const nlohmann::json &jd) override;

private:
  Roe<void> deposit(const Address &from, int64_t amount);

  MinimumDepositPolicy minimumDeposit_;
  Ledger ledger_;
  Leaderboard leaderboard_;
  AuthorityRole authority_;
  bool entered_{ false };
};

} // namespace pl

#endif // POOL_LEDGER_BANK_H
