#ifndef POOL_LEDGER_LEDGER_H
#define POOL_LEDGER_LEDGER_H

#include "Address.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>

namespace pl {

/**
 * Ledger - per-account record of cumulative deposits plus the pooled value
 * they funded.
 *
 * Account balances only ever grow: they record contribution and are not a
 * claim on the pool. Withdrawals drain the pool without touching any
 * account, so an account's balance may exceed what is still recoverable.
 */
class Ledger {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  Ledger() = default;
  ~Ledger() = default;

  int64_t getBalance(const Address &account) const;
  int64_t getPooledBalance() const { return pooled_; }
  size_t getAccountCount() const { return mBalances_.size(); }
  bool hasAccount(const Address &account) const;

  /**
   * Credit amount to account and to the pool. Creates the account record on
   * first deposit. Rejects non-positive amounts, the zero identifier and any
   * overflow; on error nothing changes.
   */
  Roe<void> deposit(const Address &account, int64_t amount);

  /**
   * Debit amount from the pool. Rejects non-positive amounts and amounts
   * above the pooled balance.
   */
  Roe<void> withdrawPooled(int64_t amount);

  /** Return amount taken by withdrawPooled() whose payout did not happen */
  Roe<void> refundPooled(int64_t amount);

  nlohmann::json ltsToJson() const;
  Roe<void> ltsFromJson(const nlohmann::json &jd);

private:
  std::map<Address, int64_t> mBalances_;
  int64_t pooled_{ 0 };
};

} // namespace pl

#endif // POOL_LEDGER_LEDGER_H
