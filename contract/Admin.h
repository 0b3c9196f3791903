#ifndef POOL_LEDGER_ADMIN_H
#define POOL_LEDGER_ADMIN_H

#include "../chain/Contract.h"
#include "../interface/Bank.hpp"
#include "../ledger/Address.h"
#include "../ledger/AuthorityRole.h"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <vector>

namespace pl {

class Chain;

/**
 * Admin - owner-controlled agent that can hold the authority of any number
 * of banks and withdraw from them on the owner's behalf.
 *
 * Whether the admin controls a bank is never cached: every withdrawal asks
 * the bank again right before acting, and every withdrawal is checked
 * against the value that actually arrived.
 *
 * Events: FundsWithdrawn{target, amount}, FundsReceived{from, amount},
 * OwnershipTransferred{previous, new}.
 */
class Admin : public Contract {
public:
  Admin(Chain &chain, const Address &address, const Address &deployer);
  ~Admin() override = default;

  /**
   * Delegated withdrawal of amount from target into this admin.
   *
   * Rejects if amount exceeds the target's reported pool, if the target
   * does not report this admin as its authority, or if less than amount
   * arrived after the target's withdrawal ran.
   */
  Roe<void> adminWithdraw(const Address &caller, const Address &target,
                          int64_t amount);

  /**
   * Delegated withdrawal over parallel target/amount lists. Targets this
   * admin does not control are skipped, requests are clamped to the
   * target's pool and zero results skipped. Any failure on an attempted
   * target fails the whole batch.
   */
  Roe<void> batchAdminWithdraw(const Address &caller,
                               const std::vector<Address> &targets,
                               const std::vector<int64_t> &amounts);

  Roe<void> withdrawToOwner(const Address &caller, int64_t amount);
  Roe<void> emergencyWithdrawAll(const Address &caller);
  Roe<void> transferOwnership(const Address &caller, const Address &newOwner);

  bool isAuthorityOf(const Address &target) const;

  /** Target's pool if this admin controls it, else 0 */
  int64_t getWithdrawableBalance(const Address &target) const;

  const Address &getOwner() const { return owner_.getHolder(); }

  /** Value currently held by the admin */
  int64_t getBalance() const { return getHeldValue(); }

  Roe<void> onReceive(const Address &from, int64_t amount) override;

  nlohmann::json ltsToJson() const override;
  Roe<void> ltsFromJson(const nlohmann::json &jd) override;

private:
  std::shared_ptr<iii::Bank> findBank(const Address &target) const;

  /** Balance check, authority check, withdraw, reconcile; returns received */
  Roe<int64_t> withdrawFrom(const Address &target, int64_t amount);

  Roe<void> payOwner(int64_t amount);

  AuthorityRole owner_;
  bool entered_{ false };
};

} // namespace pl

#endif // POOL_LEDGER_ADMIN_H
