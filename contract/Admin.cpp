#include "Admin.h"
#include "ValueTransfer.h"
#include "../chain/Chain.h"
#include "../ledger/ReentrancyGuard.h"
#include "../ledger/Types.hpp"

#include <algorithm>

namespace pl {

Admin::Admin(Chain &chain, const Address &address, const Address &deployer)
    : Contract(chain, address, "pool.admin"), owner_(deployer, "owner") {}

std::shared_ptr<iii::Bank> Admin::findBank(const Address &target) const {
  if (target.isZero()) {
    return nullptr;
  }
  return getChain().getContractAs<iii::Bank>(target);
}

bool Admin::isAuthorityOf(const Address &target) const {
  auto spBank = findBank(target);
  return spBank && spBank->getAuthority() == getAddress();
}

int64_t Admin::getWithdrawableBalance(const Address &target) const {
  auto spBank = findBank(target);
  if (!spBank || spBank->getAuthority() != getAddress()) {
    return 0;
  }
  return spBank->getPooledBalance();
}

Admin::Roe<void> Admin::adminWithdraw(const Address &caller,
                                      const Address &target, int64_t amount) {
  ReentrancyGuard guard(entered_);
  if (!guard.isAcquired()) {
    return Error(E_REENTRANT, "Admin operation already in progress");
  }

  auto auth = owner_.require(caller);
  if (!auth) {
    log().warning << "Unauthorized withdrawal attempt by " << caller;
    return Error(auth.error().code, auth.error().message);
  }
  if (target.isZero()) {
    return Error(E_VALIDATION, "Target cannot be the zero address");
  }
  if (amount <= 0) {
    return Error(E_VALIDATION, "Withdrawal amount must be positive");
  }

  auto received = withdrawFrom(target, amount);
  if (!received) {
    return received.error();
  }
  return {};
}

Admin::Roe<void> Admin::batchAdminWithdraw(const Address &caller,
                                           const std::vector<Address> &targets,
                                           const std::vector<int64_t> &amounts) {
  ReentrancyGuard guard(entered_);
  if (!guard.isAcquired()) {
    return Error(E_REENTRANT, "Admin operation already in progress");
  }

  auto auth = owner_.require(caller);
  if (!auth) {
    log().warning << "Unauthorized batch withdrawal attempt by " << caller;
    return Error(auth.error().code, auth.error().message);
  }
  if (targets.size() != amounts.size()) {
    return Error(E_VALIDATION, "Targets and amounts differ in length: " +
                                   std::to_string(targets.size()) + " vs " +
                                   std::to_string(amounts.size()));
  }

  size_t attempted = 0;
  for (size_t i = 0; i < targets.size(); ++i) {
    if (!isAuthorityOf(targets[i])) {
      log().debug << "Skipping " << targets[i] << ": not its authority";
      continue;
    }

    int64_t available = findBank(targets[i])->getPooledBalance();
    int64_t amount = std::min(amounts[i], available);
    if (amount <= 0) {
      log().debug << "Skipping " << targets[i] << ": nothing to withdraw";
      continue;
    }

    auto received = withdrawFrom(targets[i], amount);
    if (!received) {
      log().warning << "Batch aborted at " << targets[i] << ": "
                    << received.error().message;
      return received.error();
    }
    ++attempted;
  }

  log().info << "Batch withdrawal processed " << attempted << " of "
             << targets.size() << " targets";
  return {};
}

Admin::Roe<int64_t> Admin::withdrawFrom(const Address &target,
                                        int64_t amount) {
  auto spBank = findBank(target);
  if (!spBank) {
    return Error(E_NOT_FOUND, "No bank at " + target.toHex());
  }

  int64_t reported = spBank->getPooledBalance();
  if (amount > reported) {
    return Error(E_INSUFFICIENT, "Requested " + std::to_string(amount) +
                                     " exceeds bank balance " +
                                     std::to_string(reported));
  }
  if (spBank->getAuthority() != getAddress()) {
    return Error(E_AUTHORIZATION,
                 "Admin is not the authority of " + target.toHex());
  }

  int64_t before = getHeldValue();
  auto result = spBank->withdraw(getAddress(), amount);
  if (!result) {
    return result.error();
  }
  int64_t after = getHeldValue();

  // A bank may accept the call yet deliver less, or pull value back out
  // through a nested call; only the observed delta counts.
  int64_t received = after - before;
  if (received < amount) {
    log().warning << "Reconciliation failed for " << target << ": requested "
                  << amount << ", received " << received;
    return Error(E_RECONCILIATION, "Received " + std::to_string(received) +
                                       " of requested " +
                                       std::to_string(amount));
  }

  emit("FundsWithdrawn", {{"target", target.toHex()}, {"amount", received}});
  log().info << "Withdrew " << received << " from " << target;
  return received;
}

Admin::Roe<void> Admin::withdrawToOwner(const Address &caller, int64_t amount) {
  ReentrancyGuard guard(entered_);
  if (!guard.isAcquired()) {
    return Error(E_REENTRANT, "Admin operation already in progress");
  }

  auto auth = owner_.require(caller);
  if (!auth) {
    return Error(auth.error().code, auth.error().message);
  }
  if (amount <= 0) {
    return Error(E_VALIDATION, "Withdrawal amount must be positive");
  }
  if (amount > getHeldValue()) {
    return Error(E_INSUFFICIENT, "Requested " + std::to_string(amount) +
                                     " exceeds admin balance " +
                                     std::to_string(getHeldValue()));
  }
  return payOwner(amount);
}

Admin::Roe<void> Admin::emergencyWithdrawAll(const Address &caller) {
  ReentrancyGuard guard(entered_);
  if (!guard.isAcquired()) {
    return Error(E_REENTRANT, "Admin operation already in progress");
  }

  auto auth = owner_.require(caller);
  if (!auth) {
    return Error(auth.error().code, auth.error().message);
  }
  int64_t held = getHeldValue();
  if (held == 0) {
    return Error(E_INSUFFICIENT, "No funds to withdraw");
  }
  return payOwner(held);
}

Admin::Roe<void> Admin::payOwner(int64_t amount) {
  auto sent = vt::transferValue(getChain(), getAddress(), getOwner(), amount);
  if (!sent) {
    return sent;
  }
  log().info << "Paid " << amount << " to owner " << getOwner();
  return {};
}

Admin::Roe<void> Admin::transferOwnership(const Address &caller,
                                          const Address &newOwner) {
  ReentrancyGuard guard(entered_);
  if (!guard.isAcquired()) {
    return Error(E_REENTRANT, "Admin operation already in progress");
  }

  auto result = owner_.transfer(caller, newOwner);
  if (!result) {
    return Error(result.error().code, result.error().message);
  }

  emit("OwnershipTransferred",
       {{"previous", result->toHex()}, {"new", newOwner.toHex()}});
  log().info << "Ownership transferred from " << *result << " to " << newOwner;
  return {};
}

Admin::Roe<void> Admin::onReceive(const Address &from, int64_t amount) {
  emit("FundsReceived", {{"from", from.toHex()}, {"amount", amount}});
  return {};
}

nlohmann::json Admin::ltsToJson() const {
  nlohmann::json jd;
  jd["owner"] = owner_.getHolder().toHex();
  return jd;
}

Admin::Roe<void> Admin::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.contains("owner") || !jd["owner"].is_string()) {
    return Error(E_VALIDATION, "Admin state is missing 'owner'");
  }
  auto owner = Address::fromHex(jd["owner"].get<std::string>());
  if (!owner) {
    return Error(owner.error().code, owner.error().message);
  }
  owner_.restore(*owner);
  return {};
}

} // namespace pl
