#include "Ledger.h"
#include "Types.hpp"

#include <limits>

namespace pl {

int64_t Ledger::getBalance(const Address &account) const {
  auto it = mBalances_.find(account);
  if (it == mBalances_.end()) {
    return 0;
  }
  return it->second;
}

bool Ledger::hasAccount(const Address &account) const {
  return mBalances_.find(account) != mBalances_.end();
}

Ledger::Roe<void> Ledger::deposit(const Address &account, int64_t amount) {
  if (amount <= 0) {
    return Error(E_VALIDATION, "Deposit amount must be positive");
  }
  if (account.isZero()) {
    return Error(E_VALIDATION, "Cannot deposit for the zero address");
  }

  const int64_t max = std::numeric_limits<int64_t>::max();
  int64_t balance = getBalance(account);
  if (balance > max - amount) {
    return Error(E_OVERFLOW, "Deposit would cause balance overflow");
  }
  if (pooled_ > max - amount) {
    return Error(E_OVERFLOW, "Deposit would cause pooled balance overflow");
  }

  mBalances_[account] = balance + amount;
  pooled_ += amount;
  return {};
}

Ledger::Roe<void> Ledger::withdrawPooled(int64_t amount) {
  if (amount <= 0) {
    return Error(E_VALIDATION, "Withdrawal amount must be positive");
  }
  if (amount > pooled_) {
    return Error(E_INSUFFICIENT, "Insufficient pooled balance: requested " +
                                     std::to_string(amount) + ", available " +
                                     std::to_string(pooled_));
  }

  pooled_ -= amount;
  return {};
}

Ledger::Roe<void> Ledger::refundPooled(int64_t amount) {
  if (amount <= 0) {
    return Error(E_VALIDATION, "Refund amount must be positive");
  }
  if (pooled_ > std::numeric_limits<int64_t>::max() - amount) {
    return Error(E_OVERFLOW, "Refund would cause pooled balance overflow");
  }

  pooled_ += amount;
  return {};
}

nlohmann::json Ledger::ltsToJson() const {
  nlohmann::json balances = nlohmann::json::object();
  for (const auto &[account, balance] : mBalances_) {
    balances[account.toHex()] = balance;
  }
  nlohmann::json jd;
  jd["pooled"] = pooled_;
  jd["balances"] = balances;
  return jd;
}

Ledger::Roe<void> Ledger::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.contains("pooled") || !jd["pooled"].is_number_integer()) {
    return Error(E_VALIDATION, "Ledger state is missing 'pooled'");
  }
  if (!jd.contains("balances") || !jd["balances"].is_object()) {
    return Error(E_VALIDATION, "Ledger state is missing 'balances'");
  }

  std::map<Address, int64_t> balances;
  for (const auto &[key, value] : jd["balances"].items()) {
    auto address = Address::fromHex(key);
    if (!address) {
      return Error(address.error().code, address.error().message);
    }
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
      return Error(E_VALIDATION, "Invalid balance for " + key);
    }
    balances[*address] = value.get<int64_t>();
  }

  int64_t pooled = jd["pooled"].get<int64_t>();
  if (pooled < 0) {
    return Error(E_VALIDATION, "Pooled balance must be non-negative");
  }

  mBalances_ = std::move(balances);
  pooled_ = pooled;
  return {};
}

} // namespace pl
