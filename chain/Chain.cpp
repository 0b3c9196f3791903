#include "Chain.h"
#include "../ledger/Types.hpp"

#include <limits>
#include <stdexcept>

namespace pl {

nlohmann::json Chain::Event::ltsToJson() const {
  nlohmann::json jd;
  jd["index"] = index;
  jd["emitter"] = emitter.toHex();
  jd["name"] = name;
  jd["args"] = args;
  return jd;
}

Chain::Chain() : Module("pool.chain") {}

int64_t Chain::getBalance(const Address &account) const {
  auto it = mBalances_.find(account);
  if (it == mBalances_.end()) {
    return 0;
  }
  return it->second;
}

Chain::Roe<void> Chain::mint(const Address &account, int64_t amount) {
  if (amount <= 0) {
    return Error(E_VALIDATION, "Mint amount must be positive");
  }
  if (account.isZero()) {
    return Error(E_VALIDATION, "Cannot mint to the zero address");
  }
  if (isContract(account)) {
    return Error(E_VALIDATION, "Cannot mint to contract " + account.toHex());
  }
  int64_t balance = getBalance(account);
  if (balance > std::numeric_limits<int64_t>::max() - amount) {
    return Error(E_OVERFLOW, "Mint would cause balance overflow");
  }

  mBalances_[account] = balance + amount;
  log().debug << "Minted " << amount << " to " << account;
  return {};
}

bool Chain::isContract(const Address &address) const {
  return mContracts_.find(address) != mContracts_.end();
}

std::shared_ptr<Contract> Chain::getContract(const Address &address) const {
  auto it = mContracts_.find(address);
  if (it == mContracts_.end()) {
    return nullptr;
  }
  return it->second;
}

void Chain::registerContract(std::shared_ptr<Contract> spContract) {
  log().info << "Deployed " << spContract->getLoggerName() << " at "
             << spContract->getAddress();
  mContracts_[spContract->getAddress()] = spContract;
}

Chain::Roe<void> Chain::sendValue(const Address &from, const Address &to,
                                  int64_t amount) {
  if (amount < 0) {
    return Error(E_VALIDATION, "Transfer amount must be non-negative");
  }
  if (to.isZero()) {
    return Error(E_VALIDATION, "Cannot transfer to the zero address");
  }

  int64_t fromBalance = getBalance(from);
  if (fromBalance < amount) {
    return Error(E_INSUFFICIENT, "Insufficient balance in " + from.toHex() +
                                     ": has " + std::to_string(fromBalance) +
                                     ", needs " + std::to_string(amount));
  }

  if (from != to) {
    int64_t toBalance = getBalance(to);
    if (toBalance > std::numeric_limits<int64_t>::max() - amount) {
      return Error(E_OVERFLOW, "Transfer would cause recipient overflow");
    }
    mBalances_[from] = fromBalance - amount;
    mBalances_[to] = toBalance + amount;
  }

  auto spRecipient = getContract(to);
  if (!spRecipient) {
    return {};
  }

  auto hookResult = spRecipient->onReceive(from, amount);
  if (!hookResult) {
    if (from != to) {
      mBalances_[to] -= amount;
      mBalances_[from] += amount;
    }
    return Error(hookResult.error().code, hookResult.error().message);
  }
  return {};
}

Chain::Roe<void> Chain::transfer(const Address &from, const Address &to,
                                 int64_t amount) {
  return execute([&]() { return sendValue(from, to, amount); });
}

void Chain::emit(const Address &emitter, const std::string &name,
                 nlohmann::json args) {
  Event event;
  event.index = events_.size();
  event.emitter = emitter;
  event.name = name;
  event.args = std::move(args);
  log().debug << "Event " << name << " from " << emitter << ": "
              << event.args.dump();
  events_.push_back(std::move(event));
}

std::vector<Chain::Event> Chain::getEvents(const std::string &name) const {
  std::vector<Event> matching;
  for (const auto &event : events_) {
    if (event.name == name) {
      matching.push_back(event);
    }
  }
  return matching;
}

nlohmann::json Chain::ltsToJson() const {
  nlohmann::json balances = nlohmann::json::object();
  for (const auto &[account, balance] : mBalances_) {
    if (balance != 0) {
      balances[account.toHex()] = balance;
    }
  }
  nlohmann::json contracts = nlohmann::json::object();
  for (const auto &[address, spContract] : mContracts_) {
    contracts[address.toHex()] = spContract->ltsToJson();
  }
  nlohmann::json events = nlohmann::json::array();
  for (const auto &event : events_) {
    events.push_back(event.ltsToJson());
  }

  nlohmann::json jd;
  jd["balances"] = balances;
  jd["contracts"] = contracts;
  jd["events"] = events;
  return jd;
}

Chain::Snapshot Chain::takeSnapshot() const {
  Snapshot snapshot;
  snapshot.balances = mBalances_;
  for (const auto &[address, spContract] : mContracts_) {
    snapshot.states[address] = spContract->ltsToJson();
  }
  snapshot.eventCount = events_.size();
  snapshot.nonce = nonce_;
  return snapshot;
}

void Chain::restoreSnapshot(const Snapshot &snapshot) {
  mBalances_ = snapshot.balances;
  events_.resize(snapshot.eventCount);
  nonce_ = snapshot.nonce;

  for (auto it = mContracts_.begin(); it != mContracts_.end();) {
    auto stateIt = snapshot.states.find(it->first);
    if (stateIt == snapshot.states.end()) {
      // deployed during the failed operation
      it = mContracts_.erase(it);
      continue;
    }
    auto result = it->second->ltsFromJson(stateIt->second);
    if (!result) {
      log().critical << "Failed to restore state of " << it->first << ": "
                     << result.error().message;
      throw std::runtime_error("Contract state restore failed: " +
                               result.error().message);
    }
    ++it;
  }
}

} // namespace pl
