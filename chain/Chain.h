#ifndef POOL_LEDGER_CHAIN_H
#define POOL_LEDGER_CHAIN_H

#include "Contract.h"
#include "../ledger/Address.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace pl {

/**
 * Chain - in-memory execution host.
 *
 * Holds the native value balance of every identifier, the deployed
 * contracts and the ordered event log. Operations run one at a time;
 * execute() makes one operation atomic by snapshotting balances, contract
 * state and the event log, and restoring them if the operation fails.
 */
class Chain : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  struct Event {
    uint64_t index{ 0 };
    Address emitter;
    std::string name;
    nlohmann::json args;

    nlohmann::json ltsToJson() const;
  };

  Chain();
  ~Chain() override = default;

  int64_t getBalance(const Address &account) const;

  /** Credit an external account out of thin air (genesis funding) */
  Roe<void> mint(const Address &account, int64_t amount);

  /**
   * Deploy a contract. T's constructor receives (Chain&, address, deployer,
   * args...). The address is derived from the deployer and a global nonce.
   */
  template <typename T, typename... Args>
  std::shared_ptr<T> deploy(const Address &deployer, Args &&...args) {
    Address address = Address::derive(deployer, nonce_++);
    auto spContract = std::make_shared<T>(*this, address, deployer,
                                          std::forward<Args>(args)...);
    registerContract(spContract);
    return spContract;
  }

  bool isContract(const Address &address) const;
  std::shared_ptr<Contract> getContract(const Address &address) const;

  template <typename T>
  std::shared_ptr<T> getContractAs(const Address &address) const {
    return std::dynamic_pointer_cast<T>(getContract(address));
  }

  /**
   * Move amount from one identifier to another. If the recipient is a
   * contract its receive hook runs after the balances move; when the hook
   * fails the move is undone and the hook's error is returned unchanged.
   */
  Roe<void> sendValue(const Address &from, const Address &to, int64_t amount);

  /**
   * Run operation as one atomic unit. Any error result restores balances,
   * contract state and the event log to what they were before the call.
   * operation must return a ResultOrError. If operation throws, the state
   * is restored and the exception rethrown.
   */
  template <typename Op> auto execute(Op &&operation) -> decltype(operation()) {
    Snapshot snapshot = takeSnapshot();
    ++depth_;
    auto result = [&]() {
      try {
        return operation();
      } catch (...) {
        --depth_;
        log().error << "Operation threw at depth " << depth_
                    << ", rolling back";
        restoreSnapshot(snapshot);
        throw;
      }
    }();
    --depth_;
    if (!result) {
      log().debug << "Rolling back operation at depth " << depth_ << ": "
                  << result.error().message;
      restoreSnapshot(snapshot);
    }
    return result;
  }

  /** Atomic external value transfer (sendValue inside execute) */
  Roe<void> transfer(const Address &from, const Address &to, int64_t amount);

  void emit(const Address &emitter, const std::string &name,
            nlohmann::json args);

  const std::vector<Event> &getEvents() const { return events_; }
  std::vector<Event> getEvents(const std::string &name) const;

  nlohmann::json ltsToJson() const;

private:
  struct Snapshot {
    std::map<Address, int64_t> balances;
    std::map<Address, nlohmann::json> states;
    size_t eventCount{ 0 };
    uint64_t nonce{ 0 };
  };

  void registerContract(std::shared_ptr<Contract> spContract);
  Snapshot takeSnapshot() const;

  /** Throws std::runtime_error if a contract rejects its own saved state */
  void restoreSnapshot(const Snapshot &snapshot);

  std::map<Address, int64_t> mBalances_;
  std::map<Address, std::shared_ptr<Contract>> mContracts_;
  std::vector<Event> events_;
  uint64_t nonce_{ 0 };
  uint32_t depth_{ 0 };
};

} // namespace pl

#endif // POOL_LEDGER_CHAIN_H
