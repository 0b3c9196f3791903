#ifndef POOL_LEDGER_CONTRACT_H
#define POOL_LEDGER_CONTRACT_H

#include "../ledger/Address.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace pl {

class Chain;

/**
 * Contract - state machine hosted by a Chain at a fixed address.
 *
 * Callers are passed explicitly to every gated operation. Value sent to the
 * contract's address arrives through onReceive(). The whole persistent state
 * must round-trip through ltsToJson()/ltsFromJson() so the host can roll a
 * failed operation back.
 */
class Contract : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  Contract(Chain &chain, const Address &address, const std::string &loggerName);
  ~Contract() override = default;

  const Address &getAddress() const { return address_; }

  /** Value receipt hook; an error makes the sender's transfer fail */
  virtual Roe<void> onReceive(const Address &from, int64_t amount) = 0;

  virtual nlohmann::json ltsToJson() const = 0;
  virtual Roe<void> ltsFromJson(const nlohmann::json &jd) = 0;

protected:
  Chain &getChain() const { return chain_; }

  /** Native value currently held at this contract's address */
  int64_t getHeldValue() const;

  void emit(const std::string &name, nlohmann::json args);

private:
  Chain &chain_;
  Address address_;
};

} // namespace pl

#endif // POOL_LEDGER_CONTRACT_H
