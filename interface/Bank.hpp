#pragma once

#include "../chain/Contract.h"
#include "../ledger/Address.h"

#include <cstdint>

namespace pl {
namespace iii {

/**
 * Surface of a pooled-balance contract as seen by a delegated withdrawer.
 * Nothing reported through it is trusted: callers re-check the effect of
 * withdraw() against the value they actually received.
 */
class Bank {
public:
  virtual ~Bank() = default;

  virtual int64_t getPooledBalance() const = 0;
  virtual Address getAuthority() const = 0;

  /** Authority-gated: pay amount out of the pool to caller */
  virtual Contract::Roe<void> withdraw(const Address &caller, int64_t amount) = 0;
};

} // namespace iii
} // namespace pl
