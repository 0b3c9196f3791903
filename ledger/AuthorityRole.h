#ifndef POOL_LEDGER_AUTHORITY_ROLE_H
#define POOL_LEDGER_AUTHORITY_ROLE_H

#include "Address.h"
#include "../lib/ResultOrError.hpp"

#include <string>

namespace pl {

/**
 * AuthorityRole - the single identifier allowed to run gated operations.
 * Transfer is immediate and single-step.
 */
class AuthorityRole {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  /**
   * @param holder Initial holder (the deployer)
   * @param roleName Used in error messages, e.g. "authority" or "owner"
   */
  AuthorityRole(const Address &holder, const std::string &roleName);

  const Address &getHolder() const { return holder_; }
  bool isHolder(const Address &caller) const { return caller == holder_; }

  /** Authorization error unless caller is the current holder */
  Roe<void> require(const Address &caller) const;

  /**
   * Hand the role to newHolder. Only the current holder may do this; the
   * zero identifier and the current holder are rejected.
   * @return The previous holder
   */
  Roe<Address> transfer(const Address &caller, const Address &newHolder);

  /** Overwrite the holder without checks; used when restoring state */
  void restore(const Address &holder) { holder_ = holder; }

private:
  Address holder_;
  std::string roleName_;
};

} // namespace pl

#endif // POOL_LEDGER_AUTHORITY_ROLE_H
