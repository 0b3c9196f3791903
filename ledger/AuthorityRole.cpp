#include "AuthorityRole.h"
#include "Types.hpp"

namespace pl {

AuthorityRole::AuthorityRole(const Address &holder, const std::string &roleName)
    : holder_(holder), roleName_(roleName) {}

AuthorityRole::Roe<void> AuthorityRole::require(const Address &caller) const {
  if (caller != holder_) {
    return Error(E_AUTHORIZATION,
                 "Caller " + caller.toHex() + " is not the " + roleName_);
  }
  return {};
}

AuthorityRole::Roe<Address> AuthorityRole::transfer(const Address &caller,
                                                    const Address &newHolder) {
  auto auth = require(caller);
  if (!auth) {
    return auth.error();
  }
  if (newHolder.isZero()) {
    return Error(E_VALIDATION, "New " + roleName_ + " cannot be the zero address");
  }
  if (newHolder == holder_) {
    return Error(E_VALIDATION, "New " + roleName_ + " is already the " + roleName_);
  }

  Address previous = holder_;
  holder_ = newHolder;
  return previous;
}

} // namespace pl
