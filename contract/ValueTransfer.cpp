#include "ValueTransfer.h"
#include "../ledger/Types.hpp"

namespace pl {
namespace vt {

Contract::Roe<void> sendValue(Chain &chain, const Address &from,
                              const Address &to, int64_t amount) {
  auto result = chain.sendValue(from, to, amount);
  if (!result) {
    return Contract::Error(result.error().code, result.error().message);
  }
  return {};
}

Contract::Roe<void> transferValue(Chain &chain, const Address &from,
                                  const Address &to, int64_t amount) {
  auto result = chain.sendValue(from, to, amount);
  if (!result) {
    return Contract::Error(E_TRANSPORT, "Value transfer to " + to.toHex() +
                                            " failed: " +
                                            result.error().message);
  }
  return {};
}

} // namespace vt
} // namespace pl
