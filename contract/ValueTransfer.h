#ifndef POOL_LEDGER_VALUE_TRANSFER_H
#define POOL_LEDGER_VALUE_TRANSFER_H

#include "../chain/Chain.h"
#include "../chain/Contract.h"
#include "../ledger/Address.h"

#include <cstdint>

namespace pl {
namespace vt {

/**
 * Move amount from `from` to `to`. A failure keeps the host's reason and
 * code, e.g. the recipient's validation error.
 */
Contract::Roe<void> sendValue(Chain &chain, const Address &from,
                              const Address &to, int64_t amount);

/**
 * Move amount from `from` to `to`, reporting any failure as E_TRANSPORT.
 * Used for payouts, where the payer cannot act on the recipient's reason.
 */
Contract::Roe<void> transferValue(Chain &chain, const Address &from,
                                  const Address &to, int64_t amount);

} // namespace vt
} // namespace pl

#endif // POOL_LEDGER_VALUE_TRANSFER_H
