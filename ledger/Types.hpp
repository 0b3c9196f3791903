#ifndef POOL_LEDGER_TYPES_HPP
#define POOL_LEDGER_TYPES_HPP

#include <cstdint>

namespace pl {

// Error codes shared by every layer, so a rejected operation carries its
// category up through the contract and host boundaries unchanged.
constexpr int32_t E_VALIDATION = 1;     // bad amount, zero identifier, no-op, length mismatch
constexpr int32_t E_AUTHORIZATION = 2;  // caller is not the authority/owner
constexpr int32_t E_INSUFFICIENT = 3;   // amount exceeds available value
constexpr int32_t E_RECONCILIATION = 4; // received less than requested
constexpr int32_t E_TRANSPORT = 5;      // value transfer mechanism failed
constexpr int32_t E_REENTRANT = 6;      // operation already in progress
constexpr int32_t E_OVERFLOW = 7;       // balance would exceed INT64_MAX
constexpr int32_t E_NOT_FOUND = 8;      // no contract at identifier

} // namespace pl

#endif // POOL_LEDGER_TYPES_HPP
