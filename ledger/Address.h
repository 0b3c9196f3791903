#ifndef POOL_LEDGER_ADDRESS_H
#define POOL_LEDGER_ADDRESS_H

#include "../lib/ResultOrError.hpp"

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace pl {

/**
 * Opaque 20-byte account identifier. The all-zero value is reserved and
 * never names a real account.
 */
class Address {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr size_t SIZE = 20;

  Address() = default;

  static Address zero() { return Address(); }

  /** Parse "0x"-prefixed or bare 40-character hex */
  static Roe<Address> fromHex(const std::string &hex);

  /** Identifier derived from a human-readable name: sha256(name)[0..20) */
  static Address fromName(const std::string &name);

  /** Identifier of the contract created by deployer with the given nonce */
  static Address derive(const Address &deployer, uint64_t nonce);

  bool isZero() const;
  std::string toHex() const;

  bool operator==(const Address &other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Address &other) const { return bytes_ != other.bytes_; }
  bool operator<(const Address &other) const { return bytes_ < other.bytes_; }

private:
  static Address fromDigest(const std::string &digest);

  std::array<uint8_t, SIZE> bytes_{};
};

std::ostream &operator<<(std::ostream &os, const Address &address);

} // namespace pl

#endif // POOL_LEDGER_ADDRESS_H
