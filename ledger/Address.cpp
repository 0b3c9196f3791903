#include "Address.h"
#include "Types.hpp"
#include "../lib/Utilities.h"

#include <algorithm>

namespace pl {

Address::Roe<Address> Address::fromHex(const std::string &hex) {
  std::string str = hex;
  if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
    str = str.substr(2);
  }
  if (str.size() != SIZE * 2) {
    return Error(E_VALIDATION, "Address must be " + std::to_string(SIZE * 2) +
                                   " hex characters: " + hex);
  }
  std::string raw = utl::hexDecode(str);
  if (raw.size() != SIZE) {
    return Error(E_VALIDATION, "Address is not valid hex: " + hex);
  }

  Address address;
  std::copy(raw.begin(), raw.end(), address.bytes_.begin());
  return address;
}

Address Address::fromName(const std::string &name) {
  return fromDigest(utl::sha256Digest(name));
}

Address Address::derive(const Address &deployer, uint64_t nonce) {
  std::string preimage(deployer.bytes_.begin(), deployer.bytes_.end());
  for (int i = 0; i < 8; ++i) {
    preimage.push_back(static_cast<char>((nonce >> (8 * i)) & 0xFF));
  }
  return fromDigest(utl::sha256Digest(preimage));
}

Address Address::fromDigest(const std::string &digest) {
  Address address;
  std::copy(digest.begin(), digest.begin() + SIZE, address.bytes_.begin());
  return address;
}

bool Address::isZero() const {
  return std::all_of(bytes_.begin(), bytes_.end(),
                     [](uint8_t b) { return b == 0; });
}

std::string Address::toHex() const {
  return "0x" + utl::hexEncode(std::string(bytes_.begin(), bytes_.end()));
}

std::ostream &operator<<(std::ostream &os, const Address &address) {
  return os << address.toHex();
}

} // namespace pl
