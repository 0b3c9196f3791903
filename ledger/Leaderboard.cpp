#include "Leaderboard.h"
#include "Types.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace pl {

void Leaderboard::update(const Ledger &ledger, const Address &account) {
  int64_t balance = ledger.getBalance(account);
  if (account.isZero() || balance <= 0) {
    return;
  }

  if (contains(account)) {
    resort(ledger);
    return;
  }

  for (auto &slot : slots_) {
    if (!slot) {
      slot = account;
      resort(ledger);
      return;
    }
  }

  // Full: take the first position held by a strictly smaller balance and
  // push everything from there one step down, dropping the last entry.
  for (size_t i = 0; i < CAPACITY; ++i) {
    if (ledger.getBalance(*slots_[i]) < balance) {
      for (size_t j = CAPACITY - 1; j > i; --j) {
        slots_[j] = slots_[j - 1];
      }
      slots_[i] = account;
      return;
    }
  }
}

void Leaderboard::resort(const Ledger &ledger) {
  std::vector<Address> filled;
  for (const auto &slot : slots_) {
    if (slot) {
      filled.push_back(*slot);
    }
  }

  // stable: equal balances keep their current relative order
  std::stable_sort(filled.begin(), filled.end(),
                   [&ledger](const Address &a, const Address &b) {
                     return ledger.getBalance(a) > ledger.getBalance(b);
                   });

  for (size_t i = 0; i < CAPACITY; ++i) {
    if (i < filled.size()) {
      slots_[i] = filled[i];
    } else {
      slots_[i].reset();
    }
  }
}

std::array<Leaderboard::Standing, Leaderboard::CAPACITY>
Leaderboard::getStandings(const Ledger &ledger) const {
  std::array<Standing, CAPACITY> standings;
  for (size_t i = 0; i < CAPACITY; ++i) {
    if (slots_[i]) {
      standings[i].account = *slots_[i];
      standings[i].amount = ledger.getBalance(*slots_[i]);
    }
  }
  return standings;
}

uint32_t Leaderboard::getRank(const Address &account) const {
  if (account.isZero()) {
    return 0;
  }
  for (size_t i = 0; i < CAPACITY; ++i) {
    if (slots_[i] && *slots_[i] == account) {
      return static_cast<uint32_t>(i + 1);
    }
  }
  return 0;
}

bool Leaderboard::contains(const Address &account) const {
  return getRank(account) != 0;
}

size_t Leaderboard::getFilledCount() const {
  return std::count_if(slots_.begin(), slots_.end(),
                       [](const std::optional<Address> &slot) {
                         return slot.has_value();
                       });
}

const std::optional<Address> &Leaderboard::getSlot(size_t index) const {
  if (index >= CAPACITY) {
    throw std::out_of_range("Leaderboard slot index out of range");
  }
  return slots_[index];
}

nlohmann::json Leaderboard::ltsToJson() const {
  nlohmann::json jd = nlohmann::json::array();
  for (const auto &slot : slots_) {
    if (slot) {
      jd.push_back(slot->toHex());
    }
  }
  return jd;
}

Leaderboard::Roe<void> Leaderboard::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_array() || jd.size() > CAPACITY) {
    return Error(E_VALIDATION, "Leaderboard state must be an array of at most " +
                                   std::to_string(CAPACITY) + " entries");
  }

  std::array<std::optional<Address>, CAPACITY> slots;
  for (size_t i = 0; i < jd.size(); ++i) {
    if (!jd[i].is_string()) {
      return Error(E_VALIDATION, "Leaderboard entry must be a hex string");
    }
    auto address = Address::fromHex(jd[i].get<std::string>());
    if (!address) {
      return Error(address.error().code, address.error().message);
    }
    if (address->isZero()) {
      return Error(E_VALIDATION, "Leaderboard cannot hold the zero address");
    }
    for (size_t j = 0; j < i; ++j) {
      if (*slots[j] == *address) {
        return Error(E_VALIDATION, "Duplicate leaderboard entry " +
                                       address->toHex());
      }
    }
    slots[i] = *address;
  }

  slots_ = slots;
  return {};
}

} // namespace pl
