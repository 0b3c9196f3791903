#ifndef POOL_LEDGER_LEADERBOARD_H
#define POOL_LEDGER_LEADERBOARD_H

#include "Address.h"
#include "Ledger.h"
#include "../lib/ResultOrError.hpp"

#include <array>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>

namespace pl {

/**
 * Leaderboard - the CAPACITY largest depositors of a Ledger, best first.
 *
 * Only identifiers are stored; balances are read from the Ledger whenever
 * the order is evaluated. Filled slots always form a prefix and are never
 * emptied again. Among equal balances the account that was ranked first
 * keeps the better position, on both the re-sort and the insertion path.
 */
class Leaderboard {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr size_t CAPACITY = 3;

  struct Standing {
    Address account; // zero address for an unfilled slot
    int64_t amount{ 0 };
  };

  Leaderboard() = default;
  ~Leaderboard() = default;

  /**
   * Re-rank after account's balance changed in ledger. Must be called after
   * every deposit for the depositing account.
   */
  void update(const Ledger &ledger, const Address &account);

  /** Full ranked view with live balances; unfilled slots report zero. */
  std::array<Standing, CAPACITY> getStandings(const Ledger &ledger) const;

  /** 1-based rank, or 0 if account is not ranked */
  uint32_t getRank(const Address &account) const;

  bool contains(const Address &account) const;
  size_t getFilledCount() const;
  const std::optional<Address> &getSlot(size_t index) const;

  nlohmann::json ltsToJson() const;
  Roe<void> ltsFromJson(const nlohmann::json &jd);

private:
  void resort(const Ledger &ledger);

  std::array<std::optional<Address>, CAPACITY> slots_;
};

} // namespace pl

#endif // POOL_LEDGER_LEADERBOARD_H
