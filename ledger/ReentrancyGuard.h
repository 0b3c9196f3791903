#ifndef POOL_LEDGER_REENTRANCY_GUARD_H
#define POOL_LEDGER_REENTRANCY_GUARD_H

namespace pl {

/**
 * Scoped in-progress flag. The first guard on a flag acquires it and clears
 * it on destruction; a nested guard on the same flag is not acquired.
 *
 *   ReentrancyGuard guard(entered_);
 *   if (!guard.isAcquired()) return Error(E_REENTRANT, "...");
 */
class ReentrancyGuard {
public:
  explicit ReentrancyGuard(bool &flag) : flag_(flag), acquired_(!flag) {
    if (acquired_) {
      flag_ = true;
    }
  }

  ~ReentrancyGuard() {
    if (acquired_) {
      flag_ = false;
    }
  }

  ReentrancyGuard(const ReentrancyGuard &) = delete;
  ReentrancyGuard &operator=(const ReentrancyGuard &) = delete;

  bool isAcquired() const { return acquired_; }

private:
  bool &flag_;
  bool acquired_;
};

} // namespace pl

#endif // POOL_LEDGER_REENTRANCY_GUARD_H
