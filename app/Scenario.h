#ifndef POOL_LEDGER_SCENARIO_H
#define POOL_LEDGER_SCENARIO_H

#include "../chain/Chain.h"
#include "../contract/Admin.h"
#include "../contract/Bank.h"
#include "../ledger/Address.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace pl {

/**
 * Scenario - replays a JSON script against a fresh Chain.
 *
 * Script layout:
 *   {
 *     "accounts": { "alice": 100, ... },              // genesis funding
 *     "banks":  [ { "name": "bank", "deployer": "alice",
 *                   "enforceMinimum": false, "minimumDeposit": 0 } ],
 *     "admins": [ { "name": "admin", "deployer": "carol" } ],
 *     "steps":  [ { "op": "deposit", "from": "alice", "bank": "bank",
 *                   "amount": 5 }, ... ]
 *   }
 *
 * Names resolve to deployed contracts first, then "0x" hex, then to the
 * identifier derived from the name. Each step runs atomically; a failed
 * step is recorded and the run continues.
 */
class Scenario : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_SCRIPT = 100;

  struct Config {
    std::string logLevel{ "info" };
    std::string logFile;
    int64_t minimumDeposit{ Bank::DEFAULT_MINIMUM_DEPOSIT };

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  struct StepResult {
    size_t index{ 0 };
    std::string op;
    bool ok{ false };
    int32_t code{ 0 };
    std::string message;

    nlohmann::json ltsToJson() const;
  };

  Scenario();
  explicit Scenario(const Config &config);
  ~Scenario() override = default;

  /** Fund accounts and deploy contracts; steps are kept for run() */
  Roe<void> load(const nlohmann::json &script);

  /** Execute every loaded step in order */
  const std::vector<StepResult> &run();

  nlohmann::json report() const;

  Roe<Address> resolve(const std::string &name) const;
  std::shared_ptr<Bank> getBank(const std::string &name) const;
  std::shared_ptr<Admin> getAdmin(const std::string &name) const;
  Chain &getChain() { return chain_; }

private:
  Contract::Roe<void> runStep(const nlohmann::json &step);

  Roe<Address> field(const nlohmann::json &step, const char *key) const;
  Roe<int64_t> amountField(const nlohmann::json &step, const char *key) const;
  Roe<std::shared_ptr<Bank>> bankField(const nlohmann::json &step,
                                       const char *key) const;
  Roe<std::shared_ptr<Admin>> adminField(const nlohmann::json &step,
                                         const char *key) const;
  std::string nameOf(const Address &address) const;

  Config config_;
  Chain chain_;
  std::map<std::string, std::shared_ptr<Bank>> mBanks_;
  std::map<std::string, std::shared_ptr<Admin>> mAdmins_;
  std::map<std::string, Address> mAccounts_;
  std::vector<nlohmann::json> steps_;
  std::vector<StepResult> results_;
};

} // namespace pl

#endif // POOL_LEDGER_SCENARIO_H
