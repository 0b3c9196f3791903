#include "Scenario.h"
#include "../contract/ValueTransfer.h"
#include "../ledger/Types.hpp"
#include "../lib/Utilities.h"

#include <limits>

namespace pl {

nlohmann::json Scenario::Config::ltsToJson() const {
  nlohmann::json jd;
  jd["logLevel"] = logLevel;
  jd["logFile"] = logFile;
  jd["minimumDeposit"] = minimumDeposit;
  return jd;
}

Scenario::Roe<void> Scenario::Config::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_SCRIPT, "Configuration must be a JSON object");
  }
  if (jd.contains("logLevel")) {
    if (!jd["logLevel"].is_string()) {
      return Error(E_SCRIPT, "Configuration 'logLevel' must be a string");
    }
    logging::Level level;
    if (!logging::levelFromString(jd["logLevel"].get<std::string>(), level)) {
      return Error(E_SCRIPT, "Unknown log level: " +
                                 jd["logLevel"].get<std::string>());
    }
    logLevel = jd["logLevel"].get<std::string>();
  }
  if (jd.contains("logFile")) {
    if (!jd["logFile"].is_string()) {
      return Error(E_SCRIPT, "Configuration 'logFile' must be a string");
    }
    logFile = jd["logFile"].get<std::string>();
  }
  if (jd.contains("minimumDeposit")) {
    if (!jd["minimumDeposit"].is_number_integer() ||
        jd["minimumDeposit"].get<int64_t>() < 0) {
      return Error(E_SCRIPT,
                   "Configuration 'minimumDeposit' must be a non-negative integer");
    }
    minimumDeposit = jd["minimumDeposit"].get<int64_t>();
  }
  return {};
}

nlohmann::json Scenario::StepResult::ltsToJson() const {
  nlohmann::json jd;
  jd["index"] = index;
  jd["op"] = op;
  jd["ok"] = ok;
  if (!ok) {
    jd["code"] = code;
    jd["message"] = message;
  }
  return jd;
}

Scenario::Scenario() : Scenario(Config()) {}

Scenario::Scenario(const Config &config)
    : Module("pool.scenario"), config_(config) {}

Scenario::Roe<Address> Scenario::resolve(const std::string &name) const {
  if (name.empty()) {
    return Error(E_SCRIPT, "Empty account name");
  }
  auto bankIt = mBanks_.find(name);
  if (bankIt != mBanks_.end()) {
    return bankIt->second->getAddress();
  }
  auto adminIt = mAdmins_.find(name);
  if (adminIt != mAdmins_.end()) {
    return adminIt->second->getAddress();
  }
  if (name.size() > 2 && name[0] == '0' && (name[1] == 'x' || name[1] == 'X')) {
    auto address = Address::fromHex(name);
    if (!address) {
      return Error(E_SCRIPT, address.error().message);
    }
    return *address;
  }
  return Address::fromName(name);
}

std::shared_ptr<Bank> Scenario::getBank(const std::string &name) const {
  auto it = mBanks_.find(name);
  return it == mBanks_.end() ? nullptr : it->second;
}

std::shared_ptr<Admin> Scenario::getAdmin(const std::string &name) const {
  auto it = mAdmins_.find(name);
  return it == mAdmins_.end() ? nullptr : it->second;
}

std::string Scenario::nameOf(const Address &address) const {
  for (const auto &[name, spBank] : mBanks_) {
    if (spBank->getAddress() == address) {
      return name;
    }
  }
  for (const auto &[name, spAdmin] : mAdmins_) {
    if (spAdmin->getAddress() == address) {
      return name;
    }
  }
  for (const auto &[name, account] : mAccounts_) {
    if (account == address) {
      return name;
    }
  }
  return address.toHex();
}

Scenario::Roe<void> Scenario::load(const nlohmann::json &script) {
  if (!script.is_object()) {
    return Error(E_SCRIPT, "Script must be a JSON object");
  }

  if (script.contains("accounts")) {
    if (!script["accounts"].is_object()) {
      return Error(E_SCRIPT, "'accounts' must be an object of name: amount");
    }
    for (const auto &[name, amount] : script["accounts"].items()) {
      auto address = resolve(name);
      if (!address) {
        return address.error();
      }
      auto value = amountField(script["accounts"], name.c_str());
      if (!value) {
        return value.error();
      }
      auto minted = chain_.mint(*address, *value);
      if (!minted) {
        return Error(minted.error().code,
                     "Funding " + name + " failed: " + minted.error().message);
      }
      mAccounts_[name] = *address;
    }
  }

  for (const auto &jBank : script.value("banks", nlohmann::json::array())) {
    if (!jBank.is_object() || !jBank.contains("name") ||
        !jBank["name"].is_string()) {
      return Error(E_SCRIPT, "Each bank needs a 'name'");
    }
    std::string name = jBank["name"].get<std::string>();
    if (mBanks_.count(name) || mAdmins_.count(name)) {
      return Error(E_SCRIPT, "Duplicate contract name: " + name);
    }
    auto deployer = field(jBank, "deployer");
    if (!deployer) {
      return deployer.error();
    }

    Bank::MinimumDepositPolicy policy = Bank::unrestricted();
    if (jBank.value("enforceMinimum", false)) {
      int64_t floor = config_.minimumDeposit;
      if (jBank.contains("minimumDeposit")) {
        auto custom = amountField(jBank, "minimumDeposit");
        if (!custom) {
          return custom.error();
        }
        floor = *custom;
      }
      policy = Bank::enforcedFloor(floor);
    }
    mBanks_[name] = chain_.deploy<Bank>(*deployer, policy);
    log().info << "Bank '" << name << "' deployed at "
               << mBanks_[name]->getAddress();
  }

  for (const auto &jAdmin : script.value("admins", nlohmann::json::array())) {
    if (!jAdmin.is_object() || !jAdmin.contains("name") ||
        !jAdmin["name"].is_string()) {
      return Error(E_SCRIPT, "Each admin needs a 'name'");
    }
    std::string name = jAdmin["name"].get<std::string>();
    if (mBanks_.count(name) || mAdmins_.count(name)) {
      return Error(E_SCRIPT, "Duplicate contract name: " + name);
    }
    auto deployer = field(jAdmin, "deployer");
    if (!deployer) {
      return deployer.error();
    }
    mAdmins_[name] = chain_.deploy<Admin>(*deployer);
    log().info << "Admin '" << name << "' deployed at "
               << mAdmins_[name]->getAddress();
  }

  if (script.contains("steps")) {
    if (!script["steps"].is_array()) {
      return Error(E_SCRIPT, "'steps' must be an array");
    }
    for (const auto &step : script["steps"]) {
      if (!step.is_object() || !step.contains("op") || !step["op"].is_string()) {
        return Error(E_SCRIPT, "Each step needs an 'op'");
      }
      steps_.push_back(step);
    }
  }
  return {};
}

const std::vector<Scenario::StepResult> &Scenario::run() {
  for (size_t i = results_.size(); i < steps_.size(); ++i) {
    const auto &step = steps_[i];
    StepResult result;
    result.index = i;
    result.op = step["op"].get<std::string>();

    auto outcome = chain_.execute([&]() { return runStep(step); });
    result.ok = outcome.isOk();
    if (!outcome) {
      result.code = outcome.error().code;
      result.message = outcome.error().message;
      log().info << "Step " << i << " (" << result.op
                 << ") rejected: " << result.message;
    } else {
      log().debug << "Step " << i << " (" << result.op << ") ok";
    }
    results_.push_back(result);
  }
  return results_;
}

Contract::Roe<void> Scenario::runStep(const nlohmann::json &step) {
  const std::string op = step["op"].get<std::string>();
  auto fail = [](const Error &e) { return Contract::Error(e.code, e.message); };

  if (op == "deposit") {
    auto from = field(step, "from");
    auto bank = bankField(step, "bank");
    auto amount = amountField(step, "amount");
    if (!from) return fail(from.error());
    if (!bank) return fail(bank.error());
    if (!amount) return fail(amount.error());
    return vt::sendValue(chain_, *from, (*bank)->getAddress(), *amount);
  }

  if (op == "withdraw") {
    auto caller = field(step, "caller");
    auto bank = bankField(step, "bank");
    auto amount = amountField(step, "amount");
    if (!caller) return fail(caller.error());
    if (!bank) return fail(bank.error());
    if (!amount) return fail(amount.error());
    return (*bank)->withdraw(*caller, *amount);
  }

  if (op == "transferAuthority") {
    auto caller = field(step, "caller");
    auto bank = bankField(step, "bank");
    auto to = field(step, "to");
    if (!caller) return fail(caller.error());
    if (!bank) return fail(bank.error());
    if (!to) return fail(to.error());
    return (*bank)->transferAuthority(*caller, *to);
  }

  if (op == "adminWithdraw") {
    auto caller = field(step, "caller");
    auto admin = adminField(step, "admin");
    auto target = field(step, "target");
    auto amount = amountField(step, "amount");
    if (!caller) return fail(caller.error());
    if (!admin) return fail(admin.error());
    if (!target) return fail(target.error());
    if (!amount) return fail(amount.error());
    return (*admin)->adminWithdraw(*caller, *target, *amount);
  }

  if (op == "batchAdminWithdraw") {
    auto caller = field(step, "caller");
    auto admin = adminField(step, "admin");
    if (!caller) return fail(caller.error());
    if (!admin) return fail(admin.error());
    if (!step.contains("targets") || !step["targets"].is_array() ||
        !step.contains("amounts") || !step["amounts"].is_array()) {
      return Contract::Error(E_SCRIPT,
                             "batchAdminWithdraw needs 'targets' and 'amounts'");
    }
    std::vector<Address> targets;
    for (const auto &jTarget : step["targets"]) {
      if (!jTarget.is_string()) {
        return Contract::Error(E_SCRIPT, "Batch targets must be names");
      }
      auto target = resolve(jTarget.get<std::string>());
      if (!target) return fail(target.error());
      targets.push_back(*target);
    }
    std::vector<int64_t> amounts;
    for (const auto &jAmount : step["amounts"]) {
      if (!jAmount.is_number_integer()) {
        return Contract::Error(E_SCRIPT, "Batch amounts must be integers");
      }
      // Saturate; the admin clamps each request to the target's pool
      if (jAmount.is_number_unsigned() &&
          jAmount.get<uint64_t>() >
              static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        amounts.push_back(std::numeric_limits<int64_t>::max());
        continue;
      }
      amounts.push_back(jAmount.get<int64_t>());
    }
    return (*admin)->batchAdminWithdraw(*caller, targets, amounts);
  }

  if (op == "withdrawToOwner") {
    auto caller = field(step, "caller");
    auto admin = adminField(step, "admin");
    auto amount = amountField(step, "amount");
    if (!caller) return fail(caller.error());
    if (!admin) return fail(admin.error());
    if (!amount) return fail(amount.error());
    return (*admin)->withdrawToOwner(*caller, *amount);
  }

  if (op == "emergencyWithdrawAll") {
    auto caller = field(step, "caller");
    auto admin = adminField(step, "admin");
    if (!caller) return fail(caller.error());
    if (!admin) return fail(admin.error());
    return (*admin)->emergencyWithdrawAll(*caller);
  }

  if (op == "transferOwnership") {
    auto caller = field(step, "caller");
    auto admin = adminField(step, "admin");
    auto to = field(step, "to");
    if (!caller) return fail(caller.error());
    if (!admin) return fail(admin.error());
    if (!to) return fail(to.error());
    return (*admin)->transferOwnership(*caller, *to);
  }

  return Contract::Error(E_SCRIPT, "Unknown operation: " + op);
}

Scenario::Roe<Address> Scenario::field(const nlohmann::json &step,
                                       const char *key) const {
  if (!step.contains(key) || !step[key].is_string()) {
    return Error(E_SCRIPT, std::string("Missing name field '") + key + "'");
  }
  return resolve(step[key].get<std::string>());
}

Scenario::Roe<int64_t> Scenario::amountField(const nlohmann::json &step,
                                             const char *key) const {
  if (!step.contains(key)) {
    return Error(E_SCRIPT, std::string("Missing amount field '") + key + "'");
  }
  const auto &value = step[key];
  if (value.is_number_unsigned() &&
      value.get<uint64_t>() >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return Error(E_SCRIPT, std::string("Field '") + key + "' is out of range");
  }
  if (value.is_number_integer()) {
    return value.get<int64_t>();
  }
  int64_t parsed = 0;
  // Large amounts may be written as decimal strings
  if (value.is_string() && utl::parseInt64(value.get<std::string>(), parsed)) {
    return parsed;
  }
  return Error(E_SCRIPT, std::string("Field '") + key + "' is not an integer");
}

Scenario::Roe<std::shared_ptr<Bank>>
Scenario::bankField(const nlohmann::json &step, const char *key) const {
  if (!step.contains(key) || !step[key].is_string()) {
    return Error(E_SCRIPT, std::string("Missing bank field '") + key + "'");
  }
  auto spBank = getBank(step[key].get<std::string>());
  if (!spBank) {
    return Error(E_NOT_FOUND, "Unknown bank: " + step[key].get<std::string>());
  }
  return spBank;
}

Scenario::Roe<std::shared_ptr<Admin>>
Scenario::adminField(const nlohmann::json &step, const char *key) const {
  if (!step.contains(key) || !step[key].is_string()) {
    return Error(E_SCRIPT, std::string("Missing admin field '") + key + "'");
  }
  auto spAdmin = getAdmin(step[key].get<std::string>());
  if (!spAdmin) {
    return Error(E_NOT_FOUND, "Unknown admin: " + step[key].get<std::string>());
  }
  return spAdmin;
}

nlohmann::json Scenario::report() const {
  nlohmann::json jd;

  nlohmann::json steps = nlohmann::json::array();
  for (const auto &result : results_) {
    steps.push_back(result.ltsToJson());
  }
  jd["steps"] = steps;

  nlohmann::json accounts = nlohmann::json::object();
  for (const auto &[name, address] : mAccounts_) {
    accounts[name] = chain_.getBalance(address);
  }
  jd["accounts"] = accounts;

  nlohmann::json banks = nlohmann::json::object();
  for (const auto &[name, spBank] : mBanks_) {
    nlohmann::json jBank;
    jBank["address"] = spBank->getAddress().toHex();
    jBank["authority"] = nameOf(spBank->getAuthority());
    jBank["pooled"] = spBank->getPooledBalance();
    jBank["minimumDeposit"] = spBank->getMinimumDeposit();
    nlohmann::json board = nlohmann::json::array();
    for (const auto &standing : spBank->getLeaderboard()) {
      nlohmann::json entry;
      entry["account"] = standing.account.isZero()
                             ? std::string()
                             : nameOf(standing.account);
      entry["amount"] = standing.amount;
      board.push_back(entry);
    }
    jBank["leaderboard"] = board;
    banks[name] = jBank;
  }
  jd["banks"] = banks;

  nlohmann::json admins = nlohmann::json::object();
  for (const auto &[name, spAdmin] : mAdmins_) {
    nlohmann::json jAdmin;
    jAdmin["address"] = spAdmin->getAddress().toHex();
    jAdmin["owner"] = nameOf(spAdmin->getOwner());
    jAdmin["balance"] = spAdmin->getBalance();
    admins[name] = jAdmin;
  }
  jd["admins"] = admins;

  nlohmann::json events = nlohmann::json::array();
  for (const auto &event : chain_.getEvents()) {
    nlohmann::json jEvent = event.ltsToJson();
    jEvent["emitter"] = nameOf(event.emitter);
    events.push_back(jEvent);
  }
  jd["events"] = events;
  return jd;
}

} // namespace pl
