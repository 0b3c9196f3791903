#include "Scenario.h"
#include "../ledger/Address.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

static int runScenario(const std::string &scriptPath,
                       const std::string &configPath,
                       const std::string &outPath, bool debug) {
  pl::Scenario::Config config;
  if (!configPath.empty()) {
    auto jConfig = pl::utl::loadJsonFile(configPath);
    if (!jConfig) {
      std::cerr << "Error: " << jConfig.error().message << "\n";
      return 1;
    }
    auto parsed = config.ltsFromJson(*jConfig);
    if (!parsed) {
      std::cerr << "Error: " << parsed.error().message << "\n";
      return 1;
    }
  }

  auto &rootLogger = pl::logging::getRootLogger();
  pl::logging::Level level = pl::logging::Level::INFO;
  if (!pl::logging::levelFromString(config.logLevel, level)) {
    std::cerr << "Error: Unknown log level: " << config.logLevel << "\n";
    return 1;
  }
  rootLogger.setLevel(debug ? pl::logging::Level::DEBUG : level);
  if (!config.logFile.empty()) {
    rootLogger.addFileHandler(config.logFile, pl::logging::Level::DEBUG);
  }

  auto jScript = pl::utl::loadJsonFile(scriptPath);
  if (!jScript) {
    std::cerr << "Error: " << jScript.error().message << "\n";
    return 1;
  }

  pl::Scenario scenario(config);
  auto loaded = scenario.load(*jScript);
  if (!loaded) {
    std::cerr << "Error: " << loaded.error().message << "\n";
    return 1;
  }

  const auto &results = scenario.run();
  size_t failed = 0;
  for (const auto &result : results) {
    if (!result.ok) {
      ++failed;
    }
  }

  std::string report = scenario.report().dump(2);
  if (outPath.empty()) {
    std::cout << report << "\n";
  } else {
    auto written = pl::utl::writeToFile(outPath, report + "\n");
    if (!written) {
      std::cerr << "Error: " << written.error().message << "\n";
      return 1;
    }
    std::cout << "Report written to " << outPath << "\n";
  }

  rootLogger.info << "Ran " << results.size() << " steps, " << failed
                  << " rejected";
  return 0;
}

int main(int argc, char *argv[]) {
  CLI::App app{"pool-ledger - pooled balance ledger with a top-3 leaderboard "
               "and delegated withdrawals"};
  app.require_subcommand(1);

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  auto *run_cmd = app.add_subcommand("run", "Replay a JSON scenario script");
  std::string scriptPath;
  std::string configPath;
  std::string outPath;
  run_cmd->add_option("-s,--script", scriptPath, "Scenario script (JSON)")
      ->required()
      ->check(CLI::ExistingFile);
  run_cmd->add_option("-c,--config", configPath, "Run configuration (JSON)")
      ->check(CLI::ExistingFile);
  run_cmd->add_option("-o,--out", outPath,
                      "Write the report here instead of stdout");

  auto *address_cmd =
      app.add_subcommand("address", "Print the identifier derived from a name");
  std::string name;
  address_cmd->add_option("name", name, "Account name")->required();

  CLI11_PARSE(app, argc, argv);

  if (address_cmd->parsed()) {
    std::cout << pl::Address::fromName(name) << "\n";
    return 0;
  }

  if (run_cmd->parsed()) {
    return runScenario(scriptPath, configPath, outPath, debug);
  }

  return 1;
}
