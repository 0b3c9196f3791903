#ifndef POOL_LEDGER_MODULE_H
#define POOL_LEDGER_MODULE_H

#include "Logger.h"
#include <string>

namespace pl {

/**
 * Base class for components that log through a named logger.
 */
class Module {
public:
  /**
   * @param name Hierarchical logger name (e.g. "pool.bank")
   */
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Redirect this module's logger output under another logger
   * @param targetLoggerName Name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);
  void clearLoggerRedirect();

  const std::string &getLoggerName() const;

  /**
   * Logger bound to this module; use as log().info << "...".
   */
  logging::Logger &log() const;

private:
  std::string loggerName_;
};

} // namespace pl

#endif // POOL_LEDGER_MODULE_H
