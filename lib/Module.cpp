#include "Module.h"

namespace pl {

Module::Module(const std::string &name) : loggerName_(name) {}

void Module::redirectLogger(const std::string &targetLoggerName) {
  log().redirectTo(targetLoggerName);
}

void Module::clearLoggerRedirect() { log().clearRedirect(); }

const std::string &Module::getLoggerName() const { return loggerName_; }

logging::Logger &Module::log() const { return logging::getLogger(loggerName_); }

} // namespace pl
