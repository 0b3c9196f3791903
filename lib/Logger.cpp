#include "Logger.h"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>

namespace pl {
namespace logging {

namespace {

std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

std::map<std::string, std::unique_ptr<Logger>> &getRegistry() {
  static std::map<std::string, std::unique_ptr<Logger>> registry;
  return registry;
}

std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);
  std::stringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

// Caller must hold the registry mutex
Logger &getOrCreateLocked(const std::string &name) {
  auto &registry = getRegistry();
  auto it = registry.find(name);
  if (it != registry.end()) {
    return *it->second;
  }

  Logger *parent = nullptr;
  if (!name.empty()) {
    auto lastDot = name.rfind('.');
    std::string parentName =
        lastDot == std::string::npos ? "" : name.substr(0, lastDot);
    parent = &getOrCreateLocked(parentName);
  }

  auto spLogger = std::make_unique<Logger>(name, parent);
  if (name.empty()) {
    // Only the root writes to the console; children propagate to it
    spLogger->addHandler(std::make_shared<ConsoleHandler>());
  }
  Logger &ref = *spLogger;
  registry[name] = std::move(spLogger);
  return ref;
}

} // namespace

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

bool levelFromString(const std::string &str, Level &level) {
  static const std::map<std::string, Level> names = {
      {"debug", Level::DEBUG},     {"info", Level::INFO},
      {"warning", Level::WARNING}, {"error", Level::ERROR},
      {"critical", Level::CRITICAL}};
  std::string lower;
  for (char c : str) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  auto it = names.find(lower);
  if (it == names.end()) {
    return false;
  }
  level = it->second;
  return true;
}

// ConsoleHandler implementation
void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  if (level >= Level::ERROR) {
    std::cerr << message << std::endl;
  } else {
    std::cout << message << std::endl;
  }
}

// FileHandler implementation
FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string &loggerName,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

// LogStream implementation
LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

// Logger implementation
Logger::Logger(const std::string &fullName, Logger *parent)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), fullName_(fullName), parent_(parent) {}

void Logger::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

void Logger::clearLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  level_.reset();
}

Level Logger::getLevel() const {
  Logger *next = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_) {
      return *level_;
    }
    next = redirect_ ? redirect_ : parent_;
  }
  return next ? next->getLevel() : Level::DEBUG;
}

void Logger::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void Logger::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool Logger::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

std::string Logger::getName() const {
  auto lastDot = fullName_.rfind('.');
  if (lastDot == std::string::npos) {
    return fullName_;
  }
  return fullName_.substr(lastDot + 1);
}

Logger *Logger::getParent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return redirect_ ? redirect_ : parent_;
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  Logger &target = getLogger(targetLoggerName);
  if (&target == this) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }

  // Reject targets that already forward into this logger
  for (Logger *ancestor = &target; ancestor; ancestor = ancestor->getParent()) {
    if (ancestor == this) {
      throw std::invalid_argument("Cannot create circular logger redirection");
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  redirect_ = &target;
}

void Logger::clearRedirect() {
  std::lock_guard<std::mutex> lock(mutex_);
  redirect_ = nullptr;
}

void Logger::log(Level level, const std::string &message) {
  if (level < getLevel()) {
    return;
  }

  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!fullName_.empty()) {
    ss << "[" << fullName_ << "] ";
  }
  ss << message;
  dispatch(level, fullName_, ss.str());
}

void Logger::dispatch(Level level, const std::string &originName,
                      const std::string &formatted) {
  Logger *next = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &spHandler : spHandlers_) {
      spHandler->emit(level, originName, formatted);
    }
    if (propagate_) {
      next = redirect_ ? redirect_ : parent_;
    }
  }
  if (next) {
    next->dispatch(level, originName, formatted);
  }
}

Logger &getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return getOrCreateLocked(trimLeadingDot(name));
}

Logger &getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace pl
