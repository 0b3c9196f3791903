#ifndef POOL_LEDGER_LOGGER_H
#define POOL_LEDGER_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace pl {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

std::string levelToString(Level level);
bool levelFromString(const std::string &str, Level &level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &loggerName,
                    const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

class ConsoleHandler : public Handler {
public:
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  ~FileHandler() override;
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;

private:
  std::ofstream file_;
  std::string filename_;
};

class Logger;

class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;
  LogStream(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
  bool moved_;
};

class LogProxy {
public:
  LogProxy(Logger *logger, Level level) : logger_(logger), level_(level) {}

  template <typename T> LogStream operator<<(const T &value) {
    LogStream stream(logger_, level_);
    stream << value;
    return stream;
  }

private:
  Logger *logger_;
  Level level_;
};

/**
 * Named logger in a dot-separated hierarchy ("pool.bank" is a child of
 * "pool"). Loggers are owned by a process-wide registry and obtained by
 * reference through getLogger(); they are never destroyed before exit.
 */
class Logger {
public:
  explicit Logger(const std::string &fullName, Logger *parent);
  ~Logger() = default;

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  // Stream-style logging: log.info << "message " << value;
  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level);
  void clearLevel();

  /** Own level if set, else the parent's (or redirect target's); DEBUG at the root */
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG);

  // Control propagation of records to the parent (or redirect target)
  void setPropagate(bool propagate);
  bool getPropagate() const;

  /**
   * Send this logger's records to another logger instead of its natural
   * parent. Throws std::invalid_argument on self or circular redirection.
   */
  void redirectTo(const std::string &targetLoggerName);
  void clearRedirect();

  const std::string &getFullName() const { return fullName_; }
  std::string getName() const;
  Logger *getParent() const;

private:
  friend class LogStream;

  void log(Level level, const std::string &message);
  void dispatch(Level level, const std::string &originName,
                const std::string &formatted);

  std::string fullName_;
  Logger *parent_;
  Logger *redirect_{ nullptr };
  std::optional<Level> level_;
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

Logger &getLogger(const std::string &name);
Logger &getRootLogger();

} // namespace logging
} // namespace pl

#endif // POOL_LEDGER_LOGGER_H
