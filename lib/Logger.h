#ifndef PAYLEDGER_LOGGER_H
#define PAYLEDGER_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace pl {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

const char *levelToString(Level level);

/**
 * Parse a level name ("DEBUG", "info", ...) as used in config files
 * @return true if the name is known
 */
bool parseLevel(const std::string &name, Level &level);

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
  std::mutex mutex_;
  std::ofstream file_;
  std::string filename_;
};

/** Collects emitted lines in memory, used by tests and diagnostics. */
class MemoryHandler : public Handler {
public:
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;

  std::vector<std::string> getLines() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::vector<std::string> lines_;
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
 * Named logger. Names are dotted paths ("ledger.store") and form a tree;
 * records propagate to the parent's handlers unless propagation is disabled.
 * Loggers live in a global registry and are handed out by reference.
 */
class Logger {
public:
  Logger(const std::string &fullName, Logger *parent);
  ~Logger() = default;

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level);
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG);
  void clearHandlers();

  void setPropagate(bool propagate);
  bool getPropagate() const;

  const std::string &getFullName() const { return fullName_; }
  Logger *getParent() const { return parent_; }

  bool isEnabledFor(Level level) const { return level >= getLevel(); }

  void log(Level level, const std::string &message);

private:
  void dispatch(Level level, const std::string &originName,
                const std::string &formatted);

  std::string fullName_;
  Logger *parent_;
  Level level_{ Level::DEBUG };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

/** Get (creating on first use) the logger registered under a dotted name. */
Logger &getLogger(const std::string &name);
Logger &getRootLogger();

/** Name of the operational audit channel. */
constexpr const char *AUDIT_LOGGER = "audit";

inline Logger &getAuditLogger() { return getLogger(AUDIT_LOGGER); }

} // namespace logging
} // namespace pl

#endif // PAYLEDGER_LOGGER_H
