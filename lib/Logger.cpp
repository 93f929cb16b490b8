#include "Logger.h"

#include <algorithm>
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

  std::tm tmBuf{};
  gmtime_r(&time, &tmBuf);
  std::stringstream ss;
  ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
  return ss.str();
}

// Caller holds the registry mutex
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
        lastDot == std::string::npos ? std::string() : name.substr(0, lastDot);
    parent = &getOrCreateLocked(parentName);
  }

  auto spLogger = std::make_unique<Logger>(name, parent);
  Logger &ref = *spLogger;
  if (name.empty()) {
    ref.addHandler(std::make_shared<ConsoleHandler>());
  }
  registry.emplace(name, std::move(spLogger));
  return ref;
}

} // namespace

const char *levelToString(Level level) {
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

bool parseLevel(const std::string &name, Level &level) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "DEBUG") {
    level = Level::DEBUG;
  } else if (upper == "INFO") {
    level = Level::INFO;
  } else if (upper == "WARNING" || upper == "WARN") {
    level = Level::WARNING;
  } else if (upper == "ERROR") {
    level = Level::ERROR;
  } else if (upper == "CRITICAL") {
    level = Level::CRITICAL;
  } else {
    return false;
  }
  return true;
}

// ConsoleHandler implementation
void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  if (level >= Level::WARNING) {
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
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_ << message << std::endl;
    file_.flush();
  }
}

// MemoryHandler implementation
void MemoryHandler::emit(Level level, const std::string &loggerName,
                         const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  lines_.push_back(message);
}

std::vector<std::string> MemoryHandler::getLines() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lines_;
}

void MemoryHandler::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  lines_.clear();
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

// ========== Logger Implementation ==========

Logger::Logger(const std::string &fullName, Logger *parent)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), fullName_(fullName), parent_(parent) {}

void Logger::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

Level Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void Logger::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(std::move(spHandler));
}

void Logger::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void Logger::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void Logger::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool Logger::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

void Logger::log(Level level, const std::string &message) {
  if (!isEnabledFor(level)) {
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
  std::vector<std::shared_ptr<Handler>> handlers;
  bool propagate = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers = spHandlers_;
    propagate = propagate_;
  }

  for (auto &spHandler : handlers) {
    spHandler->emit(level, originName, formatted);
  }

  if (propagate && parent_) {
    parent_->dispatch(level, originName, formatted);
  }
}

// ========== Global logger management ==========

Logger &getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return getOrCreateLocked(trimLeadingDot(name));
}

Logger &getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace pl
