#pragma once

#include "Logger.h"
#include <string>

namespace pl {

/**
 * Base class for components that log.
 * Binds the component to a named logger in the logger tree.
 */
class Module {
public:
  /**
   * @param name Dotted logger name (e.g. "ledger.store")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  const std::string &getLoggerName() const { return loggerName_; }

  /**
   * Rebind this module to another logger, e.g. a per-instance child
   * ("server.ledger" -> "server.ledger.t42") set up by the owner.
   */
  void setLoggerName(const std::string &name);

  logging::Logger &log() const;

private:
  std::string loggerName_;
  logging::Logger *logger_;
};

} // namespace pl
