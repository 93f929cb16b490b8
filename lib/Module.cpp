#include "Module.h"

namespace pl {

Module::Module(const std::string &name)
    : loggerName_(name), logger_(&logging::getLogger(name)) {}

void Module::setLoggerName(const std::string &name) {
  loggerName_ = name;
  logger_ = &logging::getLogger(name);
}

logging::Logger &Module::log() const { return *logger_; }

} // namespace pl
