#pragma once

#include "Logger.h"
#include <string>

namespace cl {

/**
 * Base class for components that log under their own name.
 * The name is hierarchical ("civic.ledger.chain") so that a parent logger
 * controls level and handlers for a whole subsystem.
 */
class Module {
public:
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  const std::string &getLoggerName() const { return loggerName_; }

  logging::Logger &log() const { return logger_; }

private:
  std::string loggerName_;
  mutable logging::Logger logger_;
};

} // namespace cl
