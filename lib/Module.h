#ifndef HASHVOTE_MODULE_H
#define HASHVOTE_MODULE_H

#include "Logger.h"
#include <memory>
#include <string>

namespace hv {

/**
 * Base class for modules that need logging functionality.
 * Provides a common interface for logger management across components.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger (e.g.,
   * "hashvote.admission")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Re-parent this module's logger under another logger
   * @param targetLoggerName Name of the target logger
   */
  void redirectLogger(const std::string &targetLoggerName);

  /**
   * Get the logger instance for this module.
   * @return Reference to the logger instance
   */
  logging::Logger &log() const;

private:
  std::unique_ptr<logging::Logger> upLogger_;
};

} // namespace hv

#endif // HASHVOTE_MODULE_H
