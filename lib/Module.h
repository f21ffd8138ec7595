#ifndef VNC_LEDGER_MODULE_H
#define VNC_LEDGER_MODULE_H

#include "Logger.h"
#include <memory>
#include <string>

namespace vnc {

/**
 * Base class for components that log.
 * Each module owns a named logger in the "vnc" hierarchy.
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical logger name (e.g. "vnc.ledger")
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Get the logger instance for this module.
   * @return Reference to the logger instance
   */
  logging::Logger &log() const;

private:
  std::shared_ptr<logging::Logger> spLogger_;
};

} // namespace vnc

#endif // VNC_LEDGER_MODULE_H
