#pragma once

#include "Logger.h"
#include <string>

namespace fv {

/**
 * Base class for components that log.
 * Each module owns a handle to the logger named after it, so messages carry
 * the component's dotted name (e.g. "simulation").
 */
class Module {
public:
  /**
   * Constructor
   * @param name Hierarchical name for the module's logger
   */
  explicit Module(const std::string &name);

  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Get the logger instance for this module.
   * @return Reference to the logger handle owned by the module
   */
  logging::Logger &log() const;

private:
  mutable logging::Logger logger_;
};

} // namespace fv
