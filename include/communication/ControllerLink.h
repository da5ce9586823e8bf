// ============================================================================
// CONTROLLER LINK - Abstract request/response channel to the motion controller
// ============================================================================
// Implemented by ControllerClient (HTTPClient, firmware) and by scripted fakes
// in the native tests. Every call is independent and returns a classified
// ControllerResult; implementations never throw.
// ============================================================================

#pragma once

#include <string>
#include "core/Types.h"

class ControllerLink {
public:
  virtual ~ControllerLink() = default;

  /** POST a newline-joined command script */
  virtual ControllerResult sendScript(const std::string& script) = 0;

  /** GET controller identity/state */
  virtual ControllerResult fetchInfo() = 0;

  /** "http://host:port" for error details */
  virtual std::string baseUrl() const = 0;
};
