// ============================================================================
// VALIDATORS - Centralized Parameter Validation
// ============================================================================
// Purpose: All validation functions in one place for cleaner code
// - Motion request parameters (rpm, duration, target)
// - Controller endpoint configuration
// - WiFi credentials
//
// Usage: Include this header and use Validators namespace
//   #include "core/Validators.h"
//   std::string err;
//   if (!Validators::rpm(60, err)) { sendError(err); }
// ============================================================================

#ifndef VALIDATORS_H
#define VALIDATORS_H

#include <cmath>
#include <string>
#include "Config.h"
#include "Types.h"

namespace Validators {

// ============================================================================
// MOTION PARAMETERS
// ============================================================================

/**
 * Validate rotation speed
 * @param value Revolutions per minute
 * @param errorMsg Output error message if validation fails
 * @return true if valid, false otherwise
 */
inline bool rpm(int value, std::string& errorMsg) {
  if (value <= 0) {
    errorMsg = "rpm must be greater than 0 (got " + std::to_string(value) + ")";
    return false;
  }
  return true;
}

/**
 * Validate run duration: finite, in (0, MAX_DURATION_SEC]
 * @param durationSec Duration in seconds
 * @param errorMsg Output error message if validation fails
 * @return true if valid, false otherwise
 */
inline bool duration(double durationSec, std::string& errorMsg) {
  if (!std::isfinite(durationSec) || durationSec <= 0.0) {
    errorMsg = "time_sec must be greater than 0";
    return false;
  }
  if (durationSec > MAX_DURATION_SEC) {
    errorMsg = "time_sec must be at most " + std::to_string(static_cast<int>(MAX_DURATION_SEC)) +
               " (got " + std::to_string(durationSec) + ")";
    return false;
  }
  return true;
}

/**
 * Resolve a target name ("target_A" / "target_B")
 * @param name Name as received
 * @param geometry Geometry holding the target table
 * @param out Resolved target on success
 * @param errorMsg Output error message if validation fails
 * @return true if the name is known
 */
inline bool target(const std::string& name, const ShakerGeometry& geometry,
                   NamedTarget& out, std::string& errorMsg) {
  for (size_t i = 0; i < geometry.targets.size(); i++) {
    if (name == geometry.targets[i].name) {
      out = static_cast<NamedTarget>(i);
      return true;
    }
  }
  errorMsg = "Unknown target '" + name + "' (expected target_A or target_B)";
  return false;
}

// ============================================================================
// CONTROLLER ENDPOINT
// ============================================================================

inline bool controllerHost(const std::string& host, std::string& errorMsg) {
  if (host.empty()) {
    errorMsg = "controller_host must not be empty";
    return false;
  }
  if (host.size() > 63) {
    errorMsg = "controller_host too long (max 63 characters)";
    return false;
  }
  if (host.find_first_of(" /?#") != std::string::npos) {
    errorMsg = "controller_host must be a bare host name or IP address";
    return false;
  }
  return true;
}

inline bool controllerPort(long port, std::string& errorMsg) {
  if (port < 1 || port > 65535) {
    errorMsg = "controller_port out of range: " + std::to_string(port) + " (1-65535)";
    return false;
  }
  return true;
}

// ============================================================================
// WIFI CREDENTIALS (sizes match the EEPROM slots in BridgeConfigManager.h)
// ============================================================================

inline bool wifiSsid(const std::string& ssid, std::string& errorMsg) {
  if (ssid.empty() || ssid.size() > 31) {
    errorMsg = "ssid must be 1-31 characters (got " + std::to_string(ssid.size()) + ")";
    return false;
  }
  return true;
}

inline bool wifiPassword(const std::string& password, std::string& errorMsg) {
  if (password.size() > 63) {
    errorMsg = "password must be at most 63 characters";
    return false;
  }
  return true;
}

} // namespace Validators

#endif // VALIDATORS_H
