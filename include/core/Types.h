// ============================================================================
// TYPES.H - Data Structures and Enums
// ============================================================================
// All type definitions (enums, structs) centralized for clarity.
// Everything here is plain C++ so the motion and dispatch code can be
// compiled and tested on the host.
// ============================================================================
//
// DISPATCH STATES (one per send):
// ═══════════════════════════════════════════════════════════════════════════
//
//   IDLE → SENDING → SUCCESS
//                  → FAILED                      (any non-homing error)
//                  → HOMING_REQUIRED → HOMING → RESENDING → SUCCESS | FAILED
//
//   At most one recovery per send. A failure of the homing commands
//   themselves, or any failure of the resend, is final.
// ═══════════════════════════════════════════════════════════════════════════

#ifndef TYPES_H
#define TYPES_H

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/Config.h"

// ============================================================================
// LOG LEVEL ENUM
// ============================================================================
enum class LogLevel : int {
  LOG_ERROR = 0,
  LOG_WARNING = 1,
  LOG_INFO = 2,
  LOG_DEBUG = 3
};

// Injected into host-portable modules; firmware wires it to engine->log()
using LogSink = std::function<void(LogLevel, const std::string&)>;

// ============================================================================
// MOTION ENUMS
// ============================================================================

enum class ShakePattern {
  PATTERN_ORBITAL = 0,     // XY circle around a center or named target
  PATTERN_LINEAR = 1,      // Y sine stroke, X fixed
  PATTERN_HELICAL_3D = 2   // XY circle + Z sine
};

enum class NamedTarget {
  TARGET_A = 0,
  TARGET_B = 1
};

constexpr uint8_t NAMED_TARGET_COUNT = 2;

// ============================================================================
// GEOMETRY
// ============================================================================

struct Point3 {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  constexpr Point3() = default;
  constexpr Point3(double px, double py, double pz = 0.0) : x(px), y(py), z(pz) {}
};

// z == 0 means "omit Z" when moving to the target
struct NamedCoordinate {
  const char* name = "";
  Point3 position;
};

// ============================================================================
// MOTION REQUEST
// ============================================================================

struct MotionRequest {
  ShakePattern pattern = ShakePattern::PATTERN_ORBITAL;
  int rpm = 0;
  double durationSec = 0.0;
  std::optional<NamedTarget> target;  // Orbital only

  MotionRequest() = default;
};

// ============================================================================
// SHAKER GEOMETRY (immutable, injected into calculator / encoder / dispatcher)
// ============================================================================

struct ShakerGeometry {
  Point3 defaultCenter{SHAKER_CENTER_X_MM, SHAKER_CENTER_Y_MM, SHAKER_CENTER_Z_MM};
  Point3 origin{SHAKER_ORIGIN_X_MM, SHAKER_ORIGIN_Y_MM, 0.0};

  double orbitalRadiusMM = ORBITAL_RADIUS_MM;
  double linearAmplitudeMM = LINEAR_AMPLITUDE_MM;
  double helicalRadiusMM = HELICAL_RADIUS_MM;
  double helicalAmplitudeZMM = HELICAL_AMPLITUDE_Z_MM;

  double minFeedRate = MIN_FEED_RATE_MM_MIN;
  double maxAxisFeedRate = MAX_AXIS_FEED_RATE_MM_MIN;
  int traverseFeedRate = TRAVERSE_FEED_RATE_MM_MIN;
  int targetFeedRate = TARGET_FEED_RATE_MM_MIN;

  int linearSampleDensity = LINEAR_SAMPLE_DENSITY;
  int helicalSampleDensity = HELICAL_SAMPLE_DENSITY;

  std::array<NamedCoordinate, NAMED_TARGET_COUNT> targets = {{
    {"target_A", Point3(100.0, 150.0, 0.0)},
    {"target_B", Point3(150.0, 100.0, 0.0)}
  }};

  const NamedCoordinate& target(NamedTarget t) const {
    return targets[static_cast<size_t>(t)];
  }

  ShakerGeometry() = default;
};

// ============================================================================
// MOTION PROFILE (calculator output, immutable once built)
// ============================================================================

struct MotionProfile {
  ShakePattern pattern = ShakePattern::PATTERN_ORBITAL;
  Point3 center;
  double amplitudeMM = 0.0;      // Radius (orbital/helical) or half-stroke (linear)
  double amplitudeZMM = 0.0;     // Helical only: peak-to-peak
  double feedRate = 0.0;         // mm/min, before truncation
  double rps = 0.0;
  double omega = 0.0;            // rad/s
  int sampleDensity = 0;         // samples per second
  int sampleCount = 0;
  bool inclusiveEnd = false;     // true: last sample at t == duration
  bool usesZ = false;
  std::vector<Point3> trajectory;

  MotionProfile() = default;
};

// ============================================================================
// CONTROLLER RESULTS
// ============================================================================

enum class ControllerError {
  ERR_NONE = 0,
  ERR_CONNECTION,        // Transport failure / timeout (503)
  ERR_DEVICE_RESPONSE,   // Controller answered 4xx/5xx
  ERR_HOMING_REQUIRED,   // Device response naming unhomed axes
  ERR_INTERNAL           // Anything else (500)
};

struct ControllerResult {
  ControllerError error = ControllerError::ERR_NONE;
  int statusCode = 200;
  std::string body;      // Raw controller body (JSON text on success)
  std::string message;   // Short summary
  std::string detail;    // Human-readable cause

  bool ok() const { return error == ControllerError::ERR_NONE; }

  ControllerResult() = default;
};

// ============================================================================
// DISPATCH STATE
// ============================================================================

enum class DispatchState {
  DISPATCH_IDLE,
  DISPATCH_SENDING,
  DISPATCH_HOMING_REQUIRED,
  DISPATCH_HOMING,
  DISPATCH_RESENDING,
  DISPATCH_SUCCESS,
  DISPATCH_FAILED
};

// ============================================================================
// RELAY STATE
// ============================================================================

enum class RelayState {
  RELAY_IDLE,        // No client
  RELAY_CONNECTING,  // Client accepted, controller socket opening
  RELAY_ACTIVE,      // Both sides open, forwarding
  RELAY_CLOSED       // Torn down, nothing forwarded
};

#endif // TYPES_H
