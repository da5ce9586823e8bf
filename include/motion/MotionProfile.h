// ============================================================================
// MOTION PROFILE CALCULATOR - Kinematic intent → sampled trajectory
// ============================================================================
// Turns a MotionRequest (pattern, rpm, duration, target) into a MotionProfile:
// center, amplitude, feed rate, sampling plan and the sampled points.
//
// Pattern summary (ω = 2π·rpm/60):
//   ORBITAL     x = r·cos(ωt)+cx, y = r·sin(ωt)+cy      end-inclusive, tiered density
//   LINEAR      x = cx,           y = A·sin(ωt)+cy      end-exclusive, 50/s
//   HELICAL_3D  XY circle r,      z = (Az/2)·sin(ωt)+cz end-exclusive, 50/s
//
// Deterministic: same request + geometry → identical profile.
// ============================================================================

#ifndef MOTION_PROFILE_H
#define MOTION_PROFILE_H

#include <string>
#include "core/Types.h"

class MotionProfileCalculator {
public:
  explicit MotionProfileCalculator(const ShakerGeometry& geometry);

  /**
   * Build the profile for a request.
   * Inputs are assumed validated (rpm > 0, duration > 0).
   * A duration shorter than one sampling interval yields an empty trajectory;
   * sample counts are capped at MAX_TRAJECTORY_SAMPLES.
   */
  MotionProfile calculate(const MotionRequest& request) const;

  /** Orbital center: named target XY, default center XY without a target */
  Point3 resolveCenter(const MotionRequest& request) const;

  const ShakerGeometry& geometry() const { return _geometry; }

  static const char* patternName(ShakePattern pattern);

  /** One-line summary for logs */
  static std::string describe(const MotionProfile& profile, const MotionRequest& request);

private:
  const ShakerGeometry& _geometry;

  MotionProfile buildOrbital(const MotionRequest& request) const;
  MotionProfile buildLinear(const MotionRequest& request) const;
  MotionProfile buildHelical(const MotionRequest& request) const;
};

#endif // MOTION_PROFILE_H
