// ============================================================================
// MOTION PROFILE CALCULATOR IMPLEMENTATION
// ============================================================================

#include "motion/MotionProfile.h"
#include "core/MotionMath.h"
#include <cmath>
#include <cstdio>

// ============================================================================
// CONSTRUCTOR
// ============================================================================

MotionProfileCalculator::MotionProfileCalculator(const ShakerGeometry& geometry)
  : _geometry(geometry) {}

// ============================================================================
// PUBLIC API
// ============================================================================

MotionProfile MotionProfileCalculator::calculate(const MotionRequest& request) const {
  using enum ShakePattern;
  switch (request.pattern) {
    case PATTERN_LINEAR:     return buildLinear(request);
    case PATTERN_HELICAL_3D: return buildHelical(request);
    case PATTERN_ORBITAL:
    default:                 return buildOrbital(request);
  }
}

// Orbital runs are planar: the center carries no Z, with or without a target
Point3 MotionProfileCalculator::resolveCenter(const MotionRequest& request) const {
  const Point3& p = request.target ? _geometry.target(*request.target).position : _geometry.defaultCenter;
  return Point3(p.x, p.y, 0.0);
}

const char* MotionProfileCalculator::patternName(ShakePattern pattern) {
  using enum ShakePattern;
  switch (pattern) {
    case PATTERN_ORBITAL:    return "orbital";
    case PATTERN_LINEAR:     return "linear";
    case PATTERN_HELICAL_3D: return "helical3d";
    default:                 return "unknown";
  }
}

std::string MotionProfileCalculator::describe(const MotionProfile& profile, const MotionRequest& request) {
  char buf[256];
  snprintf(buf, sizeof(buf),
           "%s: rpm=%d rps=%.3f omega=%.3f rad/s center=(%.2f, %.2f, %.2f) amp=%.2f mm feed=%ld samples=%d @%d/s",
           patternName(profile.pattern), request.rpm, profile.rps, profile.omega,
           profile.center.x, profile.center.y, profile.center.z,
           profile.amplitudeMM, MotionMath::feedWord(profile.feedRate),
           profile.sampleCount, profile.sampleDensity);
  return std::string(buf);
}

// ============================================================================
// PATTERN BUILDERS
// ============================================================================

MotionProfile MotionProfileCalculator::buildOrbital(const MotionRequest& request) const {
  MotionProfile profile;
  profile.pattern = ShakePattern::PATTERN_ORBITAL;
  profile.center = resolveCenter(request);
  profile.amplitudeMM = _geometry.orbitalRadiusMM;
  profile.rps = MotionMath::rpmToRps(request.rpm);
  profile.omega = MotionMath::angularVelocity(profile.rps);
  profile.feedRate = MotionMath::orbitalFeedRate(profile.amplitudeMM, profile.rps, _geometry.minFeedRate);
  profile.sampleDensity = MotionMath::orbitalSampleDensity(request.durationSec);
  profile.sampleCount = MotionMath::inclusiveSampleCount(request.durationSec, profile.sampleDensity);
  profile.inclusiveEnd = true;
  profile.usesZ = false;

  profile.trajectory.reserve(profile.sampleCount);
  for (int i = 0; i < profile.sampleCount; i++) {
    double t = MotionMath::sampleTime(i, profile.sampleCount, request.durationSec, true);
    double angle = profile.omega * t;
    profile.trajectory.emplace_back(profile.amplitudeMM * std::cos(angle) + profile.center.x,
                                    profile.amplitudeMM * std::sin(angle) + profile.center.y);
  }
  return profile;
}

MotionProfile MotionProfileCalculator::buildLinear(const MotionRequest& request) const {
  MotionProfile profile;
  profile.pattern = ShakePattern::PATTERN_LINEAR;
  profile.center = Point3(_geometry.defaultCenter.x, _geometry.defaultCenter.y, 0.0);
  profile.amplitudeMM = _geometry.linearAmplitudeMM;
  profile.rps = MotionMath::rpmToRps(request.rpm);
  profile.omega = MotionMath::angularVelocity(profile.rps);
  profile.feedRate = MotionMath::linearFeedRate(profile.amplitudeMM, profile.rps, _geometry.minFeedRate);
  profile.sampleDensity = _geometry.linearSampleDensity;
  profile.sampleCount = MotionMath::exclusiveSampleCount(request.durationSec, profile.sampleDensity);
  profile.inclusiveEnd = false;
  profile.usesZ = false;

  profile.trajectory.reserve(profile.sampleCount);
  for (int i = 0; i < profile.sampleCount; i++) {
    double t = MotionMath::sampleTime(i, profile.sampleCount, request.durationSec, false);
    profile.trajectory.emplace_back(profile.center.x,
                                    profile.amplitudeMM * std::sin(profile.omega * t) + profile.center.y);
  }
  return profile;
}

MotionProfile MotionProfileCalculator::buildHelical(const MotionRequest& request) const {
  MotionProfile profile;
  profile.pattern = ShakePattern::PATTERN_HELICAL_3D;
  profile.center = _geometry.defaultCenter;
  profile.amplitudeMM = _geometry.helicalRadiusMM;
  profile.amplitudeZMM = _geometry.helicalAmplitudeZMM;
  profile.rps = MotionMath::rpmToRps(request.rpm);
  profile.omega = MotionMath::angularVelocity(profile.rps);
  profile.feedRate = MotionMath::helicalFeedRate(profile.amplitudeMM, profile.rps,
                                                 _geometry.minFeedRate, _geometry.maxAxisFeedRate);
  profile.sampleDensity = _geometry.helicalSampleDensity;
  profile.sampleCount = MotionMath::exclusiveSampleCount(request.durationSec, profile.sampleDensity);
  profile.inclusiveEnd = false;
  profile.usesZ = true;

  double halfZ = profile.amplitudeZMM / 2.0;
  profile.trajectory.reserve(profile.sampleCount);
  for (int i = 0; i < profile.sampleCount; i++) {
    double t = MotionMath::sampleTime(i, profile.sampleCount, request.durationSec, false);
    double angle = profile.omega * t;
    profile.trajectory.emplace_back(profile.amplitudeMM * std::cos(angle) + profile.center.x,
                                    profile.amplitudeMM * std::sin(angle) + profile.center.y,
                                    halfZ * std::sin(angle) + profile.center.z);
  }
  return profile;
}
