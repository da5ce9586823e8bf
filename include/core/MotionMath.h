// ============================================================================
// MOTION MATH - Pure, testable math for shaking trajectories
// ============================================================================
// Rotation speed conversions, feed-rate clamps, sampling density and sample
// timing shared by MotionProfileCalculator and the unit tests, so the tests
// exercise the real production formulas.
//
// All functions are free (namespace-scoped), header-only, and depend only on
// Config.h + <cmath>.  No hardware, no globals, no side effects.
// ============================================================================

#ifndef MOTION_MATH_H
#define MOTION_MATH_H

#include <algorithm>
#include <cmath>
#include "Config.h"

#ifndef PI
#define PI 3.14159265358979323846
#endif

namespace MotionMath {

// ============================================================================
// 1. ROTATION SPEED
// ============================================================================

/** Revolutions per minute → revolutions per second */
inline double rpmToRps(int rpm) {
    return static_cast<double>(rpm) / 60.0;
}

/** Revolutions per second → angular velocity (rad/s) */
inline double angularVelocity(double rps) {
    return 2.0 * PI * rps;
}

// ============================================================================
// 2. FEED RATES (mm/min)
// ============================================================================

/**
 * Orbital feed: circumference speed 2π·r·rps, per minute, floored at minFeed.
 */
inline double orbitalFeedRate(double radiusMM, double rps, double minFeed) {
    return std::max(minFeed, 2.0 * PI * radiusMM * rps * 60.0);
}

/**
 * Linear feed: one revolution sweeps the stroke four times (±A and back).
 */
inline double linearFeedRate(double amplitudeMM, double rps, double minFeed) {
    return std::max(minFeed, 4.0 * amplitudeMM * rps * 60.0);
}

/**
 * Helical feed: orbital formula on the XY radius, then capped at the
 * controller's axis ceiling. The ceiling wins when it is below minFeed.
 */
inline double helicalFeedRate(double radiusMM, double rps, double minFeed, double maxFeed) {
    return std::min(orbitalFeedRate(radiusMM, rps, minFeed), maxFeed);
}

/** Feed word emitted in G1 lines: truncated toward zero */
inline long feedWord(double feedRate) {
    return static_cast<long>(feedRate);
}

// ============================================================================
// 3. SAMPLING
// ============================================================================

/**
 * Orbital sampling density by run length.
 * @return samples per second (50 / 30 / 20)
 */
inline int orbitalSampleDensity(double durationSec) {
    if (durationSec <= ORBITAL_SHORT_LIMIT_SEC) return ORBITAL_DENSITY_SHORT;
    if (durationSec <= ORBITAL_MEDIUM_LIMIT_SEC) return ORBITAL_DENSITY_MEDIUM;
    return ORBITAL_DENSITY_LONG;
}

/**
 * Narrow a sample count computed in double, capped at MAX_TRAJECTORY_SAMPLES.
 * NaN and non-positive values give 0.
 */
inline int clampSampleCount(double samples) {
    if (!(samples > 0.0)) return 0;
    if (samples >= static_cast<double>(MAX_TRAJECTORY_SAMPLES)) return MAX_TRAJECTORY_SAMPLES;
    return static_cast<int>(samples);
}

/**
 * Sample count for an end-inclusive run: floor(d·density) + 1.
 */
inline int inclusiveSampleCount(double durationSec, int density) {
    if (!(durationSec > 0.0) || density <= 0) return 0;
    return clampSampleCount(std::floor(durationSec * density) + 1.0);
}

/**
 * Sample count for an end-exclusive run: floor(d·density).
 * Zero when the duration is shorter than one sampling interval.
 */
inline int exclusiveSampleCount(double durationSec, int density) {
    if (!(durationSec > 0.0) || density <= 0) return 0;
    return clampSampleCount(std::floor(durationSec * density));
}

/**
 * Time of sample i.
 * Inclusive: evenly spaced over [0, d], last sample is exactly d.
 * Exclusive: t_i = i·d/count, never reaches d.
 */
inline double sampleTime(int index, int count, double durationSec, bool inclusiveEnd) {
    if (count <= 0) return 0.0;
    if (inclusiveEnd) {
        if (count == 1) return 0.0;
        if (index == count - 1) return durationSec;
        return durationSec * static_cast<double>(index) / static_cast<double>(count - 1);
    }
    return durationSec * static_cast<double>(index) / static_cast<double>(count);
}

} // namespace MotionMath

#endif // MOTION_MATH_H
