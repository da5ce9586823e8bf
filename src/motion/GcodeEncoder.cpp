// ============================================================================
// GCODE ENCODER IMPLEMENTATION
// ============================================================================

#include "motion/GcodeEncoder.h"
#include "core/MotionMath.h"
#include <cstdio>

// ============================================================================
// COMMAND SEQUENCE
// ============================================================================

std::string CommandSequence::render() const {
  std::string script;
  size_t total = 0;
  for (const auto& line : _lines) total += line.size() + 1;
  script.reserve(total);

  for (size_t i = 0; i < _lines.size(); i++) {
    if (i > 0) script += '\n';
    script += _lines[i];
  }
  return script;
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

GcodeEncoder::GcodeEncoder(const ShakerGeometry& geometry)
  : _geometry(geometry) {}

// ============================================================================
// FORMATTING
// ============================================================================

std::string GcodeEncoder::formatAxes(const Point3& p, bool withZ) {
  char buf[96];
  if (withZ) {
    snprintf(buf, sizeof(buf), "X%.4f Y%.4f Z%.4f", p.x, p.y, p.z);
  } else {
    snprintf(buf, sizeof(buf), "X%.4f Y%.4f", p.x, p.y);
  }
  return std::string(buf);
}

// ============================================================================
// SHAKING RUN
// ============================================================================

CommandSequence GcodeEncoder::encode(const MotionProfile& profile) const {
  CommandSequence seq;
  const std::string centerAxes = formatAxes(profile.center, profile.usesZ);
  const std::string traverse = " F" + std::to_string(_geometry.traverseFeedRate);
  const std::string feed = " F" + std::to_string(MotionMath::feedWord(profile.feedRate));

  seq.append("G21 ; set units to mm");
  seq.append("G0 " + centerAxes + traverse + " ; move to center");

  for (const auto& point : profile.trajectory) {
    seq.append("G1 " + formatAxes(point, profile.usesZ) + feed);
  }

  seq.append("G0 " + centerAxes + traverse + " ; return to center");
  seq.append("M400 ; wait for moves to finish");

  if (profile.pattern != ShakePattern::PATTERN_ORBITAL) {
    seq.append("G92 " + centerAxes + " ; re-zero at center");
  }
  return seq;
}

// ============================================================================
// FIXED SEQUENCES
// ============================================================================

CommandSequence GcodeEncoder::originReturn() const {
  CommandSequence seq;
  seq.append("G0 " + formatAxes(_geometry.origin, false) +
             " F" + std::to_string(_geometry.traverseFeedRate) + " ; return to origin");
  seq.append("M400 ; wait for moves to finish");
  return seq;
}

CommandSequence GcodeEncoder::moveToTarget(NamedTarget target) const {
  const Point3& p = _geometry.target(target).position;
  CommandSequence seq;
  seq.append("G1 " + formatAxes(p, p.z != 0.0) + " F" + std::to_string(_geometry.targetFeedRate));
  return seq;
}
