// ============================================================================
// GCODE ENCODER - MotionProfile → controller command lines
// ============================================================================
// Sequence layout for a shaking run:
//   1. G21                       units = mm
//   2. G0  center  F<traverse>   rapid move to pattern center
//   3. G1  point   F<feed>       one per trajectory sample
//   4. G0  center  F<traverse>   rapid return, then M400
//   5. G92 center                re-zero (linear / helical only)
//
// Coordinates use 4 decimals, feed words are truncated integers.
// Also builds the small fixed sequences used by the dispatcher
// (homing recovery, origin return, full home, pause, move-to-target).
// ============================================================================

#ifndef GCODE_ENCODER_H
#define GCODE_ENCODER_H

#include <string>
#include <vector>
#include "core/Types.h"

// ============================================================================
// COMMAND SEQUENCE (append-only, rendered once)
// ============================================================================
class CommandSequence {
public:
  CommandSequence() = default;

  void append(const std::string& line) { _lines.push_back(line); }

  const std::vector<std::string>& lines() const { return _lines; }
  size_t size() const { return _lines.size(); }
  bool empty() const { return _lines.empty(); }

  /** Newline-joined script (no trailing newline) */
  std::string render() const;

private:
  std::vector<std::string> _lines;
};

// ============================================================================
// GCODE ENCODER CLASS
// ============================================================================
class GcodeEncoder {
public:
  explicit GcodeEncoder(const ShakerGeometry& geometry);

  /** Full shaking run for a calculated profile */
  CommandSequence encode(const MotionProfile& profile) const;

  /** Rapid return to the fixed origin, then wait (orbital follow-up) */
  CommandSequence originReturn() const;

  /** Move to a named target at the target feed; Z omitted when z == 0 */
  CommandSequence moveToTarget(NamedTarget target) const;

  // Single-line commands used by the dispatcher
  static std::string homeXY() { return "G28 X Y"; }
  static std::string waitForHoming() { return "M400 ; wait for homing"; }
  static std::string fullHome() { return "G28"; }
  static std::string pause() { return "PAUSE"; }

  /** "X150.0000 Y150.0000" (+ " Z10.0000" when withZ) */
  static std::string formatAxes(const Point3& p, bool withZ);

private:
  const ShakerGeometry& _geometry;
};

#endif // GCODE_ENCODER_H
