// ============================================================================
// FILESYSTEM - LittleFS mount & directory helpers
// ============================================================================
// LittleFS wrapper providing:
// - Safe mount (mount → format → remount, degraded mode on failure)
// - Directory checks used by the Logger
// - Disk usage reporting for /api/system/status
// ============================================================================

#ifndef FILESYSTEM_H
#define FILESYSTEM_H

#include <Arduino.h>
#include <LittleFS.h>

class FileSystem {
public:
  FileSystem() = default;

  /**
   * Mount LittleFS with multi-level safety (try mount → format → remount)
   * @return true if mounted, false if running in degraded mode
   */
  bool mount();

  /** Check if filesystem is mounted and ready */
  bool isReady() const { return _mounted; }

  /** Check if directory exists */
  bool directoryExists(const String& path) const;

  /** Create directory (no-op if already exists) */
  bool createDirectory(const String& path);

  uint32_t getTotalBytes() const;
  uint32_t getUsedBytes() const;
  float getDiskUsagePercent() const;

private:
  bool _mounted = false;
};

#endif // FILESYSTEM_H
