// ============================================================================
// FILESYSTEM IMPLEMENTATION
// ============================================================================
// Runs before the Logger exists, so it reports on Serial only.
// ============================================================================

#include "core/filesystem/FileSystem.h"

// ============================================================================
// MOUNT
// ============================================================================

bool FileSystem::mount() {
  Serial.println("[FileSystem] Mounting LittleFS...");

  // STEP 1: mount WITHOUT auto-format
  _mounted = LittleFS.begin(false);

  if (!_mounted) {
    Serial.println("[FileSystem] Mount failed - attempting controlled format");

    // STEP 2: format, STEP 3: remount
    if (LittleFS.format()) {
      _mounted = LittleFS.begin(false);
      Serial.println(_mounted
        ? "[FileSystem] LittleFS mounted after format"
        : "[FileSystem] CRITICAL: still not mountable after format - DEGRADED mode (no log files)");
    } else {
      Serial.println("[FileSystem] Format failed - DEGRADED mode (no log files)");
    }
  }

  if (_mounted) {
    Serial.printf("[FileSystem] LittleFS: %u KB total, %u KB used (%.1f%%)\n",
                  (unsigned)(getTotalBytes() / 1024), (unsigned)(getUsedBytes() / 1024),
                  getDiskUsagePercent());
  }
  return _mounted;
}

// ============================================================================
// DIRECTORIES
// ============================================================================

bool FileSystem::directoryExists(const String& path) const {
  if (!_mounted || !LittleFS.exists(path)) return false;

  File f = LittleFS.open(path, "r");
  if (!f) return false;

  bool isDir = f.isDirectory();
  f.close();
  return isDir;
}

bool FileSystem::createDirectory(const String& path) {
  if (!_mounted) return false;
  if (directoryExists(path)) return true;
  return LittleFS.mkdir(path);
}

// ============================================================================
// DISK USAGE
// ============================================================================

uint32_t FileSystem::getTotalBytes() const {
  return _mounted ? LittleFS.totalBytes() : 0;
}

uint32_t FileSystem::getUsedBytes() const {
  return _mounted ? LittleFS.usedBytes() : 0;
}

float FileSystem::getDiskUsagePercent() const {
  uint32_t total = getTotalBytes();
  if (total == 0) return 0.0f;
  return (getUsedBytes() * 100.0f) / total;
}
