// ============================================================================
// UTILITY ENGINE IMPLEMENTATION
// ============================================================================

#include "core/UtilityEngine.h"
#include "core/TimeUtils.h"

// ============================================================================
// CONSTRUCTOR
// ============================================================================

UtilityEngine::UtilityEngine()
  : _logger(_fs) {}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool UtilityEngine::initialize() {
  Serial.println("\n[UtilityEngine] Initializing...");

  // 1. EEPROM + logging preferences (before any log output)
  _eeprom.begin(EEPROM_SIZE);
  loadLoggingPreferences();

  // 2. Filesystem (degraded mode keeps Serial logging only)
  bool mounted = _fs.mount();

  // 3. Log file (deferred until NTP sync if the clock is not set yet)
  if (mounted && !_logger.initializeLogFile()) {
    Serial.println("[UtilityEngine] Log file deferred until NTP sync");
  }

  Serial.println(mounted ? "[UtilityEngine] Initialization complete"
                         : "[UtilityEngine] Initialization complete (no filesystem)");
  return mounted;
}

void UtilityEngine::shutdown() {
  _logger.shutdown();
}

// ============================================================================
// PREFERENCES
// ============================================================================

void UtilityEngine::loadLoggingPreferences() {
  bool enabled = true;
  uint8_t level = static_cast<uint8_t>(LogLevel::LOG_INFO);
  _eeprom.loadLoggingPreferences(enabled, level);
  _logger.restoreState(enabled, static_cast<LogLevel>(level));
}

// ============================================================================
// STATE INSPECTION
// ============================================================================

void UtilityEngine::printStatus() const {
  static constexpr const char* levelNames[] = {"ERROR", "WARN", "INFO", "DEBUG"};
  auto levelIdx = static_cast<int>(_logger.getLogLevel());

  Serial.println("========== UtilityEngine ==========");
  Serial.printf("  Filesystem : %s (%.1f%% used)\n", _fs.isReady() ? "mounted" : "DEGRADED", _fs.getDiskUsagePercent());
  Serial.printf("  Time sync  : %s\n", TimeUtils::isSynchronized() ? "yes" : "no");
  Serial.printf("  Logging    : %s, level %s\n", _logger.isLoggingEnabled() ? "on" : "off",
                (levelIdx >= 0 && levelIdx <= 3) ? levelNames[levelIdx] : "?");
  Serial.printf("  Log file   : %s\n", _logger.getCurrentLogFile().c_str());
  Serial.println("===================================");
}
