// ============================================================================
// EEPROM MANAGER - Persistent Preferences Storage
// ============================================================================
// EEPROM read/write operations for persistent preferences:
// - Logging preferences (enabled + level)
// - Commit with retry (shared with BridgeConfigManager)
// - Checksum integrity protection
//
// EEPROM Layout (EEPROM_SIZE bytes):
//   Byte 0:       loggingEnabled (0=disabled, 1=enabled)
//   Byte 1:       currentLogLevel (0-3: ERROR, WARN, INFO, DEBUG)
//   Byte 2-3:     (reserved)
//   Byte 4-167:   bridge config (see BridgeConfigManager.h)
//   Byte 255:     XOR checksum of bytes 0-1
// ============================================================================

#ifndef EEPROM_MANAGER_H
#define EEPROM_MANAGER_H

#include <Arduino.h>
#include <EEPROM.h>
#include "core/Config.h"

class EepromManager {
public:
  EepromManager() = default;

  /**
   * Initialize EEPROM (call once in setup)
   * @param size EEPROM allocation size in bytes
   */
  void begin(uint16_t size = EEPROM_SIZE);

  // ========================================================================
  // LOGGING PREFERENCES
  // ========================================================================

  /**
   * Save logging preferences to EEPROM (with checksum)
   * @param enabled  Master logging switch
   * @param level    Current log level (0-3)
   */
  void saveLoggingPreferences(bool enabled, uint8_t level);

  /**
   * Load logging preferences from EEPROM
   * @param[out] enabled  Saved value (or default true)
   * @param[out] level    Saved value (or default LOG_INFO=2)
   */
  void loadLoggingPreferences(bool& enabled, uint8_t& level);

  // ========================================================================
  // COMMIT
  // ========================================================================

  /**
   * EEPROM.commit() with up to 3 attempts
   * @param context Label for the failure message
   * @return true if committed
   */
  static bool commitWithRetry(const char* context);

private:
  uint8_t calculateChecksum() const;
  bool verifyChecksum() const;
  void updateChecksum();
};

#endif // EEPROM_MANAGER_H
