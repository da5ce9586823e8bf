// ============================================================================
// EEPROM MANAGER IMPLEMENTATION
// ============================================================================

#include "core/eeprom/EepromManager.h"

// EEPROM addresses
#define EEPROM_ADDR_LOGGING_ENABLED   0
#define EEPROM_ADDR_LOG_LEVEL         1
#define EEPROM_ADDR_CHECKSUM          (EEPROM_SIZE - 1)

constexpr uint8_t DEFAULT_LOG_LEVEL = 2;  // LOG_INFO
constexpr int COMMIT_ATTEMPTS = 3;

// ============================================================================
// LIFECYCLE
// ============================================================================

void EepromManager::begin(uint16_t size) {
  EEPROM.begin(size);
}

bool EepromManager::commitWithRetry(const char* context) {
  for (int attempt = 1; attempt <= COMMIT_ATTEMPTS; attempt++) {
    if (EEPROM.commit()) return true;
    Serial.printf("[EepromManager] %s commit failed (attempt %d/%d)\n", context, attempt, COMMIT_ATTEMPTS);
    delay(10);
  }
  return false;
}

// ============================================================================
// CHECKSUM HELPERS
// ============================================================================

uint8_t EepromManager::calculateChecksum() const {
  uint8_t checksum = 0;
  for (int i = EEPROM_ADDR_LOGGING_ENABLED; i <= EEPROM_ADDR_LOG_LEVEL; i++) {
    checksum ^= EEPROM.read(i);
  }
  return checksum;
}

bool EepromManager::verifyChecksum() const {
  return calculateChecksum() == EEPROM.read(EEPROM_ADDR_CHECKSUM);
}

void EepromManager::updateChecksum() {
  EEPROM.write(EEPROM_ADDR_CHECKSUM, calculateChecksum());
}

// ============================================================================
// LOGGING PREFERENCES
// ============================================================================

void EepromManager::saveLoggingPreferences(bool enabled, uint8_t level) {
  EEPROM.write(EEPROM_ADDR_LOGGING_ENABLED, enabled ? 1 : 0);
  EEPROM.write(EEPROM_ADDR_LOG_LEVEL, level);

  updateChecksum();

  if (commitWithRetry("Logging")) {
    Serial.println("[EepromManager] Logging preferences saved");
  }
}

void EepromManager::loadLoggingPreferences(bool& enabled, uint8_t& level) {
  uint8_t enabledByte = EEPROM.read(EEPROM_ADDR_LOGGING_ENABLED);
  uint8_t levelByte = EEPROM.read(EEPROM_ADDR_LOG_LEVEL);

  // Fresh chip (0xFF) or corrupted: reset to defaults and persist them
  if (enabledByte == 0xFF || !verifyChecksum()) {
    Serial.println(enabledByte == 0xFF
      ? "[EepromManager] First boot: initializing logging defaults"
      : "[EepromManager] Checksum mismatch: resetting logging defaults");
    enabled = true;
    level = DEFAULT_LOG_LEVEL;
    saveLoggingPreferences(enabled, level);
    return;
  }

  enabled = (enabledByte == 1);
  if (levelByte <= 3) {
    level = levelByte;
  } else {
    Serial.println("[EepromManager] Invalid log level: " + String(levelByte) + " - using default");
    level = DEFAULT_LOG_LEVEL;
  }

  Serial.printf("[EepromManager] Logging: %s, Level: %u\n", enabled ? "ENABLED" : "DISABLED", level);
}
