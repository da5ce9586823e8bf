// ============================================================================
// UTILITY ENGINE - System Services Facade
// ============================================================================
// Lightweight facade that coordinates three focused sub-systems:
//   - Logger         (core/logger/)      - Serial + buffered file logging
//   - FileSystem     (core/filesystem/)  - LittleFS mount + disk usage
//   - EepromManager  (core/eeprom/)      - logging preferences in EEPROM
//
// Public methods forward inline to sub-objects, providing a single
// access point for all system services.
// ============================================================================

#ifndef UTILITY_ENGINE_H
#define UTILITY_ENGINE_H

#include <Arduino.h>
#include <string>
#include "core/Types.h"

// Sub-object headers
#include "core/logger/Logger.h"
#include "core/filesystem/FileSystem.h"
#include "core/eeprom/EepromManager.h"

// ============================================================================
// UTILITY ENGINE CLASS
// ============================================================================
class UtilityEngine { // NOSONAR(cpp:S1448) Facade pattern - methods are one-line forwarders

public:
  UtilityEngine();

  /**
   * Full initialization sequence:
   * 1. EEPROM (+ logging preferences) → 2. FileSystem → 3. Logger
   */
  bool initialize();

  /** Cleanup before shutdown or OTA update */
  void shutdown();

  // ========================================================================
  // LOGGING FACADE
  // ========================================================================

  void log(LogLevel level, const String& message)  { _logger.log(level, message); }
  void error(const String& message)                { _logger.error(message); }
  void warn(const String& message)                 { _logger.warn(message); }
  void info(const String& message)                 { _logger.info(message); }
  void debug(const String& message)                { _logger.debug(message); }
  void flushLogBuffer(bool forceFlush = false)     { _logger.flushLogBuffer(forceFlush); }
  void setLogLevel(LogLevel level)                 { _logger.setLogLevel(level); }
  LogLevel getLogLevel() const                     { return _logger.getLogLevel(); }
  void setLoggingEnabled(bool enabled)             { _logger.setLoggingEnabled(enabled); }
  bool isLoggingEnabled() const                    { return _logger.isLoggingEnabled(); }
  String getCurrentLogFile() const                 { return _logger.getCurrentLogFile(); }

  /** LogSink for the portable modules (dispatcher, service, relay) */
  LogSink logSink() {
    return [this](LogLevel level, const std::string& message) {
      _logger.log(level, String(message.c_str()));
    };
  }

  // ========================================================================
  // PREFERENCES FACADE
  // ========================================================================

  void saveLoggingPreferences() {
    _eeprom.saveLoggingPreferences(_logger.isLoggingEnabled(), static_cast<uint8_t>(_logger.getLogLevel()));
  }
  void loadLoggingPreferences();

  // ========================================================================
  // FILESYSTEM FACADE
  // ========================================================================

  bool isFilesystemReady() const   { return _fs.isReady(); }
  uint32_t getTotalBytes() const   { return _fs.getTotalBytes(); }
  uint32_t getUsedBytes() const    { return _fs.getUsedBytes(); }
  float getDiskUsagePercent() const { return _fs.getDiskUsagePercent(); }

  // ========================================================================
  // STATE INSPECTION
  // ========================================================================

  void printStatus() const;

private:
  FileSystem     _fs;
  EepromManager  _eeprom;
  Logger         _logger;

}; // class UtilityEngine

// ============================================================================
// GLOBAL ENGINE POINTER (defined in ShakerBridge.cpp, accessible everywhere)
// ============================================================================
extern UtilityEngine* engine;

#endif // UTILITY_ENGINE_H
