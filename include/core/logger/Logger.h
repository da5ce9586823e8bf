// ============================================================================
// LOGGER - Multi-Channel Structured Logging
// ============================================================================
// Multi-level logging (ERROR, WARN, INFO, DEBUG) with two output channels:
// - Serial console
// - Buffered file output with circular log buffer (LittleFS)
// Includes log file management (create per session, epoch cleanup).
// Thread-safe: the HTTP task and the relay task both log.
// ============================================================================

#ifndef LOGGER_H
#define LOGGER_H

#include <Arduino.h>
#include <LittleFS.h>
#include <array>
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "core/Config.h"
#include "core/Types.h"

// Forward declaration
class FileSystem;

// ============================================================================
// LOG BUFFER CONFIGURATION
// ============================================================================
// LOG_BUFFER_SIZE is defined in Config.h
constexpr const char* LOG_FILE_PATTERN = "/logs/log_";
constexpr const char* LOG_FILE_EXTENSION = ".txt";

// ============================================================================
// LOG ENTRY STRUCTURE
// ============================================================================
struct LogEntry {
  unsigned long timestamp = 0;  // millis() when log was created
  LogLevel level = LogLevel::LOG_INFO;
  String message;

  LogEntry() = default;
};

// ============================================================================
// LOGGER CLASS
// ============================================================================
class Logger {
public:
  // ========================================================================
  // CONSTRUCTOR & LIFECYCLE
  // ========================================================================

  /**
   * @param fs Reference to FileSystem for log file operations
   */
  explicit Logger(FileSystem& fs);

  /**
   * Initialize log file (creates /logs dir, opens session file)
   * Must be called after FileSystem::mount() and NTP sync
   * @return true if log file opened successfully
   */
  bool initializeLogFile();

  /**
   * Shutdown: flush + close log file
   */
  void shutdown();

  // ========================================================================
  // LOGGING INTERFACE
  // ========================================================================

  /**
   * Main logging function - outputs to Serial + File buffer
   * @param level Severity level
   * @param message Log message
   */
  void log(LogLevel level, const String& message);

  // Convenience methods
  void error(const String& message);
  void warn(const String& message);
  void info(const String& message);
  void debug(const String& message);

  /**
   * Flush log buffer to disk
   * @param forceFlush Flush even if the interval has not elapsed
   */
  void flushLogBuffer(bool forceFlush = false);

  // ========================================================================
  // LOG LEVEL MANAGEMENT
  // ========================================================================

  void setLogLevel(LogLevel level) { _currentLogLevel = level; }
  LogLevel getLogLevel() const { return _currentLogLevel; }

  void setLoggingEnabled(bool enabled) { _loggingEnabled = enabled; }
  bool isLoggingEnabled() const { return _loggingEnabled; }

  String getCurrentLogFile() const { return _currentLogFileName; }

  /** Set initial state from EEPROM values (no save triggered) */
  void restoreState(bool enabled, LogLevel level) {
    _loggingEnabled = enabled;
    _currentLogLevel = level;
  }

private:
  FileSystem& _fs;

  // Log file state
  File _logFile;
  String _currentLogFileName;

  // Logging state
  LogLevel _currentLogLevel;
  bool _loggingEnabled;

  // Circular log buffer (protected by _logMutex, written from both tasks)
  std::array<LogEntry, LOG_BUFFER_SIZE> _logBuffer;
  int _logBufferHead;            // Next write position
  int _logBufferCount;           // Number of valid entries
  unsigned long _lastLogFlush;
  SemaphoreHandle_t _logMutex;

  // ========================================================================
  // PRIVATE HELPERS
  // ========================================================================

  /** Generate log filename with session suffix */
  String generateLogFilename();

  /** Remove files created before NTP sync (1970 dates) */
  void removeEpochFiles();

  const char* getLevelPrefix(LogLevel level) const;
};

#endif // LOGGER_H
