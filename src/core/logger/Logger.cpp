// ============================================================================
// LOGGER IMPLEMENTATION
// ============================================================================

#include "core/logger/Logger.h"
#include "core/filesystem/FileSystem.h"
#include "core/TimeUtils.h"

// ============================================================================
// CONSTRUCTOR
// ============================================================================

Logger::Logger(FileSystem& fs)
  : _fs(fs),
    _currentLogLevel(LogLevel::LOG_INFO),
    _loggingEnabled(true),
    _logBufferHead(0),
    _logBufferCount(0),
    _lastLogFlush(0),
    _logMutex(nullptr) {
  _logMutex = xSemaphoreCreateMutex();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool Logger::initializeLogFile() {
  if (!_fs.isReady()) return false;

  if (!TimeUtils::isSynchronized()) {
    Serial.println("[Logger] NTP not synced yet - log file deferred");
    return false;
  }

  if (!_fs.directoryExists("/logs")) {
    Serial.println("[Logger] Creating /logs directory...");
    _fs.createDirectory("/logs");
  }

  removeEpochFiles();

  _currentLogFileName = generateLogFilename();

  // Direct LittleFS: append mode not supported by FileSystem wrapper
  _logFile = LittleFS.open(_currentLogFileName, "a");
  if (!_logFile) {
    Serial.println("[Logger] Failed to open log file: " + _currentLogFileName);
    return false;
  }

  Serial.println("[Logger] Log file opened: " + _currentLogFileName);

  auto ts = TimeUtils::format("%Y-%m-%d %H:%M:%S");
  _logFile.println("");
  _logFile.println("========================================");
  _logFile.print("SESSION START: ");
  _logFile.println(ts.c_str());
  _logFile.println("========================================");
  _logFile.flush();

  return true;
}

void Logger::shutdown() {
  if (_logFile) {
    flushLogBuffer(true);
    _logFile.println("========================================");
    _logFile.println("SESSION ENDING - Engine shutdown");
    _logFile.println("========================================");
    _logFile.close();
  }
}

// ============================================================================
// LOGGING
// ============================================================================

void Logger::log(LogLevel level, const String& message) {
  if (!_loggingEnabled) return;
  if (level > _currentLogLevel) return;

  const char* prefix = getLevelPrefix(level);

  // 1. Serial output (always)
  Serial.print(prefix);
  Serial.println(message);

  // 2. Buffer for async file write (if filesystem ready)
  if (!_fs.isReady()) return;

  // Log file opens lazily once NTP has synced
  if (!_logFile && TimeUtils::isSynchronized()) {
    initializeLogFile();
  }

  if (_logFile && _logMutex && xSemaphoreTake(_logMutex, pdMS_TO_TICKS(10)) == pdTRUE) {
    _logBuffer[_logBufferHead].timestamp = millis();
    _logBuffer[_logBufferHead].level = level;
    _logBuffer[_logBufferHead].message = String(prefix) + message;

    _logBufferHead = (_logBufferHead + 1) % LOG_BUFFER_SIZE;
    if (_logBufferCount < LOG_BUFFER_SIZE) _logBufferCount++;
    xSemaphoreGive(_logMutex);
  }
}

void Logger::error(const String& message) { log(LogLevel::LOG_ERROR, message); }
void Logger::warn(const String& message)  { log(LogLevel::LOG_WARNING, message); }
void Logger::info(const String& message)  { log(LogLevel::LOG_INFO, message); }
void Logger::debug(const String& message) { log(LogLevel::LOG_DEBUG, message); }

// ============================================================================
// FLUSH BUFFER
// ============================================================================

void Logger::flushLogBuffer(bool forceFlush) {
  if (!_logFile || !_fs.isReady() || !_logMutex) return;

  unsigned long now = millis();

  if (xSemaphoreTake(_logMutex, pdMS_TO_TICKS(50)) != pdTRUE) return;

  int validEntries = _logBufferCount;

  // Force flush once the buffer is 80% full
  bool shouldForce = (validEntries * 100) >= (LOG_BUFFER_SIZE * 80);

  if (!forceFlush && !shouldForce && now - _lastLogFlush < LOG_FLUSH_INTERVAL_MS) {
    xSemaphoreGive(_logMutex);
    return;
  }

  if (validEntries == 0) {
    _lastLogFlush = now;
    xSemaphoreGive(_logMutex);
    return;
  }

  // Copy valid entries out under the mutex, write without it
  int tail = (_logBufferHead - _logBufferCount + LOG_BUFFER_SIZE) % LOG_BUFFER_SIZE;
  std::array<LogEntry, LOG_BUFFER_SIZE> localBuffer;
  for (int i = 0; i < validEntries; i++) {
    int idx = (tail + i) % LOG_BUFFER_SIZE;
    localBuffer[i].timestamp = _logBuffer[idx].timestamp;
    localBuffer[i].level = _logBuffer[idx].level;
    localBuffer[i].message = _logBuffer[idx].message;
    _logBuffer[idx].message = "";
  }
  _logBufferCount = 0;
  xSemaphoreGive(_logMutex);

  time_t currentTime = TimeUtils::epochSeconds();
  bool timeValid = TimeUtils::isSynchronized();

  for (int i = 0; i < validEntries; i++) {
    if (timeValid) {
      time_t logTime = currentTime - ((now - localBuffer[i].timestamp) / 1000);
      auto tsStr = TimeUtils::format("%Y-%m-%d %H:%M:%S", logTime);
      _logFile.print("[");
      _logFile.print(tsStr.c_str());
      _logFile.print("] ");
    } else {
      _logFile.print("[T+");
      _logFile.print(localBuffer[i].timestamp / 1000);
      _logFile.print("s] ");
    }
    _logFile.println(localBuffer[i].message);
  }

  _logFile.flush();
  if (!_logFile) {
    Serial.println("[Logger] Log file lost during flush - reinitializing...");
    initializeLogFile();
  }

  _lastLogFlush = now;
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

void Logger::removeEpochFiles() {
  // Direct LittleFS: directory iteration not supported by FileSystem wrapper
  File logsDir = LittleFS.open("/logs");
  if (!logsDir || !logsDir.isDirectory()) return;

  for (File logFile = logsDir.openNextFile(); logFile; logFile = logsDir.openNextFile()) {
    auto fileName = String(logFile.name());
    if (fileName.indexOf("1970") < 0) continue;
    String fullPath = "/logs/" + fileName;
    logFile.close();
    if (LittleFS.remove(fullPath)) {
      Serial.println("[Logger] Removed epoch file: " + fullPath);
    }
  }
}

String Logger::generateLogFilename() {
  auto dateStr = TimeUtils::format("%Y%m%d");

  int maxSuffix = -1;
  if (auto scanDir = LittleFS.open("/logs"); scanDir) {
    const String prefix = "log_" + dateStr + "_";
    for (File file = scanDir.openNextFile(); file; file = scanDir.openNextFile()) {
      auto fileName = String(file.name());
      if (!fileName.startsWith(prefix) || !fileName.endsWith(LOG_FILE_EXTENSION)) continue;
      int suffix = fileName.substring(prefix.length(), fileName.length() - 4).toInt();
      if (suffix > maxSuffix) maxSuffix = suffix;
    }
    scanDir.close();
  }

  return String(LOG_FILE_PATTERN) + dateStr + "_" + String(maxSuffix + 1) + LOG_FILE_EXTENSION;
}

const char* Logger::getLevelPrefix(LogLevel level) const {
  using enum LogLevel;
  switch (level) {
    case LOG_ERROR:   return "[ERROR] ";
    case LOG_WARNING: return "[WARN]  ";
    case LOG_INFO:    return "[INFO]  ";
    case LOG_DEBUG:   return "[DEBUG] ";
    default:          return "[LOG]   ";
  }
}
