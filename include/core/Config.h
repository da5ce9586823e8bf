// ============================================================================
// CONFIG.H - System Configuration (WiFi, OTA, Controller, Shaker Geometry)
// ============================================================================
// Central configuration file for network settings, controller endpoint,
// shaker geometry defaults and task timing.
// Modify this file to adapt to a different machine or network.
// ============================================================================

#ifndef CONFIG_H
#define CONFIG_H

#include <cstddef>  // For size_t
#include <cstdint>  // For uint8_t, uint16_t, uint32_t

// ============================================================================
// CONFIGURATION - WiFi (extern declarations - defined in Config.cpp)
// ============================================================================
extern const char* ssid;
extern const char* password;

// ============================================================================
// CONFIGURATION - OTA (Over-The-Air Updates) (extern declarations)
// ============================================================================
extern const char* otaHostname;  // Also used for mDNS (http://shaker-bridge.local)
extern const char* otaPassword;  // OTA password protection

// ============================================================================
// CONFIGURATION - Motion Controller (Moonraker) default endpoint
// ============================================================================
extern const char* controllerHost;  // Overridden by BridgeConfigManager (EEPROM)

constexpr uint16_t CONTROLLER_DEFAULT_PORT = 7125;
constexpr uint32_t CONTROLLER_HTTP_TIMEOUT_MS = 30000;   // Connect + read timeout per call
constexpr const char* CONTROLLER_INFO_PATH = "/printer/info";
constexpr const char* CONTROLLER_SCRIPT_PATH = "/printer/gcode/script";
constexpr const char* CONTROLLER_WS_PATH = "/websocket";

// Controller error bodies on /printer/info are cut to this many characters
constexpr size_t CONTROLLER_INFO_ERROR_BODY_LEN = 50;

// ============================================================================
// CONFIGURATION - Servers
// ============================================================================
constexpr uint16_t HTTP_SERVER_PORT = 80;
constexpr uint16_t RELAY_SERVER_PORT = 81;

// ============================================================================
// CONFIGURATION - Telemetry Relay
// ============================================================================
constexpr uint32_t RELAY_CONNECT_TIMEOUT_MS = 10000;    // Controller socket must open within 10s
constexpr uint8_t RELAY_PENDING_QUEUE_SIZE = 16;        // Client frames held while connecting
constexpr uint32_t RELAY_HEARTBEAT_INTERVAL_MS = 15000; // Controller socket ping
constexpr uint32_t RELAY_HEARTBEAT_TIMEOUT_MS = 3000;
constexpr uint8_t RELAY_HEARTBEAT_MISSES = 2;

// ============================================================================
// CONFIGURATION - Shaker Geometry (mm, mm/min)
// ============================================================================
constexpr double SHAKER_CENTER_X_MM = 150.0;
constexpr double SHAKER_CENTER_Y_MM = 150.0;
constexpr double SHAKER_CENTER_Z_MM = 10.0;

// Fixed origin used by the orbital origin-return sequence
constexpr double SHAKER_ORIGIN_X_MM = 150.0;
constexpr double SHAKER_ORIGIN_Y_MM = 150.0;

constexpr double ORBITAL_RADIUS_MM = 5.0;
constexpr double LINEAR_AMPLITUDE_MM = 25.0;       // Half-stroke along Y
constexpr double HELICAL_RADIUS_MM = 10.0;
constexpr double HELICAL_AMPLITUDE_Z_MM = 5.0;     // Peak-to-peak Z travel

constexpr double MIN_FEED_RATE_MM_MIN = 2000.0;
constexpr double MAX_AXIS_FEED_RATE_MM_MIN = 900.0;  // Controller Z-relevant ceiling
constexpr int TRAVERSE_FEED_RATE_MM_MIN = 6000;      // G0 rapid moves
constexpr int TARGET_FEED_RATE_MM_MIN = 3000;        // Move-to-target G1

// ============================================================================
// CONFIGURATION - Trajectory Sampling (samples per second)
// ============================================================================
// Orbital density drops for longer runs to keep the command stream short
constexpr int ORBITAL_DENSITY_SHORT = 50;    // duration <= 5s
constexpr int ORBITAL_DENSITY_MEDIUM = 30;   // duration <= 10s
constexpr int ORBITAL_DENSITY_LONG = 20;     // duration > 10s
constexpr double ORBITAL_SHORT_LIMIT_SEC = 5.0;
constexpr double ORBITAL_MEDIUM_LIMIT_SEC = 10.0;

constexpr int LINEAR_SAMPLE_DENSITY = 50;
constexpr int HELICAL_SAMPLE_DENSITY = 50;

// Longest accepted run. Each sample is one G1 line held in RAM three times
// (line list, script body, HTTP payload), so 60s at 50/s stays near 200KB.
constexpr double MAX_DURATION_SEC = 60.0;
constexpr int MAX_TRAJECTORY_SAMPLES = 3001;  // MAX_DURATION_SEC * 50 + 1

// ============================================================================
// CONFIGURATION - Logging
// ============================================================================
#define LOG_BUFFER_SIZE 100  // Circular buffer size for async log writes
constexpr uint32_t LOG_FLUSH_INTERVAL_MS = 5000;

// ============================================================================
// CONFIGURATION - EEPROM
// ============================================================================
constexpr uint16_t EEPROM_SIZE = 256;

// ============================================================================
// CONFIGURATION - System Timing Intervals
// ============================================================================
constexpr uint32_t WIFI_CONNECT_ATTEMPTS = 60;          // x 500ms
constexpr uint32_t WIFI_RECONNECT_INTERVAL_MS = 5000;   // WiFi reconnection delay
constexpr uint32_t STACK_HWM_LOG_INTERVAL_MS = 60000;   // Stack high-water mark log
constexpr uint32_t NTP_GMT_OFFSET_SEC = 3600;

// ============================================================================
// CONFIGURATION - FreeRTOS Tasks
// ============================================================================
constexpr uint32_t HTTP_TASK_STACK = 16384;   // Blocking controller calls + JSON docs
constexpr uint32_t RELAY_TASK_STACK = 8192;
constexpr uint8_t HTTP_TASK_PRIORITY = 2;
constexpr uint8_t RELAY_TASK_PRIORITY = 3;
constexpr int HTTP_TASK_CORE = 1;
constexpr int RELAY_TASK_CORE = 0;

#endif // CONFIG_H
