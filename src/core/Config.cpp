// ============================================================================
// CONFIG.CPP - Configuration Variable Definitions
// ============================================================================
// Definitions for extern variables declared in Config.h
// Values below are first-boot defaults; BridgeConfigManager (EEPROM)
// overrides the WiFi credentials and controller endpoint once saved.
// ============================================================================

#include "core/Config.h"

// ============================================================================
// WIFI CREDENTIALS
// ============================================================================
const char* ssid = "your_ssid";
const char* password = "your_wifi_password";

// ============================================================================
// OTA CREDENTIALS
// ============================================================================
const char* otaHostname = "shaker-bridge";  // mDNS: http://shaker-bridge.local
const char* otaPassword = "";               // Empty = no OTA password

// ============================================================================
// MOTION CONTROLLER
// ============================================================================
const char* controllerHost = "192.168.1.50";  // Moonraker host (port CONTROLLER_DEFAULT_PORT)
