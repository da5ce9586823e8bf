/**
 * BridgeConfigManager.h - Persistent bridge settings
 *
 * Manages WiFi credentials and the controller endpoint stored in EEPROM:
 * - Load with fallback to Config.cpp defaults
 * - Save controller host/port (from POST /api/system/config)
 * - Clear configuration (factory reset)
 *
 * EEPROM Layout (starting at address 4):
 *   Addr 4        : Configured flag (0xB5 = valid config)
 *   Addr 5-36     : SSID (32 bytes, null-terminated)
 *   Addr 37-100   : Password (64 bytes, null-terminated)
 *   Addr 101-164  : Controller host (64 bytes, null-terminated)
 *   Addr 165-166  : Controller port (little endian)
 *   Addr 167      : Checksum (XOR of bytes 4-166)
 */

#pragma once

#include <Arduino.h>
#include <EEPROM.h>

#define BRIDGE_EEPROM_FLAG        4
#define BRIDGE_EEPROM_SSID        5
#define BRIDGE_EEPROM_PASSWORD    37
#define BRIDGE_EEPROM_HOST        101
#define BRIDGE_EEPROM_PORT        165
#define BRIDGE_EEPROM_CHECKSUM    167

#define BRIDGE_SSID_MAX_LEN       32
#define BRIDGE_PASSWORD_MAX_LEN   64
#define BRIDGE_HOST_MAX_LEN       64
#define BRIDGE_CONFIG_MAGIC       0xB5

struct BridgeSettings {
    String ssid;
    String password;
    String controllerHost;
    uint16_t controllerPort = 0;
};

class BridgeConfigManager {
public:
    static BridgeConfigManager& getInstance();

    /**
     * Check if a valid configuration is stored
     */
    bool isConfigured() const;

    /**
     * Current settings: EEPROM when valid, Config.cpp defaults otherwise
     */
    BridgeSettings load() const;

    /**
     * Persist WiFi credentials, keeping the stored controller endpoint
     * @return false on invalid lengths
     */
    bool saveWiFi(const String& ssid, const String& password);

    /**
     * Persist the controller endpoint, keeping the stored WiFi credentials
     * @return false on invalid host length or port 0
     */
    bool saveController(const String& host, uint16_t port);

    /** "http://host:port" */
    static String controllerBaseUrl(const BridgeSettings& settings);

private:
    BridgeConfigManager() = default;
    BridgeConfigManager(const BridgeConfigManager&) = delete;
    BridgeConfigManager& operator=(const BridgeConfigManager&) = delete;

    bool write(const BridgeSettings& settings);

    static void writeString(int addr, const String& value, int maxLen);
    static String readString(int addr, int maxLen);

    uint8_t calculateChecksum() const;
};

// Global accessor (singleton reference)
extern BridgeConfigManager& BridgeConfig;
