/**
 * BridgeConfigManager.cpp - Persistent bridge settings implementation
 *
 * Single EEPROM record with magic byte and XOR checksum.
 */

#include "communication/BridgeConfigManager.h"
#include "core/Config.h"
#include "core/UtilityEngine.h"
#include "core/eeprom/EepromManager.h"

// ============================================================================
// SINGLETON INSTANCE
// ============================================================================

BridgeConfigManager& BridgeConfigManager::getInstance() {
    static BridgeConfigManager instance;
    return instance;
}

BridgeConfigManager& BridgeConfig = BridgeConfigManager::getInstance();

// ============================================================================
// CONFIGURATION CHECK
// ============================================================================

bool BridgeConfigManager::isConfigured() const {
    if (EEPROM.read(BRIDGE_EEPROM_FLAG) != BRIDGE_CONFIG_MAGIC) {
        return false;
    }
    return calculateChecksum() == EEPROM.read(BRIDGE_EEPROM_CHECKSUM);
}

// ============================================================================
// LOAD
// ============================================================================

BridgeSettings BridgeConfigManager::load() const {
    BridgeSettings settings;

    if (!isConfigured()) {
        settings.ssid = ssid;
        settings.password = password;
        settings.controllerHost = controllerHost;
        settings.controllerPort = CONTROLLER_DEFAULT_PORT;
        return settings;
    }

    settings.ssid = readString(BRIDGE_EEPROM_SSID, BRIDGE_SSID_MAX_LEN);
    settings.password = readString(BRIDGE_EEPROM_PASSWORD, BRIDGE_PASSWORD_MAX_LEN);
    settings.controllerHost = readString(BRIDGE_EEPROM_HOST, BRIDGE_HOST_MAX_LEN);
    settings.controllerPort = static_cast<uint16_t>(EEPROM.read(BRIDGE_EEPROM_PORT) |
                                                    (EEPROM.read(BRIDGE_EEPROM_PORT + 1) << 8));

    // Partially written records fall back per field
    if (settings.ssid.length() == 0) {
        settings.ssid = ssid;
        settings.password = password;
    }
    if (settings.controllerHost.length() == 0) settings.controllerHost = controllerHost;
    if (settings.controllerPort == 0) settings.controllerPort = CONTROLLER_DEFAULT_PORT;

    return settings;
}

// ============================================================================
// SAVE
// ============================================================================

bool BridgeConfigManager::saveWiFi(const String& newSsid, const String& newPassword) {
    if (newSsid.length() == 0 || newSsid.length() > BRIDGE_SSID_MAX_LEN - 1) {
        if (engine) engine->error("Bridge config: invalid SSID length");
        return false;
    }
    if (newPassword.length() > BRIDGE_PASSWORD_MAX_LEN - 1) {
        if (engine) engine->error("Bridge config: password too long");
        return false;
    }

    BridgeSettings settings = load();
    settings.ssid = newSsid;
    settings.password = newPassword;
    return write(settings);
}

bool BridgeConfigManager::saveController(const String& host, uint16_t port) {
    if (host.length() == 0 || host.length() > BRIDGE_HOST_MAX_LEN - 1 || port == 0) {
        if (engine) engine->error("Bridge config: invalid controller endpoint");
        return false;
    }

    BridgeSettings settings = load();
    settings.controllerHost = host;
    settings.controllerPort = port;
    return write(settings);
}

bool BridgeConfigManager::write(const BridgeSettings& settings) {
    EEPROM.write(BRIDGE_EEPROM_FLAG, BRIDGE_CONFIG_MAGIC);
    writeString(BRIDGE_EEPROM_SSID, settings.ssid, BRIDGE_SSID_MAX_LEN);
    writeString(BRIDGE_EEPROM_PASSWORD, settings.password, BRIDGE_PASSWORD_MAX_LEN);
    writeString(BRIDGE_EEPROM_HOST, settings.controllerHost, BRIDGE_HOST_MAX_LEN);
    EEPROM.write(BRIDGE_EEPROM_PORT, settings.controllerPort & 0xFF);
    EEPROM.write(BRIDGE_EEPROM_PORT + 1, (settings.controllerPort >> 8) & 0xFF);
    EEPROM.write(BRIDGE_EEPROM_CHECKSUM, calculateChecksum());

    if (!EepromManager::commitWithRetry("Bridge config")) {
        if (engine) engine->error("Bridge config: EEPROM commit failed");
        return false;
    }

    if (engine) {
        engine->info("Bridge config saved: SSID=" + settings.ssid + ", controller=" +
                     controllerBaseUrl(settings));
    }
    return true;
}

// ============================================================================
// HELPERS
// ============================================================================

String BridgeConfigManager::controllerBaseUrl(const BridgeSettings& settings) {
    return "http://" + settings.controllerHost + ":" + String(settings.controllerPort);
}

void BridgeConfigManager::writeString(int addr, const String& value, int maxLen) {
    for (int i = 0; i < maxLen; i++) {
        EEPROM.write(addr + i, i < (int)value.length() ? value[i] : 0);
    }
}

String BridgeConfigManager::readString(int addr, int maxLen) {
    char buf[BRIDGE_HOST_MAX_LEN + 1] = {0};
    int limit = min(maxLen, BRIDGE_HOST_MAX_LEN);
    for (int i = 0; i < limit; i++) {
        buf[i] = EEPROM.read(addr + i);
        if (buf[i] == 0) break;
    }
    buf[limit] = 0;
    return String(buf);
}

uint8_t BridgeConfigManager::calculateChecksum() const {
    uint8_t checksum = 0;
    for (int i = BRIDGE_EEPROM_FLAG; i < BRIDGE_EEPROM_CHECKSUM; i++) {
        checksum ^= EEPROM.read(i);
    }
    return checksum;
}
