/**
 * NetworkManager.h - WiFi Network Management
 *
 * AP+STA dual mode:
 * - STA: joins the configured network (BridgeConfigManager or Config.cpp defaults)
 * - AP:  "<hostname>-AP" always available as a fallback access point
 *
 * STA services once connected: mDNS (http + ws), NTP, OTA.
 */

#pragma once

#include <Arduino.h>
#include <WiFi.h>
#include <ArduinoOTA.h>
#include <ESPmDNS.h>
#include <functional>
#include "core/Config.h"

class NetworkManager {
public:
    static NetworkManager& getInstance();

    /**
     * Full network initialization
     * @param onOtaStart Called before an OTA update begins (close sessions, flush logs)
     * @return true if STA connected (full mode), false in degraded AP-only mode
     */
    bool begin(std::function<void()> onOtaStart);

    bool isConnected() const { return WiFi.status() == WL_CONNECTED; }
    bool isDegraded() const { return _degradedMode; }

    /** SSID in use (EEPROM or default) */
    String getConfiguredSSID() const { return _ssid; }

    /** STA address when connected, AP address otherwise */
    String getIPAddress() const;

    /**
     * Handle OTA - MUST be called regularly (HTTP task)
     */
    void handleOTA() { if (_otaConfigured) ArduinoOTA.handle(); }

    /**
     * Re-issue WiFi.reconnect() when the STA link drops
     * (rate limited by WIFI_RECONNECT_INTERVAL_MS)
     */
    void maintain();

private:
    NetworkManager() = default;
    NetworkManager(const NetworkManager&) = delete;
    NetworkManager& operator=(const NetworkManager&) = delete;

    bool connectWiFi();
    bool setupMDNS();
    void setupNTP();
    void setupOTA();

    std::function<void()> _onOtaStart;
    String _ssid;
    bool _degradedMode = false;
    bool _otaConfigured = false;
    unsigned long _lastReconnectAttempt = 0;
};

// Global access macro
#define Network NetworkManager::getInstance()
