/**
 * NetworkManager.cpp - WiFi, OTA, mDNS, NTP Implementation
 */

#include "communication/NetworkManager.h"
#include "communication/BridgeConfigManager.h"
#include "core/TimeUtils.h"
#include "core/UtilityEngine.h"

// ============================================================================
// SINGLETON INSTANCE
// ============================================================================

NetworkManager& NetworkManager::getInstance() {
    static NetworkManager instance;
    return instance;
}

// ============================================================================
// WIFI CONNECTION
// ============================================================================

bool NetworkManager::connectWiFi() {
    WiFi.mode(WIFI_AP_STA);

    BridgeSettings settings = BridgeConfig.load();
    _ssid = settings.ssid;
    engine->info(String(BridgeConfig.isConfigured() ? "Using saved WiFi config: " : "Using default WiFi config: ") + _ssid);

    WiFi.begin(settings.ssid.c_str(), settings.password.c_str());
    engine->info("Connecting to WiFi: " + _ssid);

    uint32_t attempts = 0;
    while (WiFi.status() != WL_CONNECTED && attempts < WIFI_CONNECT_ATTEMPTS) {
        delay(500);
        Serial.print(".");
        attempts++;
        if (attempts % 10 == 0) {
            engine->info(String("[") + String(attempts) + "/" + String(WIFI_CONNECT_ATTEMPTS) + "] WiFi connecting...");
        }
    }
    Serial.println();

    bool connected = (WiFi.status() == WL_CONNECTED);
    if (connected) {
        engine->info("WiFi connected, STA IP: " + WiFi.localIP().toString());
    } else {
        engine->error("WiFi connection failed");
    }

    // AP stays up even when STA fails
    String apName = String(otaHostname) + "-AP";
    WiFi.softAP(apName.c_str());
    engine->info("AP started: " + apName + " (" + WiFi.softAPIP().toString() + ")");

    return connected;
}

String NetworkManager::getIPAddress() const {
    if (WiFi.status() == WL_CONNECTED) return WiFi.localIP().toString();
    return WiFi.softAPIP().toString();
}

void NetworkManager::maintain() {
    if (_degradedMode || WiFi.status() == WL_CONNECTED) return;

    unsigned long now = millis();
    if (now - _lastReconnectAttempt < WIFI_RECONNECT_INTERVAL_MS) return;
    _lastReconnectAttempt = now;

    engine->warn("WiFi link lost, reconnecting...");
    WiFi.reconnect();
}

// ============================================================================
// MDNS SETUP
// ============================================================================

bool NetworkManager::setupMDNS() {
    if (!MDNS.begin(otaHostname)) {
        engine->error("Error starting mDNS responder");
        return false;
    }
    MDNS.addService("http", "tcp", HTTP_SERVER_PORT);
    MDNS.addService("ws", "tcp", RELAY_SERVER_PORT);
    engine->info("mDNS responder started: http://" + String(otaHostname) + ".local");
    return true;
}

// ============================================================================
// NTP TIME SYNC
// ============================================================================

void NetworkManager::setupNTP() {
    configTime(NTP_GMT_OFFSET_SEC, 0, "pool.ntp.org", "time.nist.gov");
    engine->info("NTP time configured");

    // Short grace period; the log file opens lazily once time is valid
    delay(1000);
    if (TimeUtils::isSynchronized()) {
        engine->info("Time synchronized: " + TimeUtils::format("%Y-%m-%d %H:%M:%S"));
    }
}

// ============================================================================
// OTA CONFIGURATION
// ============================================================================

void NetworkManager::setupOTA() {
    ArduinoOTA.setHostname(otaHostname);
    if (strlen(otaPassword) > 0) {
        ArduinoOTA.setPassword(otaPassword);
    }

    ArduinoOTA.onStart([this]() {
        String type = (ArduinoOTA.getCommand() == U_FLASH) ? "firmware" : "filesystem";
        engine->info("OTA update starting: " + type);
        if (_onOtaStart) _onOtaStart();
        // A filesystem image overwrites LittleFS: close the session log first
        engine->shutdown();
    });

    ArduinoOTA.onEnd([]() {
        engine->info("OTA update complete - rebooting...");
    });

    ArduinoOTA.onProgress([](unsigned int progress, unsigned int total) {
        static unsigned int lastPercent = 0;
        unsigned int percent = (progress * 100) / total;
        if (percent >= lastPercent + 10) {
            engine->info("OTA progress: " + String(percent) + "%");
            lastPercent = percent;
        }
    });

    ArduinoOTA.onError([](ota_error_t error) {
        engine->error("OTA error [" + String(error) + "]");
        switch (error) {
            case OTA_AUTH_ERROR:    engine->error("   Authentication Failed"); break;
            case OTA_BEGIN_ERROR:   engine->error("   Begin Failed"); break;
            case OTA_CONNECT_ERROR: engine->error("   Connect Failed"); break;
            case OTA_RECEIVE_ERROR: engine->error("   Receive Failed"); break;
            case OTA_END_ERROR:     engine->error("   End Failed"); break;
        }
    });

    ArduinoOTA.begin();
    _otaConfigured = true;
    engine->info("OTA ready - hostname: " + String(otaHostname));
}

// ============================================================================
// FULL INITIALIZATION
// ============================================================================

bool NetworkManager::begin(std::function<void()> onOtaStart) {
    _onOtaStart = std::move(onOtaStart);

    bool connected = connectWiFi();
    _degradedMode = !connected;

    if (connected) {
        setupMDNS();
        setupNTP();
        setupOTA();
        engine->info("Network: FULL MODE (STA + AP + OTA + mDNS)");
    } else {
        engine->warn("Network: DEGRADED MODE (AP only at " + WiFi.softAPIP().toString() + ")");
        engine->warn("Controller unreachable until WiFi is configured (POST /api/system/wifi)");
    }

    return connected;
}
