// ============================================================================
// API ROUTES MANAGER - Implementation
// ============================================================================
// HTTP routes for the shaker bridge:
//   /shaker/*      shaking runs, target moves, geometry
//   /printer/*     controller prepare / pause / info
//   /api/system/*  bridge status, controller endpoint, WiFi, logging
// ============================================================================

#include "communication/APIRoutes.h"
#include <ArduinoJson.h>
#include <WiFi.h>
#include "communication/BridgeConfigManager.h"
#include "communication/ControllerClient.h"
#include "communication/NetworkManager.h"
#include "communication/TelemetryRelay.h"
#include "core/UtilityEngine.h"
#include "core/Validators.h"

namespace {

WebServer* httpServer = nullptr;
ShakerService* shaker = nullptr;
ControllerClient* controllerClient = nullptr;
TelemetryRelay* telemetryRelay = nullptr;

// ============================================================================
// REQUEST HELPERS
// ============================================================================

std::string requestBody() {
  return std::string(httpServer->arg("plain").c_str());
}

/**
 * Parse the request body as a JSON object - sends 400 if missing/invalid.
 * @return true if doc is populated, false if the error response was already sent
 */
bool parseJsonBody(JsonDocument& doc) {
  if (!httpServer->hasArg("plain")) {
    sendServiceResponse(ShakerService::errorResponse(400, "Invalid request body", "INVALID_JSON",
                                                     "Request body is empty"));
    return false;
  }
  DeserializationError err = deserializeJson(doc, httpServer->arg("plain"));
  if (err || !doc.is<JsonObject>()) {
    sendServiceResponse(ShakerService::errorResponse(400, "Invalid request body", "INVALID_JSON",
                                                     err ? err.c_str() : "Expected a JSON object"));
    return false;
  }
  return true;
}

void sendValidationError(const std::string& detail, const char* field) {
  sendServiceResponse(ShakerService::errorResponse(422, "Validation failed", "VALIDATION_ERROR",
                                                   detail, field));
}

void handleCORSPreflight() {
  sendCORSHeaders();
  httpServer->send(204);
}

// ============================================================================
// SYSTEM ROUTES
// ============================================================================

void handleSystemStatus() {
  JsonDocument data;
  data["uptime_ms"] = millis();
  data["free_heap"] = ESP.getFreeHeap();
  data["min_free_heap"] = ESP.getMinFreeHeap();

  JsonObject wifi = data["wifi"].to<JsonObject>();
  wifi["ssid"] = Network.getConfiguredSSID();
  wifi["connected"] = Network.isConnected();
  wifi["degraded"] = Network.isDegraded();
  wifi["ip"] = Network.getIPAddress();
  wifi["rssi"] = WiFi.RSSI();

  JsonObject controller = data["controller"].to<JsonObject>();
  controller["url"] = controllerClient->baseUrl();
  controller["dispatch_state"] = CommandDispatcher::stateName(shaker->lastDispatchState());

  JsonObject relay = data["relay"].to<JsonObject>();
  relay["state"] = RelaySession::stateName(telemetryRelay->state());
  relay["sessions"] = telemetryRelay->sessionsServed();

  JsonObject fs = data["filesystem"].to<JsonObject>();
  fs["ready"] = engine->isFilesystemReady();
  fs["total_bytes"] = engine->getTotalBytes();
  fs["used_bytes"] = engine->getUsedBytes();

  JsonObject logging = data["logging"].to<JsonObject>();
  logging["enabled"] = engine->isLoggingEnabled();
  logging["level"] = static_cast<int>(engine->getLogLevel());
  logging["file"] = engine->getCurrentLogFile();

  sendServiceResponse(ShakerService::successResponse("Bridge status", data));
}

void handleControllerConfig() {
  JsonDocument doc;
  if (!parseJsonBody(doc)) return;

  ControllerEndpoint current = controllerClient->endpoint();

  if (!doc["controller_host"].is<const char*>()) {
    sendValidationError("controller_host must be a string", "controller_host");
    return;
  }
  std::string host = doc["controller_host"].as<const char*>();
  std::string err;
  if (!Validators::controllerHost(host, err)) {
    sendValidationError(err, "controller_host");
    return;
  }

  long port = current.port;
  if (!doc["controller_port"].isNull()) {
    if (!doc["controller_port"].is<long>()) {
      sendValidationError("controller_port must be an integer", "controller_port");
      return;
    }
    port = doc["controller_port"].as<long>();
    if (!Validators::controllerPort(port, err)) {
      sendValidationError(err, "controller_port");
      return;
    }
  }

  if (!BridgeConfig.saveController(String(host.c_str()), static_cast<uint16_t>(port))) {
    sendServiceResponse(ShakerService::errorResponse(500, "Internal server error", "CONFIG_SAVE_FAILED",
                                                     "EEPROM commit failed"));
    return;
  }
  controllerClient->setEndpoint(host, static_cast<uint16_t>(port));
  engine->info("Controller endpoint set to " + String(controllerClient->baseUrl().c_str()));

  JsonDocument data;
  data["controller_host"] = host;
  data["controller_port"] = port;
  data["url"] = controllerClient->baseUrl();
  sendServiceResponse(ShakerService::successResponse("Controller endpoint saved", data));
}

void handleWiFiConfig() {
  JsonDocument doc;
  if (!parseJsonBody(doc)) return;

  if (!doc["ssid"].is<const char*>()) {
    sendValidationError("ssid must be a string", "ssid");
    return;
  }
  if (!doc["password"].isNull() && !doc["password"].is<const char*>()) {
    sendValidationError("password must be a string", "password");
    return;
  }
  String newSsid = doc["ssid"].as<const char*>();
  String newPassword = doc["password"] | "";

  std::string err;
  if (!Validators::wifiSsid(newSsid.c_str(), err)) {
    sendValidationError(err, "ssid");
    return;
  }
  if (!Validators::wifiPassword(newPassword.c_str(), err)) {
    sendValidationError(err, "password");
    return;
  }

  if (!BridgeConfig.saveWiFi(newSsid, newPassword)) {
    sendServiceResponse(ShakerService::errorResponse(500, "Internal server error", "CONFIG_SAVE_FAILED",
                                                     "EEPROM commit failed"));
    return;
  }

  JsonDocument data;
  data["ssid"] = newSsid;
  data["reboot_required"] = true;
  sendServiceResponse(ShakerService::successResponse("WiFi settings saved", data));
}

void writeLoggingState(JsonDocument& data) {
  data["enabled"] = engine->isLoggingEnabled();
  data["level"] = static_cast<int>(engine->getLogLevel());
}

void handleGetLogging() {
  JsonDocument data;
  writeLoggingState(data);
  sendServiceResponse(ShakerService::successResponse("Logging preferences", data));
}

void handleSetLogging() {
  JsonDocument doc;
  if (!parseJsonBody(doc)) return;

  if (!doc["enabled"].isNull()) {
    if (!doc["enabled"].is<bool>()) {
      sendValidationError("enabled must be a boolean", "enabled");
      return;
    }
    engine->setLoggingEnabled(doc["enabled"].as<bool>());
  }
  if (!doc["level"].isNull()) {
    int level = doc["level"] | -1;
    if (!doc["level"].is<int>() || level < 0 || level > static_cast<int>(LogLevel::LOG_DEBUG)) {
      sendValidationError("level must be an integer 0-3", "level");
      return;
    }
    engine->setLogLevel(static_cast<LogLevel>(level));
  }
  engine->saveLoggingPreferences();

  JsonDocument data;
  writeLoggingState(data);
  sendServiceResponse(ShakerService::successResponse("Logging preferences saved", data));
}

// ============================================================================
// ROUTE REGISTRATION HELPERS
// ============================================================================

void route(const char* path, HTTPMethod method, WebServer::THandlerFunction handler) {
  httpServer->on(path, method, [path, handler]() {
    engine->debug(String("HTTP ") + (httpServer->method() == HTTP_GET ? "GET " : "POST ") + path);
    handler();
  });
  httpServer->on(path, HTTP_OPTIONS, handleCORSPreflight);
}

} // namespace

// ============================================================================
// PUBLIC HELPERS
// ============================================================================

void sendCORSHeaders() {
  httpServer->sendHeader("Access-Control-Allow-Origin", "*");
  httpServer->sendHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
  httpServer->sendHeader("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

void sendServiceResponse(const ServiceResponse& response) {
  sendCORSHeaders();
  httpServer->send(response.status, "application/json", String(response.body.c_str()));
}

// ============================================================================
// SETUP
// ============================================================================

void setupAPIRoutes(WebServer& server, ShakerService& service,
                    ControllerClient& controller, TelemetryRelay& relay) {
  httpServer = &server;
  shaker = &service;
  controllerClient = &controller;
  telemetryRelay = &relay;

  // ========================================================================
  // SHAKER
  // ========================================================================
  route("/shaker/orbital", HTTP_POST, []() { sendServiceResponse(shaker->orbital(requestBody())); });
  route("/shaker/linear", HTTP_POST, []() { sendServiceResponse(shaker->linear(requestBody())); });
  route("/shaker/3d", HTTP_POST, []() { sendServiceResponse(shaker->helical(requestBody())); });
  route("/shaker/move", HTTP_POST, []() { sendServiceResponse(shaker->moveToTarget(requestBody())); });
  route("/shaker/parameters", HTTP_GET, []() { sendServiceResponse(shaker->parameters()); });

  // ========================================================================
  // PRINTER (controller passthrough)
  // ========================================================================
  route("/printer/run", HTTP_GET, []() { sendServiceResponse(shaker->prepare()); });
  route("/printer/pause", HTTP_POST, []() { sendServiceResponse(shaker->pause()); });
  route("/printer/info", HTTP_GET, []() { sendServiceResponse(shaker->printerInfo()); });

  // ========================================================================
  // SYSTEM
  // ========================================================================
  route("/api/system/status", HTTP_GET, handleSystemStatus);
  route("/api/system/config", HTTP_POST, handleControllerConfig);
  route("/api/system/wifi", HTTP_POST, handleWiFiConfig);
  route("/api/system/logging", HTTP_GET, handleGetLogging);
  route("/api/system/logging", HTTP_POST, handleSetLogging);

  server.onNotFound([]() {
    if (httpServer->method() == HTTP_OPTIONS) {
      handleCORSPreflight();
      return;
    }
    sendServiceResponse(ShakerService::errorResponse(404, "Not found", "NOT_FOUND",
                                                     std::string(httpServer->uri().c_str())));
  });

  engine->info("API routes registered");
}
