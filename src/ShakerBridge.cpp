// ============================================================================
// ESP32 SHAKER BRIDGE
// ============================================================================
// HTTP command surface + WebSocket telemetry relay in front of a
// Moonraker/Klipper motion controller driving a shaker platform.
// Patterns: orbital (XY circle), linear (Y stroke), helical 3D (circle + Z)
// ============================================================================

// ============================================================================
// LIBRARIES
// ============================================================================
#include <Arduino.h>
#include <WiFi.h>
#include <WebServer.h>

// ============================================================================
// PROJECT HEADERS
// ============================================================================
#include "core/Config.h"
#include "core/Types.h"
#include "core/UtilityEngine.h"

#include "communication/APIRoutes.h"
#include "communication/BridgeConfigManager.h"
#include "communication/CommandDispatcher.h"
#include "communication/ControllerClient.h"
#include "communication/NetworkManager.h"
#include "communication/ShakerService.h"
#include "communication/TelemetryRelay.h"

// ============================================================================
// LOGGING - Use engine->info(), engine->error(), engine->warn(), engine->debug()
// ============================================================================

// Global UtilityEngine instance (initialized in setup)
UtilityEngine* engine = nullptr;

// ============================================================================
// SERVERS & SERVICES (constructed in setup, live forever)
// ============================================================================
WebServer server(HTTP_SERVER_PORT);

static const ShakerGeometry geometry;
static ControllerClient* controller = nullptr;
static CommandDispatcher* dispatcher = nullptr;
static ShakerService* shaker = nullptr;
static TelemetryRelay* relay = nullptr;

static TaskHandle_t httpTaskHandle = nullptr;
static TaskHandle_t relayTaskHandle = nullptr;

void httpTask(void* param);
void relayTask(void* param);

// ============================================================================
// UTILITY HELPERS (shared by FreeRTOS tasks)
// ============================================================================

/**
 * Log FreeRTOS stack high-water mark periodically (safety diagnostic).
 * Each caller must provide its own lastCheckMs to avoid shared-state between tasks.
 */
void logStackHighWaterMark(const char* taskName, uint32_t stackSize, unsigned long& lastCheckMs) {
  if (millis() - lastCheckMs > STACK_HWM_LOG_INTERVAL_MS) {
    lastCheckMs = millis();
    UBaseType_t hwm = uxTaskGetStackHighWaterMark(NULL);
    engine->debug(String(taskName) + " stack HWM: " + String(hwm) + " bytes free (of " + String(stackSize) + ")");
    if (hwm < 500) {
      engine->warn(String(taskName) + " stack critically low! Consider increasing stack size.");
    }
  }
}

static const char* resetReasonName(esp_reset_reason_t reason) {
  switch (reason) {
    case ESP_RST_POWERON:   return "POWER_ON";
    case ESP_RST_EXT:       return "EXTERNAL_PIN";
    case ESP_RST_SW:        return "SOFTWARE";
    case ESP_RST_PANIC:     return "PANIC";
    case ESP_RST_INT_WDT:   return "INTERRUPT_WDT";
    case ESP_RST_TASK_WDT:  return "TASK_WDT";
    case ESP_RST_WDT:       return "OTHER_WDT";
    case ESP_RST_BROWNOUT:  return "BROWNOUT";
    default:                return "UNKNOWN";
  }
}

// ============================================================================
// SETUP HELPERS
// ============================================================================

/** Build the controller client, dispatcher, service and relay */
static void initServices() {
  BridgeSettings settings = BridgeConfig.load();

  controller = new ControllerClient(settings.controllerHost.c_str(), settings.controllerPort);

  dispatcher = new CommandDispatcher(*controller, geometry);
  dispatcher->setLogCallback(engine->logSink());

  shaker = new ShakerService(*dispatcher, geometry);
  shaker->setLogCallback(engine->logSink());

  relay = new TelemetryRelay(*controller);
  relay->setLogCallback(engine->logSink());

  engine->info("Controller endpoint: " + String(controller->baseUrl().c_str()));
}

/** Create the HTTP and relay tasks */
static void initTasks() {
  BaseType_t httpResult = xTaskCreatePinnedToCore(httpTask, "HttpTask", HTTP_TASK_STACK, NULL,
                                                  HTTP_TASK_PRIORITY, &httpTaskHandle, HTTP_TASK_CORE);
  BaseType_t relayResult = xTaskCreatePinnedToCore(relayTask, "RelayTask", RELAY_TASK_STACK, NULL,
                                                   RELAY_TASK_PRIORITY, &relayTaskHandle, RELAY_TASK_CORE);

  if (httpResult != pdPASS || relayResult != pdPASS) {
    engine->error("Failed to create FreeRTOS tasks! Http=" + String(httpResult) + " Relay=" + String(relayResult));
    return;
  }
  engine->info("Tasks started: HttpTask=Core" + String(HTTP_TASK_CORE) + " RelayTask=Core" + String(RELAY_TASK_CORE));
}

// ============================================================================
// SETUP - INITIALIZATION
// ============================================================================

void setup() {
  Serial.begin(115200);
  delay(100);  // Brief pause for Serial stability

  esp_reset_reason_t resetReason = esp_reset_reason();
  Serial.printf("\nRESET REASON: %s (code %d)\n", resetReasonName(resetReason), (int)resetReason);

  // ── 1. Filesystem, EEPROM & Logging ──
  static UtilityEngine engineInstance;
  engine = &engineInstance;
  if (!engine->initialize()) {
    Serial.println("UtilityEngine initialization failed (degraded: Serial logging only)");
  } else {
    engine->info("UtilityEngine initialized (LittleFS + Logging ready)");
  }
  engine->info("=== ESP32 Shaker Bridge ===");
  if (resetReason == ESP_RST_PANIC || resetReason == ESP_RST_TASK_WDT || resetReason == ESP_RST_BROWNOUT) {
    engine->warn(String("Previous run ended abnormally: ") + resetReasonName(resetReason));
  }

  // ── 2. Services ──
  initServices();

  // ── 3. Network ──
  Network.begin([]() { relay->requestShutdown(); });

  // ── 4. Servers ──
  setupAPIRoutes(server, *shaker, *controller, *relay);
  server.begin();
  engine->info("HTTP server started on port " + String(HTTP_SERVER_PORT));
  relay->begin();

  // ── 5. Tasks ──
  initTasks();

  engine->printStatus();
}

// ============================================================================
// HTTP TASK - Command surface (controller calls block up to 30s each)
// ============================================================================
void httpTask(void* param) { // NOSONAR(cpp:S5008) FreeRTOS task signature requires void*
  engine->info("HttpTask started on Core " + String(xPortGetCoreID()));

  while (true) {
    server.handleClient();
    Network.handleOTA();
    Network.maintain();

    engine->flushLogBuffer();

    { static unsigned long hwmTimer = 0; logStackHighWaterMark("HttpTask", HTTP_TASK_STACK, hwmTimer); }

    vTaskDelay(pdMS_TO_TICKS(2));
  }
}

// ============================================================================
// RELAY TASK - Both relay sockets + connect timeout
// ============================================================================
void relayTask(void* param) { // NOSONAR(cpp:S5008) FreeRTOS task signature requires void*
  engine->info("RelayTask started on Core " + String(xPortGetCoreID()));

  while (true) {
    relay->loop();

    { static unsigned long hwmTimer = 0; logStackHighWaterMark("RelayTask", RELAY_TASK_STACK, hwmTimer); }

    vTaskDelay(pdMS_TO_TICKS(1));
  }
}

// ============================================================================
// MAIN LOOP - FreeRTOS tasks handle everything
// ============================================================================
void loop() {
  vTaskDelay(portMAX_DELAY);  // Suspend loop() indefinitely
}
