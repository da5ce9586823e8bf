// ============================================================================
// API ROUTES MANAGER
// ============================================================================
// HTTP server routes (synchronous WebServer, served from the HTTP task)
// Header file: declarations only
// Implementation in src/communication/APIRoutes.cpp
// ============================================================================

#ifndef API_ROUTES_H
#define API_ROUTES_H

#include <WebServer.h>
#include "communication/ShakerService.h"

class ControllerClient;
class TelemetryRelay;

// ============================================================================
// MAIN SETUP FUNCTION
// ============================================================================

/**
 * Register every route on the HTTP server
 * Must be called in setup() before server.begin()
 * @param server Synchronous WebServer (port 80)
 * @param service Shaker command surface
 * @param controller Controller client (endpoint updates)
 * @param relay Telemetry relay (status only)
 */
void setupAPIRoutes(WebServer& server, ShakerService& service,
                    ControllerClient& controller, TelemetryRelay& relay);

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

void sendCORSHeaders();

/** Copy a ServiceResponse (status + JSON body) to the client */
void sendServiceResponse(const ServiceResponse& response);

#endif // API_ROUTES_H
