// ============================================================================
// CONTROLLER PROTOCOL - Moonraker HTTP body codec + status classification
// ============================================================================
// Pure functions shared by ControllerClient and the tests:
// - request body for /printer/gcode/script
// - mapping of (HTTP code, body) to ControllerResult
//
// Classification:
//   code <= 0            → ERR_CONNECTION (503)   transport failure / timeout
//   2xx + JSON body      → ERR_NONE
//   2xx + non-JSON body  → ERR_INTERNAL (500)
//   >= 400               → ERR_DEVICE_RESPONSE (controller status)
//                          or ERR_HOMING_REQUIRED when the text says "must home"
//   anything else        → ERR_INTERNAL (500)
// ============================================================================

#pragma once

#include <string>
#include "core/Types.h"

enum class ControllerOperation {
  OP_INFO,    // GET /printer/info
  OP_SCRIPT   // POST /printer/gcode/script
};

namespace ControllerProtocol {

/** {"script": "<script>"} */
std::string buildScriptBody(const std::string& script);

/**
 * Classify one HTTP exchange.
 * @param httpCode HTTP status, or <= 0 for a transport failure
 * @param body Response body (may be empty)
 * @param baseUrl Controller base URL for connection error details
 * @param op Which call produced the response
 * @param transportError Optional transport error text (HTTPClient::errorToString)
 */
ControllerResult interpretResponse(int httpCode, const std::string& body,
                                   const std::string& baseUrl, ControllerOperation op,
                                   const std::string& transportError = "");

/** Case-insensitive "must home" match (covers "Must home axis first") */
bool isHomingRequired(const std::string& text);

/** Build an ERR_INTERNAL result "<type>: <message>" */
ControllerResult internalError(const std::string& type, const std::string& message);

/** Stable error code string for the JSON envelope */
const char* errorCode(ControllerError error);

/** Whitespace-trimmed copy */
std::string trim(const std::string& text);

} // namespace ControllerProtocol
