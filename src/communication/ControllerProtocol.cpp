// ============================================================================
// CONTROLLER PROTOCOL IMPLEMENTATION
// ============================================================================

#include "communication/ControllerProtocol.h"
#include <ArduinoJson.h>
#include <algorithm>
#include <cctype>

namespace ControllerProtocol {

// ============================================================================
// REQUEST BODY
// ============================================================================

std::string buildScriptBody(const std::string& script) {
  JsonDocument doc;
  doc["script"] = script;

  std::string body;
  serializeJson(doc, body);
  return body;
}

// ============================================================================
// HELPERS
// ============================================================================

std::string trim(const std::string& text) {
  size_t first = 0;
  while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) first++;
  size_t last = text.size();
  while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) last--;
  return text.substr(first, last - first);
}

bool isHomingRequired(const std::string& text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower.find("must home") != std::string::npos;
}

ControllerResult internalError(const std::string& type, const std::string& message) {
  ControllerResult result;
  result.error = ControllerError::ERR_INTERNAL;
  result.statusCode = 500;
  result.message = "Internal server error";
  result.detail = type + ": " + message;
  return result;
}

const char* errorCode(ControllerError error) {
  using enum ControllerError;
  switch (error) {
    case ERR_NONE:             return "OK";
    case ERR_CONNECTION:       return "CONTROLLER_CONNECTION_ERROR";
    case ERR_DEVICE_RESPONSE:  return "CONTROLLER_HTTP_ERROR";
    case ERR_HOMING_REQUIRED:  return "CONTROLLER_HOMING_REQUIRED";
    case ERR_INTERNAL:         return "CONTROLLER_INTERNAL_ERROR";
    default:                   return "UNKNOWN_ERROR";
  }
}

// ============================================================================
// RESPONSE CLASSIFICATION
// ============================================================================

ControllerResult interpretResponse(int httpCode, const std::string& body,
                                   const std::string& baseUrl, ControllerOperation op,
                                   const std::string& transportError) {
  ControllerResult result;

  // Transport failure (refused, timeout, DNS, ...)
  if (httpCode <= 0) {
    result.error = ControllerError::ERR_CONNECTION;
    result.statusCode = 503;
    result.message = "Cannot connect to controller";
    result.detail = "Connection failed. Check URL: " + baseUrl;
    if (!transportError.empty()) result.detail += " (" + transportError + ")";
    return result;
  }

  if (httpCode >= 200 && httpCode < 300) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, body);
    if (err) {
      return internalError("InvalidResponse", std::string("controller body is not JSON (") + err.c_str() + ")");
    }
    result.statusCode = httpCode;
    result.body = body;
    result.message = "OK";
    return result;
  }

  if (httpCode >= 400) {
    std::string text = trim(body);
    if (op == ControllerOperation::OP_INFO && text.size() > CONTROLLER_INFO_ERROR_BODY_LEN) {
      text = text.substr(0, CONTROLLER_INFO_ERROR_BODY_LEN);
    }
    result.error = isHomingRequired(body) ? ControllerError::ERR_HOMING_REQUIRED
                                          : ControllerError::ERR_DEVICE_RESPONSE;
    result.statusCode = httpCode;
    result.body = body;
    result.message = "Controller rejected the request";
    result.detail = "Controller error (" + std::to_string(httpCode) + "): " + text;
    return result;
  }

  return internalError("UnexpectedStatus", "HTTP " + std::to_string(httpCode));
}

} // namespace ControllerProtocol
