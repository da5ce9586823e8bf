// ============================================================================
// SHAKER SERVICE - Public command surface (JSON in, JSON envelope out)
// ============================================================================
// Parses and validates request bodies, runs them through CommandDispatcher
// and builds the response envelope:
//
//   success: { "success": true,  "message": "...", "data": {...} }
//   failure: { "success": false, "message": "...",
//              "error": { "code": "...", "detail": "...", "field"?: "..." } }
//
// Status codes: 200 ok, 400 malformed JSON, 422 validation,
// controller failures keep their mapped status (503 / 4xx / 5xx / 500).
// Exceptions thrown below a public operation come back as 500
// CONTROLLER_INTERNAL_ERROR.
// Transport-agnostic: APIRoutes only copies status + body to the WebServer.
// ============================================================================

#ifndef SHAKER_SERVICE_H
#define SHAKER_SERVICE_H

#include <ArduinoJson.h>
#include <new>
#include <stdexcept>
#include <string>
#include "core/Types.h"
#include "communication/CommandDispatcher.h"

struct ServiceResponse {
  int status = 200;
  std::string body;
};

class ShakerService {
public:
  ShakerService(CommandDispatcher& dispatcher, const ShakerGeometry& geometry);

  void setLogCallback(LogSink sink) { _log = sink; }

  // ========================================================================
  // SHAKING RUNS (POST bodies)
  // ========================================================================

  /** {rpm, time_sec, target} */
  ServiceResponse orbital(const std::string& requestBody);

  /** {rpm, time_sec} */
  ServiceResponse linear(const std::string& requestBody);

  /** {rpm, time_sec} */
  ServiceResponse helical(const std::string& requestBody);

  // ========================================================================
  // CONTROLLER OPERATIONS
  // ========================================================================

  /** {target} → single move to the named target */
  ServiceResponse moveToTarget(const std::string& requestBody);

  /** /printer/info, then G28 */
  ServiceResponse prepare();

  ServiceResponse pause();

  ServiceResponse printerInfo();

  /** Geometry constants (no controller call) */
  ServiceResponse parameters() const;

  DispatchState lastDispatchState() const { return _dispatcher.lastState(); }

  // ========================================================================
  // ENVELOPE HELPERS (also used by APIRoutes)
  // ========================================================================

  static ServiceResponse successResponse(const std::string& message, const JsonDocument& data);
  static ServiceResponse errorResponse(int status, const std::string& message, const std::string& code,
                                       const std::string& detail, const std::string& field = "");
  static ServiceResponse controllerError(const ControllerResult& result);

  /** Store a controller body as JSON (or as a string if it is not JSON) */
  static void attachControllerBody(JsonVariant dst, const std::string& body);

private:
  CommandDispatcher& _dispatcher;
  const ShakerGeometry& _geometry;
  LogSink _log;

  void log(LogLevel level, const std::string& message) const {
    if (_log) _log(level, message);
  }

  /**
   * Parse {rpm, time_sec[, target]} into a MotionRequest.
   * @param error Filled with the 400/422 response on failure
   */
  bool parseMotionRequest(const std::string& requestBody, ShakePattern pattern,
                          MotionRequest& out, ServiceResponse& error) const;

  bool parseTarget(JsonVariantConst value, NamedTarget& out, ServiceResponse& error) const;

  static void writePoint(JsonObject dst, const Point3& p, bool withZ);

  ServiceResponse runOrbital(const std::string& requestBody);
  ServiceResponse runLinear(const std::string& requestBody);
  ServiceResponse runHelical(const std::string& requestBody);
  ServiceResponse runMoveToTarget(const std::string& requestBody);
  ServiceResponse runPrepare();
  ServiceResponse runPause();
  ServiceResponse runPrinterInfo();

  /** 500 CONTROLLER_INTERNAL_ERROR with "<type>: <what>" as detail */
  ServiceResponse internalFailure(const char* operation, const char* type, const char* what);

  /**
   * Run one operation; anything thrown while generating, encoding or
   * dispatching becomes an internal-error envelope.
   */
  template <typename Body>
  ServiceResponse guarded(const char* operation, Body&& body) {
    try {
      return body();
    } catch (const std::bad_alloc& e) {
      return internalFailure(operation, "OutOfMemory", e.what());
    } catch (const std::length_error& e) {
      return internalFailure(operation, "LengthError", e.what());
    } catch (const std::runtime_error& e) {
      return internalFailure(operation, "RuntimeError", e.what());
    } catch (const std::exception& e) {
      return internalFailure(operation, "Exception", e.what());
    }
  }
};

#endif // SHAKER_SERVICE_H
