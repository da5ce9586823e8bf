// ============================================================================
// SHAKER SERVICE IMPLEMENTATION
// ============================================================================

#include "communication/ShakerService.h"
#include "communication/ControllerProtocol.h"
#include "core/MotionMath.h"
#include "core/Validators.h"

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ShakerService::ShakerService(CommandDispatcher& dispatcher, const ShakerGeometry& geometry)
  : _dispatcher(dispatcher),
    _geometry(geometry) {}

// ============================================================================
// ENVELOPE HELPERS
// ============================================================================

ServiceResponse ShakerService::successResponse(const std::string& message, const JsonDocument& data) {
  JsonDocument doc;
  doc["success"] = true;
  doc["message"] = message;
  doc["data"].set(data.as<JsonVariantConst>());

  ServiceResponse response;
  response.status = 200;
  serializeJson(doc, response.body);
  return response;
}

ServiceResponse ShakerService::errorResponse(int status, const std::string& message, const std::string& code,
                                             const std::string& detail, const std::string& field) {
  JsonDocument doc;
  doc["success"] = false;
  doc["message"] = message;
  JsonObject error = doc["error"].to<JsonObject>();
  error["code"] = code;
  error["detail"] = detail;
  if (!field.empty()) error["field"] = field;

  ServiceResponse response;
  response.status = status;
  serializeJson(doc, response.body);
  return response;
}

ServiceResponse ShakerService::controllerError(const ControllerResult& result) {
  return errorResponse(result.statusCode, result.message,
                       ControllerProtocol::errorCode(result.error), result.detail);
}

void ShakerService::attachControllerBody(JsonVariant dst, const std::string& body) {
  JsonDocument parsed;
  if (body.empty() || deserializeJson(parsed, body)) {
    dst.set(body);
    return;
  }
  dst.set(parsed.as<JsonVariantConst>());
}

void ShakerService::writePoint(JsonObject dst, const Point3& p, bool withZ) {
  dst["x"] = p.x;
  dst["y"] = p.y;
  if (withZ) dst["z"] = p.z;
}

// ============================================================================
// REQUEST PARSING
// ============================================================================

bool ShakerService::parseTarget(JsonVariantConst value, NamedTarget& out, ServiceResponse& error) const {
  if (!value.is<const char*>()) {
    error = errorResponse(422, "Validation failed", "VALIDATION_ERROR",
                          "target is required (target_A or target_B)", "target");
    return false;
  }
  std::string err;
  if (!Validators::target(value.as<std::string>(), _geometry, out, err)) {
    error = errorResponse(422, "Validation failed", "VALIDATION_ERROR", err, "target");
    return false;
  }
  return true;
}

bool ShakerService::parseMotionRequest(const std::string& requestBody, ShakePattern pattern,
                                       MotionRequest& out, ServiceResponse& error) const {
  JsonDocument doc;
  DeserializationError jsonErr = deserializeJson(doc, requestBody);
  if (jsonErr || !doc.is<JsonObject>()) {
    error = errorResponse(400, "Invalid request body", "INVALID_JSON",
                          jsonErr ? std::string(jsonErr.c_str()) : std::string("body must be a JSON object"));
    return false;
  }

  std::string err;
  if (!doc["rpm"].is<int>()) {
    error = errorResponse(422, "Validation failed", "VALIDATION_ERROR", "rpm must be an integer", "rpm");
    return false;
  }
  out.rpm = doc["rpm"].as<int>();
  if (!Validators::rpm(out.rpm, err)) {
    error = errorResponse(422, "Validation failed", "VALIDATION_ERROR", err, "rpm");
    return false;
  }

  if (!doc["time_sec"].is<double>()) {
    error = errorResponse(422, "Validation failed", "VALIDATION_ERROR", "time_sec must be a number", "time_sec");
    return false;
  }
  out.durationSec = doc["time_sec"].as<double>();
  if (!Validators::duration(out.durationSec, err)) {
    error = errorResponse(422, "Validation failed", "VALIDATION_ERROR", err, "time_sec");
    return false;
  }

  out.pattern = pattern;
  out.target.reset();
  if (pattern == ShakePattern::PATTERN_ORBITAL) {
    NamedTarget target;
    if (!parseTarget(doc["target"], target, error)) return false;
    out.target = target;
  }
  return true;
}

// ============================================================================
// SHAKING RUNS
// ============================================================================

ServiceResponse ShakerService::orbital(const std::string& requestBody) {
  return guarded("orbital", [&]() { return runOrbital(requestBody); });
}

ServiceResponse ShakerService::linear(const std::string& requestBody) {
  return guarded("linear", [&]() { return runLinear(requestBody); });
}

ServiceResponse ShakerService::helical(const std::string& requestBody) {
  return guarded("helical", [&]() { return runHelical(requestBody); });
}

ServiceResponse ShakerService::moveToTarget(const std::string& requestBody) {
  return guarded("move", [&]() { return runMoveToTarget(requestBody); });
}

ServiceResponse ShakerService::prepare() {
  return guarded("prepare", [&]() { return runPrepare(); });
}

ServiceResponse ShakerService::pause() {
  return guarded("pause", [&]() { return runPause(); });
}

ServiceResponse ShakerService::printerInfo() {
  return guarded("info", [&]() { return runPrinterInfo(); });
}

ServiceResponse ShakerService::internalFailure(const char* operation, const char* type, const char* what) {
  _dispatcher.markFailed();
  log(LogLevel::LOG_ERROR, std::string("[") + operation + "] " + type + ": " + what);
  return controllerError(ControllerProtocol::internalError(type, what));
}

// ============================================================================
// RUN IMPLEMENTATIONS
// ============================================================================

ServiceResponse ShakerService::runOrbital(const std::string& requestBody) {
  MotionRequest request;
  ServiceResponse error;
  if (!parseMotionRequest(requestBody, ShakePattern::PATTERN_ORBITAL, request, error)) return error;

  const NamedCoordinate& coord = _geometry.target(*request.target);
  log(LogLevel::LOG_INFO, std::string("[ORBITAL] target=") + coord.name + " center=" +
      GcodeEncoder::formatAxes(coord.position, false));

  DispatchOutcome outcome = _dispatcher.dispatch(request);
  if (!outcome.ok()) return controllerError(outcome.failure());

  JsonDocument data;
  JsonObject params = data["parameters"].to<JsonObject>();
  params["target"] = coord.name;
  params["rpm"] = request.rpm;
  params["duration_sec"] = request.durationSec;
  writePoint(params["coordinates"].to<JsonObject>(), coord.position, true);
  params["fixed_radius_mm"] = outcome.profile.amplitudeMM;
  JsonArray centerXY = params["center_xy"].to<JsonArray>();
  centerXY.add(outcome.profile.center.x);
  centerXY.add(outcome.profile.center.y);

  data["gcode_lines"] = outcome.sequence.size();
  data["sample_count"] = outcome.profile.sampleCount;
  data["feed_rate"] = MotionMath::feedWord(outcome.profile.feedRate);
  data["homing_recovered"] = outcome.motion.recovered || outcome.origin.recovered;
  attachControllerBody(data["moonraker_response"], outcome.motion.result.body);
  attachControllerBody(data["home_response"], outcome.origin.result.body);
  writePoint(data["home_position"].to<JsonObject>(), _geometry.origin, false);

  return successResponse("Orbital run complete", data);
}

ServiceResponse ShakerService::runLinear(const std::string& requestBody) {
  MotionRequest request;
  ServiceResponse error;
  if (!parseMotionRequest(requestBody, ShakePattern::PATTERN_LINEAR, request, error)) return error;

  DispatchOutcome outcome = _dispatcher.dispatch(request);
  if (!outcome.ok()) return controllerError(outcome.failure());

  JsonDocument data;
  JsonObject params = data["parameters"].to<JsonObject>();
  params["rpm"] = request.rpm;
  params["duration_sec"] = request.durationSec;
  params["amplitude_mm"] = outcome.profile.amplitudeMM;
  JsonArray centerXY = params["center_xy"].to<JsonArray>();
  centerXY.add(outcome.profile.center.x);
  centerXY.add(outcome.profile.center.y);

  data["gcode_lines"] = outcome.sequence.size();
  data["sample_count"] = outcome.profile.sampleCount;
  data["feed_rate"] = MotionMath::feedWord(outcome.profile.feedRate);
  data["homing_recovered"] = outcome.motion.recovered;
  attachControllerBody(data["moonraker_response"], outcome.motion.result.body);

  return successResponse("Linear run complete", data);
}

ServiceResponse ShakerService::runHelical(const std::string& requestBody) {
  MotionRequest request;
  ServiceResponse error;
  if (!parseMotionRequest(requestBody, ShakePattern::PATTERN_HELICAL_3D, request, error)) return error;

  DispatchOutcome outcome = _dispatcher.dispatch(request);
  if (!outcome.ok()) return controllerError(outcome.failure());

  JsonDocument data;
  JsonObject params = data["parameters"].to<JsonObject>();
  params["rpm"] = request.rpm;
  params["duration_sec"] = request.durationSec;
  params["orbital_radius_mm"] = outcome.profile.amplitudeMM;
  params["amplitude_z_mm"] = outcome.profile.amplitudeZMM;
  JsonArray centerXYZ = params["center_xyz"].to<JsonArray>();
  centerXYZ.add(outcome.profile.center.x);
  centerXYZ.add(outcome.profile.center.y);
  centerXYZ.add(outcome.profile.center.z);

  data["gcode_lines"] = outcome.sequence.size();
  data["sample_count"] = outcome.profile.sampleCount;
  data["feed_rate"] = MotionMath::feedWord(outcome.profile.feedRate);
  data["homing_recovered"] = outcome.motion.recovered;
  attachControllerBody(data["moonraker_response"], outcome.motion.result.body);

  return successResponse("3D run complete", data);
}

ServiceResponse ShakerService::runMoveToTarget(const std::string& requestBody) {
  JsonDocument doc;
  DeserializationError jsonErr = deserializeJson(doc, requestBody);
  if (jsonErr || !doc.is<JsonObject>()) {
    return errorResponse(400, "Invalid request body", "INVALID_JSON",
                         jsonErr ? std::string(jsonErr.c_str()) : std::string("body must be a JSON object"));
  }

  NamedTarget target;
  ServiceResponse error;
  if (!parseTarget(doc["target"], target, error)) return error;

  SendReport report = _dispatcher.moveToTarget(target);
  if (!report.ok()) return controllerError(report.result);

  const NamedCoordinate& coord = _geometry.target(target);
  JsonDocument data;
  data["target"] = coord.name;
  writePoint(data["coordinates"].to<JsonObject>(), coord.position, true);
  data["homing_recovered"] = report.recovered;
  attachControllerBody(data["moonraker_response"], report.result.body);

  return successResponse(std::string("Moved to ") + coord.name, data);
}

ServiceResponse ShakerService::runPrepare() {
  PrepareOutcome outcome = _dispatcher.prepare();
  if (!outcome.ok()) return controllerError(outcome.failure());

  JsonDocument data;
  attachControllerBody(data["printer_data"], outcome.info.body);
  attachControllerBody(data["moonraker_response"], outcome.home.body);
  return successResponse("Controller homed and ready", data);
}

ServiceResponse ShakerService::runPause() {
  ControllerResult result = _dispatcher.pause();
  if (!result.ok()) return controllerError(result);

  JsonDocument data;
  attachControllerBody(data["moonraker_response"], result.body);
  return successResponse("Pause command sent", data);
}

ServiceResponse ShakerService::runPrinterInfo() {
  ControllerResult result = _dispatcher.printerInfo();
  if (!result.ok()) return controllerError(result);

  JsonDocument data;
  attachControllerBody(data.to<JsonVariant>(), result.body);
  return successResponse("Controller info", data);
}

ServiceResponse ShakerService::parameters() const {
  JsonDocument data;

  JsonObject orbital = data["orbital"].to<JsonObject>();
  orbital["radius_mm"] = _geometry.orbitalRadiusMM;
  orbital["min_feed_rate"] = _geometry.minFeedRate;
  JsonArray tiers = orbital["sample_density"].to<JsonArray>();
  JsonObject shortTier = tiers.add<JsonObject>();
  shortTier["max_duration_sec"] = ORBITAL_SHORT_LIMIT_SEC;
  shortTier["samples_per_sec"] = ORBITAL_DENSITY_SHORT;
  JsonObject mediumTier = tiers.add<JsonObject>();
  mediumTier["max_duration_sec"] = ORBITAL_MEDIUM_LIMIT_SEC;
  mediumTier["samples_per_sec"] = ORBITAL_DENSITY_MEDIUM;
  JsonObject longTier = tiers.add<JsonObject>();
  longTier["samples_per_sec"] = ORBITAL_DENSITY_LONG;

  JsonObject linear = data["linear"].to<JsonObject>();
  linear["amplitude_mm"] = _geometry.linearAmplitudeMM;
  linear["sample_density"] = _geometry.linearSampleDensity;
  linear["min_feed_rate"] = _geometry.minFeedRate;
  writePoint(linear["center"].to<JsonObject>(), _geometry.defaultCenter, false);

  JsonObject helical = data["helical3d"].to<JsonObject>();
  helical["orbital_radius_mm"] = _geometry.helicalRadiusMM;
  helical["amplitude_z_mm"] = _geometry.helicalAmplitudeZMM;
  helical["sample_density"] = _geometry.helicalSampleDensity;
  helical["max_feed_rate"] = _geometry.maxAxisFeedRate;
  writePoint(helical["center"].to<JsonObject>(), _geometry.defaultCenter, true);

  JsonObject targets = data["targets"].to<JsonObject>();
  for (const auto& t : _geometry.targets) {
    writePoint(targets[t.name].to<JsonObject>(), t.position, true);
  }

  data["max_duration_sec"] = MAX_DURATION_SEC;
  data["traverse_feed_rate"] = _geometry.traverseFeedRate;
  data["target_feed_rate"] = _geometry.targetFeedRate;
  writePoint(data["origin"].to<JsonObject>(), _geometry.origin, false);

  return successResponse("Shaker parameters", data);
}
