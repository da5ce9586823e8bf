/**
 * ControllerClient.cpp - Moonraker HTTP calls
 */

#include "communication/ControllerClient.h"
#include "communication/ControllerProtocol.h"
#include "core/Config.h"

// ============================================================================
// HTTP SESSION (RAII)
// ============================================================================

ControllerClient::HttpSession::HttpSession(const String& url) {
    _http.setConnectTimeout(CONTROLLER_HTTP_TIMEOUT_MS);
    _http.setTimeout(CONTROLLER_HTTP_TIMEOUT_MS);
    _began = _http.begin(url);
}

// ============================================================================
// CONSTRUCTION / ENDPOINT
// ============================================================================

ControllerClient::ControllerClient(const std::string& host, uint16_t port)
    : _endpoint{host, port} {
    _mutex = xSemaphoreCreateMutex();
}

ControllerClient::~ControllerClient() {
    if (_mutex) vSemaphoreDelete(_mutex);
}

void ControllerClient::setEndpoint(const std::string& host, uint16_t port) {
    if (_mutex) xSemaphoreTake(_mutex, portMAX_DELAY);
    _endpoint.host = host;
    _endpoint.port = port;
    if (_mutex) xSemaphoreGive(_mutex);
}

ControllerEndpoint ControllerClient::endpoint() const {
    if (_mutex) xSemaphoreTake(_mutex, portMAX_DELAY);
    ControllerEndpoint copy = _endpoint;
    if (_mutex) xSemaphoreGive(_mutex);
    return copy;
}

std::string ControllerClient::baseUrl() const {
    ControllerEndpoint ep = endpoint();
    return "http://" + ep.host + ":" + std::to_string(ep.port);
}

// ============================================================================
// CALLS
// ============================================================================

ControllerResult ControllerClient::sendScript(const std::string& script) {
    std::string body = ControllerProtocol::buildScriptBody(script);
    return exchange(CONTROLLER_SCRIPT_PATH, ControllerOperation::OP_SCRIPT, &body);
}

ControllerResult ControllerClient::fetchInfo() {
    return exchange(CONTROLLER_INFO_PATH, ControllerOperation::OP_INFO, nullptr);
}

ControllerResult ControllerClient::exchange(const char* path, ControllerOperation op,
                                            const std::string* body) {
    const std::string base = baseUrl();
    HttpSession session(String((base + path).c_str()));
    if (!session.ok()) {
        return ControllerProtocol::interpretResponse(-1, "", base, op, "invalid URL");
    }

    HTTPClient& http = session.http();
    int httpCode;
    if (body) {
        http.addHeader("Content-Type", "application/json");
        httpCode = http.POST(String(body->c_str()));
    } else {
        httpCode = http.GET();
    }

    if (httpCode <= 0) {
        String reason = HTTPClient::errorToString(httpCode);
        return ControllerProtocol::interpretResponse(httpCode, "", base, op, reason.c_str());
    }

    String payload = http.getString();
    return ControllerProtocol::interpretResponse(httpCode, payload.c_str(), base, op);
}
