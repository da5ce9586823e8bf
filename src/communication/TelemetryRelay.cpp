/**
 * TelemetryRelay.cpp - WebSocket relay binding
 */

#include "communication/TelemetryRelay.h"
#include "core/Config.h"

// ============================================================================
// ENDPOINT ADAPTERS
// ============================================================================

bool TelemetryRelay::ClientEndpoint::sendText(const std::string& message) {
    if (!_attached) return false;
    return _server.sendTXT(_num, message.c_str(), message.size());
}

void TelemetryRelay::ClientEndpoint::close() {
    if (!_attached) return;
    // Detach first: disconnect() re-enters onServerEvent(WStype_DISCONNECTED)
    _attached = false;
    _server.disconnect(_num);
}

void TelemetryRelay::UpstreamEndpoint::open(const ControllerEndpoint& endpoint) {
    _open = true;
    _socket.begin(endpoint.host.c_str(), endpoint.port, CONTROLLER_WS_PATH);
    _socket.enableHeartbeat(RELAY_HEARTBEAT_INTERVAL_MS, RELAY_HEARTBEAT_TIMEOUT_MS,
                            RELAY_HEARTBEAT_MISSES);
}

bool TelemetryRelay::UpstreamEndpoint::sendText(const std::string& message) {
    if (!_open) return false;
    return _socket.sendTXT(message.c_str(), message.size());
}

void TelemetryRelay::UpstreamEndpoint::close() {
    if (!_open) return;
    _open = false;
    _socket.disconnect();
}

// ============================================================================
// CONSTRUCTION
// ============================================================================

TelemetryRelay::TelemetryRelay(ControllerClient& controller)
    : _controller(controller),
      _server(RELAY_SERVER_PORT),
      _clientEndpoint(_server),
      _upstreamEndpoint(_upstream),
      _session(_clientEndpoint, _upstreamEndpoint) {}

void TelemetryRelay::setLogCallback(LogSink sink) {
    _log = sink;
    _session.setLogCallback(sink);
}

void TelemetryRelay::begin() {
    _server.onEvent([this](uint8_t num, WStype_t type, uint8_t* payload, size_t length) {
        onServerEvent(num, type, payload, length);
    });
    _upstream.onEvent([this](WStype_t type, uint8_t* payload, size_t length) {
        onUpstreamEvent(type, payload, length);
    });
    _server.begin();
    log(LogLevel::LOG_INFO, "Telemetry relay listening on port " + std::to_string(RELAY_SERVER_PORT));
}

// ============================================================================
// PUMP (relay task)
// ============================================================================

void TelemetryRelay::loop() {
    _server.loop();
    // The client socket reconnects on its own when pumped; only pump it for a live session
    if (_upstreamEndpoint.isOpen()) {
        _upstream.loop();
    }
    _session.poll(millis());

    if (_shutdownRequested.exchange(false) && _session.isBusy()) {
        _session.onError(RelaySide::SIDE_CLIENT, "bridge shutting down");
    }
    _publishedState = _session.state();
}

// ============================================================================
// CLIENT SIDE EVENTS
// ============================================================================

void TelemetryRelay::onServerEvent(uint8_t num, WStype_t type, uint8_t* payload, size_t length) {
    switch (type) {
        case WStype_CONNECTED: {
            if (!_session.begin(millis())) {
                log(LogLevel::LOG_WARNING, "Relay busy - refusing client #" + std::to_string(num));
                _server.disconnect(num);
                return;
            }
            _clientEndpoint.attach(num);
            _sessionsServed++;
            ControllerEndpoint endpoint = _controller.endpoint();
            log(LogLevel::LOG_INFO, "Relay client #" + std::to_string(num) + " connected, opening ws://" +
                                    endpoint.host + ":" + std::to_string(endpoint.port) + CONTROLLER_WS_PATH);
            _upstreamEndpoint.open(endpoint);
            break;
        }

        case WStype_TEXT:
            if (!_clientEndpoint.isAttached(num)) return;
            _session.onClientMessage(std::string(reinterpret_cast<const char*>(payload), length));
            break;

        case WStype_DISCONNECTED:
            if (!_clientEndpoint.isAttached(num)) return;
            _clientEndpoint.detach();
            _session.onClosed(RelaySide::SIDE_CLIENT, "client disconnected");
            break;

        case WStype_ERROR:
            if (!_clientEndpoint.isAttached(num)) return;
            _session.onError(RelaySide::SIDE_CLIENT, "client socket error");
            break;

        case WStype_BIN:
            log(LogLevel::LOG_DEBUG, "Relay: binary client frame ignored (" + std::to_string(length) + " bytes)");
            break;

        default:
            break;
    }
}

// ============================================================================
// CONTROLLER SIDE EVENTS
// ============================================================================

void TelemetryRelay::onUpstreamEvent(WStype_t type, uint8_t* payload, size_t length) {
    switch (type) {
        case WStype_CONNECTED:
            _session.onControllerOpen();
            break;

        case WStype_TEXT:
            _session.onControllerMessage(std::string(reinterpret_cast<const char*>(payload), length));
            break;

        case WStype_DISCONNECTED:
            _session.onClosed(RelaySide::SIDE_CONTROLLER, "controller disconnected");
            // Stop the client socket's auto-reconnect
            _upstreamEndpoint.close();
            break;

        case WStype_ERROR:
            _session.onError(RelaySide::SIDE_CONTROLLER, "controller socket error");
            _upstreamEndpoint.close();
            break;

        default:
            break;
    }
}
