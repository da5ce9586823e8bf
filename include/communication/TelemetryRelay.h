/**
 * TelemetryRelay.h - WebSocket relay between one client and the controller
 *
 * WebSocketsServer (port 81) accepts the client, WebSocketsClient opens
 * ws://<controller>/websocket, RelaySession decides what is forwarded and
 * when both sockets are closed. Everything runs on the relay task:
 *
 *   RelayTask: server.loop() → upstream.loop() (while busy) → session.poll()
 *
 * A second client connecting while a session is busy is disconnected.
 */

#pragma once

#include <Arduino.h>
#include <WebSocketsServer.h>
#include <WebSocketsClient.h>
#include <atomic>
#include "communication/ControllerClient.h"
#include "communication/RelaySession.h"

class TelemetryRelay {
public:
    explicit TelemetryRelay(ControllerClient& controller);

    TelemetryRelay(const TelemetryRelay&) = delete;
    TelemetryRelay& operator=(const TelemetryRelay&) = delete;

    void setLogCallback(LogSink sink);

    /** Start the port 81 server and register event handlers */
    void begin();

    /** One pump iteration - called from the relay task only */
    void loop();

    /** Ask the relay task to close any session (OTA start); safe from any task */
    void requestShutdown() { _shutdownRequested = true; }

    /** Snapshot published by the relay task, safe from any task */
    RelayState state() const { return _publishedState.load(); }
    uint32_t sessionsServed() const { return _sessionsServed.load(); }

private:
    // ========================================================================
    // ENDPOINT ADAPTERS
    // ========================================================================

    class ClientEndpoint : public RelayEndpoint {
    public:
        explicit ClientEndpoint(WebSocketsServer& server) : _server(server) {}
        bool sendText(const std::string& message) override;
        void close() override;

        void attach(uint8_t num) { _num = num; _attached = true; }
        void detach() { _attached = false; }
        bool isAttached(uint8_t num) const { return _attached && _num == num; }

    private:
        WebSocketsServer& _server;
        uint8_t _num = 0;
        bool _attached = false;
    };

    class UpstreamEndpoint : public RelayEndpoint {
    public:
        explicit UpstreamEndpoint(WebSocketsClient& socket) : _socket(socket) {}
        bool sendText(const std::string& message) override;
        void close() override;

        void open(const ControllerEndpoint& endpoint);
        bool isOpen() const { return _open; }

    private:
        WebSocketsClient& _socket;
        bool _open = false;
    };

    // ========================================================================
    // EVENT HANDLERS
    // ========================================================================

    void onServerEvent(uint8_t num, WStype_t type, uint8_t* payload, size_t length);
    void onUpstreamEvent(WStype_t type, uint8_t* payload, size_t length);

    void log(LogLevel level, const std::string& message) const {
        if (_log) _log(level, message);
    }

    ControllerClient& _controller;
    WebSocketsServer _server;
    WebSocketsClient _upstream;
    ClientEndpoint _clientEndpoint;
    UpstreamEndpoint _upstreamEndpoint;
    RelaySession _session;
    LogSink _log;

    std::atomic<bool> _shutdownRequested{false};
    std::atomic<RelayState> _publishedState{RelayState::RELAY_IDLE};
    std::atomic<uint32_t> _sessionsServed{0};
};
