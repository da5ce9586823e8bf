// ============================================================================
// RELAY SESSION - One client ⇄ controller telemetry pairing
// ============================================================================
// Portable state machine behind TelemetryRelay. Forwards text frames
// verbatim in both directions and tears the pair down on the first close or
// error from either side.
//
//   IDLE ──begin()──▶ CONNECTING ──onControllerOpen()──▶ ACTIVE
//                        │                                 │
//                        └── timeout / close / error ──────┴──▶ CLOSED
//
// CLOSED is terminal for the session: nothing is forwarded afterwards and
// both endpoints have been closed. begin() from CLOSED starts a new session.
// Client frames received while CONNECTING are queued (bounded) and flushed
// in order once the controller side opens.
// ============================================================================

#ifndef RELAY_SESSION_H
#define RELAY_SESSION_H

#include <cstdint>
#include <deque>
#include <string>
#include "core/Types.h"

// ============================================================================
// RELAY ENDPOINT (one socket of the pair)
// ============================================================================
class RelayEndpoint {
public:
  virtual ~RelayEndpoint() = default;

  /** Send one text frame; false if the socket refused it */
  virtual bool sendText(const std::string& message) = 0;

  /** Close the socket (idempotent) */
  virtual void close() = 0;
};

enum class RelaySide {
  SIDE_CLIENT,
  SIDE_CONTROLLER
};

// ============================================================================
// RELAY SESSION CLASS
// ============================================================================
class RelaySession {
public:
  /**
   * @param client Client-facing socket
   * @param controller Controller-facing socket
   * @param connectTimeoutMs Max time in CONNECTING before giving up
   * @param pendingLimit Max client frames held while CONNECTING
   */
  RelaySession(RelayEndpoint& client, RelayEndpoint& controller,
               uint32_t connectTimeoutMs = RELAY_CONNECT_TIMEOUT_MS,
               size_t pendingLimit = RELAY_PENDING_QUEUE_SIZE);

  void setLogCallback(LogSink sink) { _log = sink; }

  // ========================================================================
  // LIFECYCLE
  // ========================================================================

  /**
   * Start a session for a newly accepted client.
   * @return false if a session is already connecting/active (refuse client)
   */
  bool begin(uint32_t nowMs);

  /** Controller socket opened */
  void onControllerOpen();

  /** Check the connect timeout (call from the relay task loop) */
  void poll(uint32_t nowMs);

  // ========================================================================
  // EVENTS
  // ========================================================================

  void onClientMessage(const std::string& message);
  void onControllerMessage(const std::string& message);

  void onClosed(RelaySide side, const std::string& reason);
  void onError(RelaySide side, const std::string& reason);

  // ========================================================================
  // STATE INSPECTION
  // ========================================================================

  RelayState state() const { return _state; }
  bool isBusy() const {
    return _state == RelayState::RELAY_CONNECTING || _state == RelayState::RELAY_ACTIVE;
  }

  uint32_t clientToController() const { return _clientToController; }
  uint32_t controllerToClient() const { return _controllerToClient; }
  uint32_t droppedFrames() const { return _dropped; }
  size_t pendingFrames() const { return _pending.size(); }
  const std::string& closeReason() const { return _closeReason; }

  static const char* stateName(RelayState state);

private:
  RelayEndpoint& _client;
  RelayEndpoint& _controller;
  uint32_t _connectTimeoutMs;
  size_t _pendingLimit;

  RelayState _state = RelayState::RELAY_IDLE;
  uint32_t _connectStartMs = 0;
  std::deque<std::string> _pending;

  uint32_t _clientToController = 0;
  uint32_t _controllerToClient = 0;
  uint32_t _dropped = 0;
  std::string _closeReason;

  LogSink _log;

  void log(LogLevel level, const std::string& message) const {
    if (_log) _log(level, message);
  }

  /** Mark CLOSED first, then close the socket(s) that are still open */
  void teardown(const std::string& reason, bool closeClient, bool closeController);

  static const char* sideName(RelaySide side) {
    return side == RelaySide::SIDE_CLIENT ? "client" : "controller";
  }
};

#endif // RELAY_SESSION_H
