// ============================================================================
// RELAY SESSION IMPLEMENTATION
// ============================================================================

#include "communication/RelaySession.h"
#include <utility>

// ============================================================================
// CONSTRUCTOR
// ============================================================================

RelaySession::RelaySession(RelayEndpoint& client, RelayEndpoint& controller,
                           uint32_t connectTimeoutMs, size_t pendingLimit)
  : _client(client),
    _controller(controller),
    _connectTimeoutMs(connectTimeoutMs),
    _pendingLimit(pendingLimit) {}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool RelaySession::begin(uint32_t nowMs) {
  if (isBusy()) return false;

  _state = RelayState::RELAY_CONNECTING;
  _connectStartMs = nowMs;
  _pending.clear();
  _clientToController = 0;
  _controllerToClient = 0;
  _dropped = 0;
  _closeReason.clear();

  log(LogLevel::LOG_INFO, "Relay: client accepted, opening controller socket");
  return true;
}

void RelaySession::onControllerOpen() {
  if (_state != RelayState::RELAY_CONNECTING) return;

  _state = RelayState::RELAY_ACTIVE;
  log(LogLevel::LOG_INFO, "Relay: controller socket open - forwarding");

  while (!_pending.empty() && _state == RelayState::RELAY_ACTIVE) {
    std::string frame = std::move(_pending.front());
    _pending.pop_front();
    onClientMessage(frame);
  }
}

void RelaySession::poll(uint32_t nowMs) {
  if (_state != RelayState::RELAY_CONNECTING) return;

  // Unsigned subtraction handles millis() wrap
  if (nowMs - _connectStartMs >= _connectTimeoutMs) {
    log(LogLevel::LOG_WARNING, "Relay: controller socket did not open within " +
        std::to_string(_connectTimeoutMs) + " ms");
    teardown("controller connect timeout", true, true);
  }
}

// ============================================================================
// FORWARDING
// ============================================================================

void RelaySession::onClientMessage(const std::string& message) {
  if (_state == RelayState::RELAY_CONNECTING) {
    if (_pending.size() >= _pendingLimit) {
      _dropped++;
      log(LogLevel::LOG_WARNING, "Relay: pending queue full, dropping client frame");
      return;
    }
    _pending.push_back(message);
    return;
  }
  if (_state != RelayState::RELAY_ACTIVE) return;

  if (!_controller.sendText(message)) {
    log(LogLevel::LOG_ERROR, "Relay: send to controller failed");
    teardown("controller send failed", true, true);
    return;
  }
  _clientToController++;
}

void RelaySession::onControllerMessage(const std::string& message) {
  if (_state != RelayState::RELAY_ACTIVE) return;

  if (!_client.sendText(message)) {
    log(LogLevel::LOG_ERROR, "Relay: send to client failed");
    teardown("client send failed", true, true);
    return;
  }
  _controllerToClient++;
}

// ============================================================================
// TERMINATION
// ============================================================================

void RelaySession::onClosed(RelaySide side, const std::string& reason) {
  if (!isBusy()) return;

  log(LogLevel::LOG_INFO, std::string("Relay: ") + sideName(side) + " closed" +
      (reason.empty() ? "" : " (" + reason + ")"));
  // The side that closed is already gone; close the other one
  teardown(std::string(sideName(side)) + " closed",
           side != RelaySide::SIDE_CLIENT,
           side != RelaySide::SIDE_CONTROLLER);
}

void RelaySession::onError(RelaySide side, const std::string& reason) {
  if (!isBusy()) return;

  log(LogLevel::LOG_WARNING, std::string("Relay: ") + sideName(side) + " error: " + reason);
  teardown(std::string(sideName(side)) + " error", true, true);
}

void RelaySession::teardown(const std::string& reason, bool closeClient, bool closeController) {
  // State first: close() may re-enter through a disconnect event
  _state = RelayState::RELAY_CLOSED;
  _closeReason = reason;
  _dropped += static_cast<uint32_t>(_pending.size());
  _pending.clear();

  if (closeController) _controller.close();
  if (closeClient) _client.close();

  log(LogLevel::LOG_INFO, "Relay: session ended (" + reason + ") - " +
      std::to_string(_clientToController) + " up / " +
      std::to_string(_controllerToClient) + " down");
}

const char* RelaySession::stateName(RelayState state) {
  using enum RelayState;
  switch (state) {
    case RELAY_IDLE:       return "idle";
    case RELAY_CONNECTING: return "connecting";
    case RELAY_ACTIVE:     return "active";
    case RELAY_CLOSED:     return "closed";
    default:               return "unknown";
  }
}
