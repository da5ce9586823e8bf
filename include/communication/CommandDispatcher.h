/**
 * ============================================================================
 * CommandDispatcher.h - Shaker Command Dispatch Module
 * ============================================================================
 *
 * Turns a MotionRequest into a command script, sends it to the controller
 * and recovers once from the "axes not homed" rejection.
 *
 * Architecture:
 * - MotionProfileCalculator + GcodeEncoder build the script
 * - ControllerLink carries it (HTTPClient on the board, fakes in tests)
 * - sendWithRecovery() drives the per-send state machine (see Types.h)
 * - Orbital runs are followed by a separate origin-return script
 *
 * Logging goes through an injected LogSink so the module stays portable.
 */

#pragma once

#include <string>
#include <utility>
#include "core/Types.h"
#include "motion/MotionProfile.h"
#include "motion/GcodeEncoder.h"
#include "communication/ControllerLink.h"

// ============================================================================
// RESULT STRUCTURES
// ============================================================================

struct SendReport {
    ControllerResult result;
    DispatchState state = DispatchState::DISPATCH_IDLE;
    bool recovered = false;   // Homing recovery was attempted
    int scriptsSent = 0;      // Including G28 / M400

    bool ok() const { return result.ok(); }
};

struct DispatchOutcome {
    MotionProfile profile;
    CommandSequence sequence;
    SendReport motion;
    bool originAttempted = false;   // Orbital only, after a successful run
    SendReport origin;

    bool ok() const { return motion.ok() && (!originAttempted || origin.ok()); }

    /** First failing result (motion, then origin return) */
    const ControllerResult& failure() const {
        return motion.ok() ? origin.result : motion.result;
    }
};

struct PrepareOutcome {
    ControllerResult info;   // /printer/info passthrough
    ControllerResult home;   // G28

    bool ok() const { return info.ok() && home.ok(); }
    const ControllerResult& failure() const { return info.ok() ? home : info; }
};

// ============================================================================
// COMMAND DISPATCHER CLASS
// ============================================================================

class CommandDispatcher {
public:
    /**
     * @param link Controller channel (must outlive the dispatcher)
     * @param geometry Shaker geometry (must outlive the dispatcher)
     */
    CommandDispatcher(ControllerLink& link, const ShakerGeometry& geometry);

    void setLogCallback(LogSink sink) { _log = std::move(sink); }

    /**
     * Build, encode and send one shaking run.
     * Orbital: on success the origin-return script follows.
     * Request must already be validated.
     */
    DispatchOutcome dispatch(const MotionRequest& request);

    /**
     * Send one script; on a homing rejection: G28 X Y, M400, resend once.
     * Any other failure, or any failure during/after recovery, is returned as-is.
     */
    SendReport sendWithRecovery(const std::string& script);

    /** Fetch controller info, then full home (G28) */
    PrepareOutcome prepare();

    /** Send PAUSE (no recovery) */
    ControllerResult pause();

    /** Single G1 move to a named target (with recovery) */
    SendReport moveToTarget(NamedTarget target);

    /** Controller info passthrough */
    ControllerResult printerInfo() { return _link.fetchInfo(); }

    DispatchState lastState() const { return _lastState; }

    /** Record a dispatch aborted outside the state machine (exception) */
    void markFailed() { _lastState = DispatchState::DISPATCH_FAILED; }
    static const char* stateName(DispatchState state);

    const MotionProfileCalculator& calculator() const { return _calculator; }
    const GcodeEncoder& encoder() const { return _encoder; }

private:
    ControllerLink& _link;
    const ShakerGeometry& _geometry;
    MotionProfileCalculator _calculator;
    GcodeEncoder _encoder;
    LogSink _log;
    DispatchState _lastState = DispatchState::DISPATCH_IDLE;

    void log(LogLevel level, const std::string& message) const {
        if (_log) _log(level, message);
    }
    void transition(SendReport& report, DispatchState next);
};
