/**
 * ============================================================================
 * CommandDispatcher.cpp - Shaker Command Dispatch Implementation
 * ============================================================================
 */

#include "communication/CommandDispatcher.h"

// ============================================================================
// CONSTRUCTOR
// ============================================================================

CommandDispatcher::CommandDispatcher(ControllerLink& link, const ShakerGeometry& geometry)
    : _link(link),
      _geometry(geometry),
      _calculator(geometry),
      _encoder(geometry) {}

// ============================================================================
// STATE MACHINE
// ============================================================================

void CommandDispatcher::transition(SendReport& report, DispatchState next) {
    report.state = next;
    _lastState = next;
}

SendReport CommandDispatcher::sendWithRecovery(const std::string& script) {
    using enum DispatchState;
    SendReport report;

    transition(report, DISPATCH_SENDING);
    report.result = _link.sendScript(script);
    report.scriptsSent++;

    if (report.result.ok()) {
        transition(report, DISPATCH_SUCCESS);
        return report;
    }

    if (report.result.error != ControllerError::ERR_HOMING_REQUIRED) {
        log(LogLevel::LOG_ERROR, "Controller send failed: " + report.result.detail);
        transition(report, DISPATCH_FAILED);
        return report;
    }

    // Axes not homed: home X/Y, wait, resend exactly once
    transition(report, DISPATCH_HOMING_REQUIRED);
    report.recovered = true;
    log(LogLevel::LOG_WARNING, "Controller requires homing - sending G28 X Y and retrying once");

    transition(report, DISPATCH_HOMING);
    for (const std::string& cmd : {GcodeEncoder::homeXY(), GcodeEncoder::waitForHoming()}) {
        ControllerResult homing = _link.sendScript(cmd);
        report.scriptsSent++;
        if (!homing.ok()) {
            log(LogLevel::LOG_ERROR, "Homing recovery failed on '" + cmd + "': " + homing.detail);
            report.result = homing;
            transition(report, DISPATCH_FAILED);
            return report;
        }
    }

    transition(report, DISPATCH_RESENDING);
    report.result = _link.sendScript(script);
    report.scriptsSent++;

    if (report.result.ok()) {
        log(LogLevel::LOG_INFO, "Resend after homing succeeded");
        transition(report, DISPATCH_SUCCESS);
    } else {
        log(LogLevel::LOG_ERROR, "Resend after homing failed: " + report.result.detail);
        transition(report, DISPATCH_FAILED);
    }
    return report;
}

// ============================================================================
// SHAKING RUN
// ============================================================================

DispatchOutcome CommandDispatcher::dispatch(const MotionRequest& request) {
    DispatchOutcome outcome;
    outcome.profile = _calculator.calculate(request);
    outcome.sequence = _encoder.encode(outcome.profile);

    log(LogLevel::LOG_INFO, "Generated " + MotionProfileCalculator::describe(outcome.profile, request) +
        " -> " + std::to_string(outcome.sequence.size()) + " lines");
    if (outcome.profile.sampleCount == 0) {
        log(LogLevel::LOG_WARNING, "Duration shorter than one sampling interval - no G1 samples");
    }

    std::string script = outcome.sequence.render();
    log(LogLevel::LOG_DEBUG, script);

    outcome.motion = sendWithRecovery(script);
    if (!outcome.motion.ok()) {
        return outcome;
    }

    if (request.pattern == ShakePattern::PATTERN_ORBITAL) {
        outcome.originAttempted = true;
        outcome.origin = sendWithRecovery(_encoder.originReturn().render());
        if (outcome.origin.ok()) {
            log(LogLevel::LOG_INFO, "Returned to origin " + GcodeEncoder::formatAxes(_geometry.origin, false));
        }
    }
    return outcome;
}

// ============================================================================
// AUXILIARY OPERATIONS
// ============================================================================

PrepareOutcome CommandDispatcher::prepare() {
    PrepareOutcome outcome;
    outcome.info = _link.fetchInfo();
    if (!outcome.info.ok()) {
        log(LogLevel::LOG_ERROR, "Controller info failed: " + outcome.info.detail);
        return outcome;
    }

    outcome.home = _link.sendScript(GcodeEncoder::fullHome());
    if (outcome.home.ok()) {
        log(LogLevel::LOG_INFO, "Controller prepared (G28)");
    } else {
        log(LogLevel::LOG_ERROR, "G28 failed: " + outcome.home.detail);
    }
    return outcome;
}

ControllerResult CommandDispatcher::pause() {
    ControllerResult result = _link.sendScript(GcodeEncoder::pause());
    if (result.ok()) {
        log(LogLevel::LOG_INFO, "PAUSE sent");
    } else {
        log(LogLevel::LOG_ERROR, "PAUSE failed: " + result.detail);
    }
    return result;
}

SendReport CommandDispatcher::moveToTarget(NamedTarget target) {
    const NamedCoordinate& coord = _geometry.target(target);
    log(LogLevel::LOG_INFO, std::string("Moving to ") + coord.name + " " +
        GcodeEncoder::formatAxes(coord.position, coord.position.z != 0.0));
    return sendWithRecovery(_encoder.moveToTarget(target).render());
}

// ============================================================================
// STATE INSPECTION
// ============================================================================

const char* CommandDispatcher::stateName(DispatchState state) {
    using enum DispatchState;
    switch (state) {
        case DISPATCH_IDLE:             return "idle";
        case DISPATCH_SENDING:          return "sending";
        case DISPATCH_HOMING_REQUIRED:  return "homing_required";
        case DISPATCH_HOMING:           return "homing";
        case DISPATCH_RESENDING:        return "resending";
        case DISPATCH_SUCCESS:          return "success";
        case DISPATCH_FAILED:           return "failed";
        default:                        return "unknown";
    }
}
