// ============================================================================
// NATIVE UNIT TESTS - Trajectory, G-code, Dispatch & Relay Verification
// ============================================================================
// Tests that run on the HOST PC (no ESP32 needed).
// Covers: Config constants, MotionMath, MotionProfile, GcodeEncoder,
//         ControllerProtocol, CommandDispatcher (scripted controller),
//         RelaySession (fake sockets), ShakerService envelopes, Validators.
//
// Run with: ctest (host build of test_native)
// ============================================================================

#include <unity.h>
#include <ArduinoJson.h>
#include <algorithm>
#include <cmath>
#include <deque>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

// ============================================================================
// EXTERN DEFINITIONS (satisfy Config.h externs)
// ============================================================================
const char* ssid = "test_ssid";
const char* password = "test_password";
const char* otaHostname = "test-bridge";
const char* otaPassword = "test_ota";
const char* controllerHost = "127.0.0.1";

// Include project headers
#include "core/Config.h"
#include "core/Types.h"
#include "core/MotionMath.h"
#include "core/Validators.h"
#include "motion/MotionProfile.h"
#include "motion/GcodeEncoder.h"
#include "communication/ControllerProtocol.h"
#include "communication/CommandDispatcher.h"
#include "communication/RelaySession.h"
#include "communication/ShakerService.h"

using enum ShakePattern;
using enum NamedTarget;
using enum ControllerError;
using enum DispatchState;
using enum RelayState;

// ============================================================================
// HELPER: Float comparison with tolerance
// ============================================================================
#define TEST_ASSERT_FLOAT_NEAR(expected, actual, tol) \
    TEST_ASSERT_FLOAT_WITHIN((tol), (expected), (actual))

static const ShakerGeometry geometry;
static const std::string BASE_URL = "http://127.0.0.1:7125";
static const char* HOMING_BODY =
    "{\"error\":{\"code\":400,\"message\":\"Must home axis first: 100.000 150.000 0.000 [0.000]\"}}";

static MotionRequest makeRequest(ShakePattern pattern, int rpm, double durationSec) {
    MotionRequest request;
    request.pattern = pattern;
    request.rpm = rpm;
    request.durationSec = durationSec;
    return request;
}

static MotionRequest orbitalRequest(int rpm, double durationSec, NamedTarget target) {
    MotionRequest request = makeRequest(PATTERN_ORBITAL, rpm, durationSec);
    request.target = target;
    return request;
}

// ============================================================================
// SCRIPTED CONTROLLER (ControllerLink fake)
// ============================================================================
// Replies are consumed in order; once empty every call succeeds.
// ============================================================================

static ControllerResult replyOk(const std::string& body = "{\"result\":\"ok\"}") {
    return ControllerProtocol::interpretResponse(200, body, BASE_URL, ControllerOperation::OP_SCRIPT);
}

static ControllerResult replyHoming() {
    return ControllerProtocol::interpretResponse(400, HOMING_BODY, BASE_URL, ControllerOperation::OP_SCRIPT);
}

static ControllerResult replyDeviceError(int code = 500) {
    return ControllerProtocol::interpretResponse(code, "{\"error\":\"Klipper not ready\"}", BASE_URL,
                                                 ControllerOperation::OP_SCRIPT);
}

static ControllerResult replyConnectionError() {
    return ControllerProtocol::interpretResponse(-1, "", BASE_URL, ControllerOperation::OP_SCRIPT,
                                                 "connection refused");
}

class FakeControllerLink : public ControllerLink {
public:
    std::deque<ControllerResult> scriptReplies;
    std::vector<std::string> scripts;
    ControllerResult infoReply = replyOk("{\"result\":{\"state\":\"ready\",\"hostname\":\"shaker\"}}");
    int infoCalls = 0;

    ControllerResult sendScript(const std::string& script) override {
        scripts.push_back(script);
        if (scriptReplies.empty()) return replyOk();
        ControllerResult next = scriptReplies.front();
        scriptReplies.pop_front();
        return next;
    }

    ControllerResult fetchInfo() override {
        infoCalls++;
        return infoReply;
    }

    std::string baseUrl() const override { return BASE_URL; }
};

// ============================================================================
// FAKE RELAY SOCKET (RelayEndpoint fake)
// ============================================================================

class FakeEndpoint : public RelayEndpoint {
public:
    std::vector<std::string> sent;
    int closeCalls = 0;
    bool acceptSends = true;

    bool sendText(const std::string& message) override {
        if (!acceptSends) return false;
        sent.push_back(message);
        return true;
    }

    void close() override { closeCalls++; }
};

// ============================================================================
// 1. CONFIG CONSTANT INTEGRITY
// ============================================================================
// Relationships the motion math and relay rely on.
// ============================================================================

void test_orbital_density_tiers_ordered() {
    // Longer runs sample less densely
    TEST_ASSERT_TRUE(ORBITAL_DENSITY_SHORT > ORBITAL_DENSITY_MEDIUM);
    TEST_ASSERT_TRUE(ORBITAL_DENSITY_MEDIUM > ORBITAL_DENSITY_LONG);
    TEST_ASSERT_TRUE(ORBITAL_SHORT_LIMIT_SEC < ORBITAL_MEDIUM_LIMIT_SEC);
}

void test_server_ports_distinct() {
    TEST_ASSERT_NOT_EQUAL(HTTP_SERVER_PORT, RELAY_SERVER_PORT);
    TEST_ASSERT_EQUAL_UINT16(7125, CONTROLLER_DEFAULT_PORT);
}

void test_relay_limits_sane() {
    TEST_ASSERT_TRUE(RELAY_CONNECT_TIMEOUT_MS > 0);
    TEST_ASSERT_TRUE(RELAY_PENDING_QUEUE_SIZE > 0);
    TEST_ASSERT_TRUE(RELAY_HEARTBEAT_TIMEOUT_MS < RELAY_HEARTBEAT_INTERVAL_MS);
}

void test_geometry_defaults() {
    TEST_ASSERT_FLOAT_NEAR(150.0f, (float)geometry.defaultCenter.x, 0.001f);
    TEST_ASSERT_FLOAT_NEAR(150.0f, (float)geometry.defaultCenter.y, 0.001f);
    TEST_ASSERT_FLOAT_NEAR(10.0f, (float)geometry.defaultCenter.z, 0.001f);
    TEST_ASSERT_EQUAL_STRING("target_A", geometry.target(TARGET_A).name);
    TEST_ASSERT_FLOAT_NEAR(100.0f, (float)geometry.target(TARGET_A).position.x, 0.001f);
    TEST_ASSERT_EQUAL_STRING("target_B", geometry.target(TARGET_B).name);
    TEST_ASSERT_FLOAT_NEAR(100.0f, (float)geometry.target(TARGET_B).position.y, 0.001f);
}

void test_duration_cap_fits_sample_cap() {
    // Longest accepted run at the densest sampling still fits the trajectory cap
    int densest = std::max({ORBITAL_DENSITY_SHORT, LINEAR_SAMPLE_DENSITY, HELICAL_SAMPLE_DENSITY});
    TEST_ASSERT_TRUE(MAX_DURATION_SEC > ORBITAL_MEDIUM_LIMIT_SEC);
    TEST_ASSERT_TRUE(MAX_DURATION_SEC * LINEAR_SAMPLE_DENSITY + 1 <= MAX_TRAJECTORY_SAMPLES);
    TEST_ASSERT_TRUE(ORBITAL_SHORT_LIMIT_SEC * densest + 1 <= MAX_TRAJECTORY_SAMPLES);
}

// ============================================================================
// 2. MOTION MATH - uses MotionMath:: (real production functions)
// ============================================================================

void test_rpm_to_rps() {
    TEST_ASSERT_FLOAT_NEAR(1.0f, (float)MotionMath::rpmToRps(60), 0.0001f);
    TEST_ASSERT_FLOAT_NEAR(2.5f, (float)MotionMath::rpmToRps(150), 0.0001f);
}

void test_angular_velocity() {
    TEST_ASSERT_FLOAT_NEAR((float)(2.0 * PI), (float)MotionMath::angularVelocity(1.0), 0.0001f);
}

void test_orbital_feed_floor() {
    // 2π·5·1·60 ≈ 1885 → floored at 2000
    TEST_ASSERT_FLOAT_NEAR(2000.0f, (float)MotionMath::orbitalFeedRate(5.0, 1.0, 2000.0), 0.001f);
}

void test_orbital_feed_above_floor() {
    // 2π·5·2·60 ≈ 3769.9
    double feed = MotionMath::orbitalFeedRate(5.0, 2.0, 2000.0);
    TEST_ASSERT_FLOAT_NEAR(3769.91f, (float)feed, 0.01f);
    TEST_ASSERT_EQUAL_INT32(3769, MotionMath::feedWord(feed));
}

void test_linear_feed() {
    // 4·25·1·60 = 6000
    TEST_ASSERT_FLOAT_NEAR(6000.0f, (float)MotionMath::linearFeedRate(25.0, 1.0, 2000.0), 0.001f);
    // 10 rpm: 1000 → floored at 2000
    TEST_ASSERT_FLOAT_NEAR(2000.0f, (float)MotionMath::linearFeedRate(25.0, 10.0 / 60.0, 2000.0), 0.001f);
}

void test_helical_feed_ceiling_wins() {
    // Floor (2000) is above the ceiling (900): the ceiling applies at every speed
    TEST_ASSERT_FLOAT_NEAR(900.0f, (float)MotionMath::helicalFeedRate(10.0, 0.1, 2000.0, 900.0), 0.001f);
    TEST_ASSERT_FLOAT_NEAR(900.0f, (float)MotionMath::helicalFeedRate(10.0, 5.0, 2000.0, 900.0), 0.001f);
}

void test_orbital_density_tiers() {
    TEST_ASSERT_EQUAL_INT(50, MotionMath::orbitalSampleDensity(1.0));
    TEST_ASSERT_EQUAL_INT(50, MotionMath::orbitalSampleDensity(5.0));
    TEST_ASSERT_EQUAL_INT(30, MotionMath::orbitalSampleDensity(5.5));
    TEST_ASSERT_EQUAL_INT(30, MotionMath::orbitalSampleDensity(10.0));
    TEST_ASSERT_EQUAL_INT(20, MotionMath::orbitalSampleDensity(10.5));
}

void test_sample_counts() {
    TEST_ASSERT_EQUAL_INT(51, MotionMath::inclusiveSampleCount(1.0, 50));
    TEST_ASSERT_EQUAL_INT(50, MotionMath::exclusiveSampleCount(1.0, 50));
    TEST_ASSERT_EQUAL_INT(0, MotionMath::exclusiveSampleCount(0.01, 50));
    TEST_ASSERT_EQUAL_INT(1, MotionMath::inclusiveSampleCount(0.01, 50));
    TEST_ASSERT_EQUAL_INT(0, MotionMath::inclusiveSampleCount(0.0, 50));
}

void test_sample_counts_capped() {
    // Far beyond int range: capped, never narrowed out of range
    TEST_ASSERT_EQUAL_INT(MAX_TRAJECTORY_SAMPLES, MotionMath::exclusiveSampleCount(1e9, 50));
    TEST_ASSERT_EQUAL_INT(MAX_TRAJECTORY_SAMPLES, MotionMath::inclusiveSampleCount(1e9, 20));
    TEST_ASSERT_EQUAL_INT(MAX_TRAJECTORY_SAMPLES, MotionMath::inclusiveSampleCount(INFINITY, 50));
    TEST_ASSERT_EQUAL_INT(0, MotionMath::exclusiveSampleCount(std::nan(""), 50));
    // Longest accepted linear run sits just under the cap
    TEST_ASSERT_EQUAL_INT(3000, MotionMath::exclusiveSampleCount(MAX_DURATION_SEC, 50));
    TEST_ASSERT_EQUAL_INT(MAX_TRAJECTORY_SAMPLES, MotionMath::clampSampleCount(1e12));
}

void test_sample_time_inclusive_end() {
    TEST_ASSERT_FLOAT_NEAR(0.0f, (float)MotionMath::sampleTime(0, 51, 1.0, true), 1e-6f);
    TEST_ASSERT_FLOAT_NEAR(0.5f, (float)MotionMath::sampleTime(25, 51, 1.0, true), 1e-6f);
    TEST_ASSERT_FLOAT_NEAR(1.0f, (float)MotionMath::sampleTime(50, 51, 1.0, true), 1e-6f);
    // Single sample sits at t = 0
    TEST_ASSERT_FLOAT_NEAR(0.0f, (float)MotionMath::sampleTime(0, 1, 0.01, true), 1e-6f);
}

void test_sample_time_exclusive_end() {
    TEST_ASSERT_FLOAT_NEAR(0.0f, (float)MotionMath::sampleTime(0, 50, 1.0, false), 1e-6f);
    TEST_ASSERT_FLOAT_NEAR(0.98f, (float)MotionMath::sampleTime(49, 50, 1.0, false), 1e-6f);
    TEST_ASSERT_TRUE(MotionMath::sampleTime(49, 50, 1.0, false) < 1.0);
}

// ============================================================================
// 3. MOTION PROFILES
// ============================================================================

void test_orbital_reference_run() {
    // 60 rpm, 1 s, target_A → center (100,150), 51 samples, feed 2000
    MotionProfileCalculator calc(geometry);
    MotionProfile profile = calc.calculate(orbitalRequest(60, 1.0, TARGET_A));

    TEST_ASSERT_FLOAT_NEAR(100.0f, (float)profile.center.x, 0.001f);
    TEST_ASSERT_FLOAT_NEAR(150.0f, (float)profile.center.y, 0.001f);
    TEST_ASSERT_EQUAL_INT(51, profile.sampleCount);
    TEST_ASSERT_EQUAL_INT(51, (int)profile.trajectory.size());
    TEST_ASSERT_EQUAL_INT32(2000, MotionMath::feedWord(profile.feedRate));
    TEST_ASSERT_TRUE(profile.inclusiveEnd);
    TEST_ASSERT_FALSE(profile.usesZ);
}

void test_orbital_first_and_last_angle() {
    MotionProfileCalculator calc(geometry);
    MotionProfile profile = calc.calculate(orbitalRequest(60, 1.0, TARGET_A));

    // Angle 0 → (cx + r, cy)
    TEST_ASSERT_FLOAT_NEAR(105.0f, (float)profile.trajectory.front().x, 0.001f);
    TEST_ASSERT_FLOAT_NEAR(150.0f, (float)profile.trajectory.front().y, 0.001f);
    // Angle ω·d = 2π → back to (cx + r, cy)
    TEST_ASSERT_FLOAT_NEAR(105.0f, (float)profile.trajectory.back().x, 0.001f);
    TEST_ASSERT_FLOAT_NEAR(150.0f, (float)profile.trajectory.back().y, 0.001f);
    // Half turn at t = 0.5 s
    TEST_ASSERT_FLOAT_NEAR(95.0f, (float)profile.trajectory[25].x, 0.001f);
}

void test_orbital_target_b_center() {
    MotionProfileCalculator calc(geometry);
    MotionProfile profile = calc.calculate(orbitalRequest(60, 1.0, TARGET_B));
    TEST_ASSERT_FLOAT_NEAR(150.0f, (float)profile.center.x, 0.001f);
    TEST_ASSERT_FLOAT_NEAR(100.0f, (float)profile.center.y, 0.001f);
}

void test_orbital_without_target_uses_default_center() {
    MotionProfileCalculator calc(geometry);
    MotionProfile profile = calc.calculate(makeRequest(PATTERN_ORBITAL, 60, 1.0));

    TEST_ASSERT_FLOAT_NEAR(150.0f, (float)profile.center.x, 0.001f);
    TEST_ASSERT_FLOAT_NEAR(150.0f, (float)profile.center.y, 0.001f);
    TEST_ASSERT_FLOAT_NEAR(0.0f, (float)profile.center.z, 0.001f);
    TEST_ASSERT_FALSE(profile.usesZ);
    TEST_ASSERT_EQUAL_INT(51, profile.sampleCount);
    for (const auto& p : profile.trajectory) {
        double r = std::hypot(p.x - 150.0, p.y - 150.0);
        TEST_ASSERT_FLOAT_NEAR(5.0f, (float)r, 0.0001f);
    }
    TEST_ASSERT_FLOAT_NEAR(155.0f, (float)profile.trajectory.front().x, 0.001f);
}

void test_long_run_trajectory_capped() {
    MotionProfileCalculator calc(geometry);
    MotionProfile profile = calc.calculate(makeRequest(PATTERN_LINEAR, 60, 1e9));
    TEST_ASSERT_EQUAL_INT(MAX_TRAJECTORY_SAMPLES, profile.sampleCount);
    TEST_ASSERT_EQUAL_INT(MAX_TRAJECTORY_SAMPLES, (int)profile.trajectory.size());
}

void test_orbital_medium_tier_count() {
    // 8 s → 30 samples/s → floor(240) + 1
    MotionProfileCalculator calc(geometry);
    MotionProfile profile = calc.calculate(orbitalRequest(60, 8.0, TARGET_A));
    TEST_ASSERT_EQUAL_INT(30, profile.sampleDensity);
    TEST_ASSERT_EQUAL_INT(241, profile.sampleCount);
}

void test_orbital_points_on_circle() {
    MotionProfileCalculator calc(geometry);
    MotionProfile profile = calc.calculate(orbitalRequest(45, 2.0, TARGET_B));
    for (const auto& p : profile.trajectory) {
        double r = std::hypot(p.x - profile.center.x, p.y - profile.center.y);
        TEST_ASSERT_FLOAT_NEAR(5.0f, (float)r, 0.0001f);
    }
}

void test_linear_profile() {
    MotionProfileCalculator calc(geometry);
    MotionProfile profile = calc.calculate(makeRequest(PATTERN_LINEAR, 60, 1.0));

    TEST_ASSERT_EQUAL_INT(50, profile.sampleCount);
    TEST_ASSERT_FALSE(profile.inclusiveEnd);
    TEST_ASSERT_FALSE(profile.usesZ);
    TEST_ASSERT_FLOAT_NEAR(0.0f, (float)profile.center.z, 0.001f);
    TEST_ASSERT_EQUAL_INT32(6000, MotionMath::feedWord(profile.feedRate));

    for (const auto& p : profile.trajectory) {
        TEST_ASSERT_FLOAT_NEAR(150.0f, (float)p.x, 0.0001f);
        TEST_ASSERT_TRUE(p.y >= 125.0 - 1e-9 && p.y <= 175.0 + 1e-9);
    }
    // Half turn at t = 0.5 s is back on center
    TEST_ASSERT_FLOAT_NEAR(150.0f, (float)profile.trajectory[25].y, 0.001f);
}

void test_linear_ignores_target() {
    MotionProfileCalculator calc(geometry);
    MotionRequest request = makeRequest(PATTERN_LINEAR, 60, 1.0);
    request.target = TARGET_A;
    MotionProfile profile = calc.calculate(request);
    TEST_ASSERT_FLOAT_NEAR(150.0f, (float)profile.center.x, 0.001f);
}

void test_helical_profile() {
    MotionProfileCalculator calc(geometry);
    MotionProfile profile = calc.calculate(makeRequest(PATTERN_HELICAL_3D, 60, 1.0));

    TEST_ASSERT_EQUAL_INT(50, profile.sampleCount);
    TEST_ASSERT_TRUE(profile.usesZ);
    TEST_ASSERT_EQUAL_INT32(900, MotionMath::feedWord(profile.feedRate));
    TEST_ASSERT_FLOAT_NEAR(160.0f, (float)profile.trajectory.front().x, 0.001f);
    TEST_ASSERT_FLOAT_NEAR(10.0f, (float)profile.trajectory.front().z, 0.001f);

    for (const auto& p : profile.trajectory) {
        // Z swings ±Az/2 around cz
        TEST_ASSERT_TRUE(p.z >= 7.5 - 1e-9 && p.z <= 12.5 + 1e-9);
        double r = std::hypot(p.x - 150.0, p.y - 150.0);
        TEST_ASSERT_FLOAT_NEAR(10.0f, (float)r, 0.0001f);
    }
}

void test_short_duration_has_no_samples() {
    MotionProfileCalculator calc(geometry);
    MotionProfile linear = calc.calculate(makeRequest(PATTERN_LINEAR, 60, 0.01));
    MotionProfile helical = calc.calculate(makeRequest(PATTERN_HELICAL_3D, 60, 0.01));
    TEST_ASSERT_EQUAL_INT(0, linear.sampleCount);
    TEST_ASSERT_TRUE(linear.trajectory.empty());
    TEST_ASSERT_EQUAL_INT(0, helical.sampleCount);
}

void test_pattern_names() {
    TEST_ASSERT_EQUAL_STRING("orbital", MotionProfileCalculator::patternName(PATTERN_ORBITAL));
    TEST_ASSERT_EQUAL_STRING("linear", MotionProfileCalculator::patternName(PATTERN_LINEAR));
    TEST_ASSERT_EQUAL_STRING("helical3d", MotionProfileCalculator::patternName(PATTERN_HELICAL_3D));
}

// ============================================================================
// 4. GCODE ENCODER
// ============================================================================

void test_encode_orbital_lines() {
    MotionProfileCalculator calc(geometry);
    GcodeEncoder encoder(geometry);
    CommandSequence seq = encoder.encode(calc.calculate(orbitalRequest(60, 1.0, TARGET_A)));
    const auto& lines = seq.lines();

    TEST_ASSERT_EQUAL_INT(51 + 4, (int)seq.size());
    TEST_ASSERT_EQUAL_STRING("G21 ; set units to mm", lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING("G0 X100.0000 Y150.0000 F6000 ; move to center", lines[1].c_str());
    TEST_ASSERT_EQUAL_STRING("G1 X105.0000 Y150.0000 F2000", lines[2].c_str());
    TEST_ASSERT_EQUAL_STRING("G1 X105.0000 Y150.0000 F2000", lines[52].c_str());
    TEST_ASSERT_EQUAL_STRING("G0 X100.0000 Y150.0000 F6000 ; return to center", lines[53].c_str());
    TEST_ASSERT_EQUAL_STRING("M400 ; wait for moves to finish", lines[54].c_str());
}

void test_encode_orbital_default_center_omits_z() {
    MotionProfileCalculator calc(geometry);
    GcodeEncoder encoder(geometry);
    CommandSequence seq = encoder.encode(calc.calculate(makeRequest(PATTERN_ORBITAL, 60, 1.0)));
    const auto& lines = seq.lines();

    TEST_ASSERT_EQUAL_INT(51 + 4, (int)seq.size());
    TEST_ASSERT_EQUAL_STRING("G0 X150.0000 Y150.0000 F6000 ; move to center", lines[1].c_str());
    TEST_ASSERT_EQUAL_STRING("G1 X155.0000 Y150.0000 F2000", lines[2].c_str());
    TEST_ASSERT_EQUAL_STRING("G0 X150.0000 Y150.0000 F6000 ; return to center", lines[53].c_str());
    for (const auto& line : lines) {
        TEST_ASSERT_TRUE(line.find(" Z") == std::string::npos);
    }
}

void test_encode_linear_rezeroes() {
    MotionProfileCalculator calc(geometry);
    GcodeEncoder encoder(geometry);
    CommandSequence seq = encoder.encode(calc.calculate(makeRequest(PATTERN_LINEAR, 60, 1.0)));

    TEST_ASSERT_EQUAL_INT(50 + 5, (int)seq.size());
    TEST_ASSERT_EQUAL_STRING("G1 X150.0000 Y150.0000 F6000", seq.lines()[2].c_str());
    TEST_ASSERT_EQUAL_STRING("G92 X150.0000 Y150.0000 ; re-zero at center", seq.lines().back().c_str());
}

void test_encode_helical_uses_z() {
    MotionProfileCalculator calc(geometry);
    GcodeEncoder encoder(geometry);
    CommandSequence seq = encoder.encode(calc.calculate(makeRequest(PATTERN_HELICAL_3D, 60, 1.0)));
    const auto& lines = seq.lines();

    TEST_ASSERT_EQUAL_STRING("G0 X150.0000 Y150.0000 Z10.0000 F6000 ; move to center", lines[1].c_str());
    TEST_ASSERT_EQUAL_STRING("G1 X160.0000 Y150.0000 Z10.0000 F900", lines[2].c_str());
    TEST_ASSERT_EQUAL_STRING("G92 X150.0000 Y150.0000 Z10.0000 ; re-zero at center", lines.back().c_str());
}

void test_encode_zero_samples_keeps_framing() {
    MotionProfileCalculator calc(geometry);
    GcodeEncoder encoder(geometry);
    CommandSequence seq = encoder.encode(calc.calculate(makeRequest(PATTERN_LINEAR, 60, 0.01)));

    TEST_ASSERT_EQUAL_INT(5, (int)seq.size());
    for (const auto& line : seq.lines()) {
        TEST_ASSERT_FALSE(line.rfind("G1 ", 0) == 0);
    }
}

void test_encode_is_deterministic() {
    MotionProfileCalculator calc(geometry);
    GcodeEncoder encoder(geometry);
    MotionRequest request = makeRequest(PATTERN_HELICAL_3D, 37, 3.3);
    std::string first = encoder.encode(calc.calculate(request)).render();
    std::string second = encoder.encode(calc.calculate(request)).render();
    TEST_ASSERT_TRUE(first == second);
}

void test_render_joins_without_trailing_newline() {
    CommandSequence seq;
    seq.append("G28 X Y");
    seq.append("M400 ; wait for homing");
    TEST_ASSERT_EQUAL_STRING("G28 X Y\nM400 ; wait for homing", seq.render().c_str());
    TEST_ASSERT_EQUAL_STRING("", CommandSequence().render().c_str());
}

void test_origin_return_sequence() {
    GcodeEncoder encoder(geometry);
    CommandSequence seq = encoder.originReturn();
    TEST_ASSERT_EQUAL_INT(2, (int)seq.size());
    TEST_ASSERT_EQUAL_STRING("G0 X150.0000 Y150.0000 F6000 ; return to origin", seq.lines()[0].c_str());
    TEST_ASSERT_EQUAL_STRING("M400 ; wait for moves to finish", seq.lines()[1].c_str());
}

void test_move_to_target_omits_zero_z() {
    GcodeEncoder encoder(geometry);
    TEST_ASSERT_EQUAL_STRING("G1 X100.0000 Y150.0000 F3000", encoder.moveToTarget(TARGET_A).render().c_str());
    TEST_ASSERT_EQUAL_STRING("G1 X150.0000 Y100.0000 F3000", encoder.moveToTarget(TARGET_B).render().c_str());
}

// ============================================================================
// 5. CONTROLLER PROTOCOL
// ============================================================================

void test_script_body_json() {
    TEST_ASSERT_EQUAL_STRING("{\"script\":\"G28\"}", ControllerProtocol::buildScriptBody("G28").c_str());
    TEST_ASSERT_EQUAL_STRING("{\"script\":\"G21\\nG28\"}",
                             ControllerProtocol::buildScriptBody("G21\nG28").c_str());
}

void test_transport_failure_is_connection_error() {
    ControllerResult r = replyConnectionError();
    TEST_ASSERT_TRUE(r.error == ERR_CONNECTION);
    TEST_ASSERT_EQUAL_INT(503, r.statusCode);
    TEST_ASSERT_EQUAL_STRING("Cannot connect to controller", r.message.c_str());
    TEST_ASSERT_EQUAL_STRING("Connection failed. Check URL: http://127.0.0.1:7125 (connection refused)",
                             r.detail.c_str());
}

void test_success_keeps_body() {
    ControllerResult r = replyOk("{\"result\":\"ok\"}");
    TEST_ASSERT_TRUE(r.ok());
    TEST_ASSERT_EQUAL_INT(200, r.statusCode);
    TEST_ASSERT_EQUAL_STRING("{\"result\":\"ok\"}", r.body.c_str());
}

void test_success_with_non_json_body_is_internal() {
    ControllerResult r = ControllerProtocol::interpretResponse(200, "<html>proxy</html>", BASE_URL,
                                                               ControllerOperation::OP_SCRIPT);
    TEST_ASSERT_TRUE(r.error == ERR_INTERNAL);
    TEST_ASSERT_EQUAL_INT(500, r.statusCode);
    TEST_ASSERT_EQUAL_STRING("Internal server error", r.message.c_str());
    TEST_ASSERT_TRUE(r.detail.rfind("InvalidResponse: ", 0) == 0);
}

void test_homing_rejection_detected() {
    ControllerResult r = replyHoming();
    TEST_ASSERT_TRUE(r.error == ERR_HOMING_REQUIRED);
    TEST_ASSERT_EQUAL_INT(400, r.statusCode);
    TEST_ASSERT_TRUE(r.detail.rfind("Controller error (400): ", 0) == 0);
    TEST_ASSERT_TRUE(ControllerProtocol::isHomingRequired("MUST HOME AXIS FIRST"));
    TEST_ASSERT_FALSE(ControllerProtocol::isHomingRequired("Move out of range"));
}

void test_device_error_keeps_status() {
    ControllerResult r = replyDeviceError(500);
    TEST_ASSERT_TRUE(r.error == ERR_DEVICE_RESPONSE);
    TEST_ASSERT_EQUAL_INT(500, r.statusCode);
    TEST_ASSERT_EQUAL_STRING("Controller error (500): {\"error\":\"Klipper not ready\"}", r.detail.c_str());
}

void test_info_error_body_cut_to_50() {
    std::string body(80, 'x');
    ControllerResult info = ControllerProtocol::interpretResponse(502, body, BASE_URL, ControllerOperation::OP_INFO);
    ControllerResult script = ControllerProtocol::interpretResponse(502, body, BASE_URL, ControllerOperation::OP_SCRIPT);
    TEST_ASSERT_EQUAL_STRING(("Controller error (502): " + std::string(50, 'x')).c_str(), info.detail.c_str());
    TEST_ASSERT_EQUAL_STRING(("Controller error (502): " + body).c_str(), script.detail.c_str());
}

void test_unexpected_status_is_internal() {
    ControllerResult r = ControllerProtocol::interpretResponse(302, "", BASE_URL, ControllerOperation::OP_SCRIPT);
    TEST_ASSERT_TRUE(r.error == ERR_INTERNAL);
    TEST_ASSERT_EQUAL_STRING("UnexpectedStatus: HTTP 302", r.detail.c_str());
}

void test_error_codes() {
    TEST_ASSERT_EQUAL_STRING("CONTROLLER_CONNECTION_ERROR", ControllerProtocol::errorCode(ERR_CONNECTION));
    TEST_ASSERT_EQUAL_STRING("CONTROLLER_HTTP_ERROR", ControllerProtocol::errorCode(ERR_DEVICE_RESPONSE));
    TEST_ASSERT_EQUAL_STRING("CONTROLLER_HOMING_REQUIRED", ControllerProtocol::errorCode(ERR_HOMING_REQUIRED));
    TEST_ASSERT_EQUAL_STRING("CONTROLLER_INTERNAL_ERROR", ControllerProtocol::errorCode(ERR_INTERNAL));
}

// ============================================================================
// 6. COMMAND DISPATCHER (scripted controller)
// ============================================================================

void test_dispatch_orbital_sends_origin_return() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    DispatchOutcome outcome = dispatcher.dispatch(orbitalRequest(60, 1.0, TARGET_A));

    TEST_ASSERT_TRUE(outcome.ok());
    TEST_ASSERT_TRUE(outcome.originAttempted);
    TEST_ASSERT_EQUAL_INT(2, (int)link.scripts.size());
    TEST_ASSERT_TRUE(link.scripts[0] == outcome.sequence.render());
    TEST_ASSERT_TRUE(link.scripts[1] == GcodeEncoder(geometry).originReturn().render());
    TEST_ASSERT_TRUE(dispatcher.lastState() == DISPATCH_SUCCESS);
}

void test_dispatch_linear_single_script() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    DispatchOutcome outcome = dispatcher.dispatch(makeRequest(PATTERN_LINEAR, 60, 1.0));

    TEST_ASSERT_TRUE(outcome.ok());
    TEST_ASSERT_FALSE(outcome.originAttempted);
    TEST_ASSERT_EQUAL_INT(1, (int)link.scripts.size());
}

void test_recovery_sequence_order() {
    FakeControllerLink link;
    link.scriptReplies = {replyHoming(), replyOk(), replyOk(), replyOk()};
    CommandDispatcher dispatcher(link, geometry);

    SendReport report = dispatcher.sendWithRecovery("G21\nG1 X1 Y1 F2000");

    TEST_ASSERT_TRUE(report.ok());
    TEST_ASSERT_TRUE(report.recovered);
    TEST_ASSERT_EQUAL_INT(4, report.scriptsSent);
    TEST_ASSERT_EQUAL_INT(4, (int)link.scripts.size());
    TEST_ASSERT_EQUAL_STRING("G21\nG1 X1 Y1 F2000", link.scripts[0].c_str());
    TEST_ASSERT_EQUAL_STRING("G28 X Y", link.scripts[1].c_str());
    TEST_ASSERT_EQUAL_STRING("M400 ; wait for homing", link.scripts[2].c_str());
    TEST_ASSERT_EQUAL_STRING("G21\nG1 X1 Y1 F2000", link.scripts[3].c_str());
    TEST_ASSERT_TRUE(report.state == DISPATCH_SUCCESS);
}

void test_second_homing_failure_propagates() {
    FakeControllerLink link;
    link.scriptReplies = {replyHoming(), replyOk(), replyOk(), replyHoming()};
    CommandDispatcher dispatcher(link, geometry);

    SendReport report = dispatcher.sendWithRecovery("G1 X1 Y1 F2000");

    TEST_ASSERT_FALSE(report.ok());
    TEST_ASSERT_TRUE(report.result.error == ERR_HOMING_REQUIRED);
    TEST_ASSERT_EQUAL_INT(4, (int)link.scripts.size());
    TEST_ASSERT_TRUE(report.state == DISPATCH_FAILED);
}

void test_non_homing_error_not_recovered() {
    FakeControllerLink link;
    link.scriptReplies = {replyDeviceError(500)};
    CommandDispatcher dispatcher(link, geometry);

    SendReport report = dispatcher.sendWithRecovery("G1 X1 Y1 F2000");

    TEST_ASSERT_FALSE(report.recovered);
    TEST_ASSERT_EQUAL_INT(1, (int)link.scripts.size());
    TEST_ASSERT_TRUE(report.result.error == ERR_DEVICE_RESPONSE);
}

void test_homing_command_failure_propagates() {
    FakeControllerLink link;
    link.scriptReplies = {replyHoming(), replyConnectionError()};
    CommandDispatcher dispatcher(link, geometry);

    SendReport report = dispatcher.sendWithRecovery("G1 X1 Y1 F2000");

    TEST_ASSERT_TRUE(report.result.error == ERR_CONNECTION);
    TEST_ASSERT_EQUAL_INT(2, (int)link.scripts.size());
    TEST_ASSERT_EQUAL_STRING("G28 X Y", link.scripts[1].c_str());
}

void test_failed_orbital_skips_origin_return() {
    FakeControllerLink link;
    link.scriptReplies = {replyDeviceError(500)};
    CommandDispatcher dispatcher(link, geometry);

    DispatchOutcome outcome = dispatcher.dispatch(orbitalRequest(60, 1.0, TARGET_A));

    TEST_ASSERT_FALSE(outcome.ok());
    TEST_ASSERT_FALSE(outcome.originAttempted);
    TEST_ASSERT_EQUAL_INT(1, (int)link.scripts.size());
    TEST_ASSERT_EQUAL_INT(500, outcome.failure().statusCode);
}

void test_origin_return_failure_reported() {
    FakeControllerLink link;
    link.scriptReplies = {replyOk(), replyConnectionError()};
    CommandDispatcher dispatcher(link, geometry);

    DispatchOutcome outcome = dispatcher.dispatch(orbitalRequest(60, 1.0, TARGET_B));

    TEST_ASSERT_TRUE(outcome.motion.ok());
    TEST_ASSERT_FALSE(outcome.ok());
    TEST_ASSERT_TRUE(outcome.failure().error == ERR_CONNECTION);
}

void test_prepare_info_then_home() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);

    PrepareOutcome outcome = dispatcher.prepare();

    TEST_ASSERT_TRUE(outcome.ok());
    TEST_ASSERT_EQUAL_INT(1, link.infoCalls);
    TEST_ASSERT_EQUAL_INT(1, (int)link.scripts.size());
    TEST_ASSERT_EQUAL_STRING("G28", link.scripts[0].c_str());
}

void test_prepare_info_failure_skips_home() {
    FakeControllerLink link;
    link.infoReply = replyConnectionError();
    CommandDispatcher dispatcher(link, geometry);

    PrepareOutcome outcome = dispatcher.prepare();

    TEST_ASSERT_FALSE(outcome.ok());
    TEST_ASSERT_TRUE(link.scripts.empty());
    TEST_ASSERT_TRUE(outcome.failure().error == ERR_CONNECTION);
}

void test_pause_has_no_recovery() {
    FakeControllerLink link;
    link.scriptReplies = {replyHoming()};
    CommandDispatcher dispatcher(link, geometry);

    ControllerResult result = dispatcher.pause();

    TEST_ASSERT_TRUE(result.error == ERR_HOMING_REQUIRED);
    TEST_ASSERT_EQUAL_INT(1, (int)link.scripts.size());
    TEST_ASSERT_EQUAL_STRING("PAUSE", link.scripts[0].c_str());
}

void test_move_to_target_recovers() {
    FakeControllerLink link;
    link.scriptReplies = {replyHoming(), replyOk(), replyOk(), replyOk()};
    CommandDispatcher dispatcher(link, geometry);

    SendReport report = dispatcher.moveToTarget(TARGET_B);

    TEST_ASSERT_TRUE(report.ok());
    TEST_ASSERT_TRUE(report.recovered);
    TEST_ASSERT_EQUAL_STRING("G1 X150.0000 Y100.0000 F3000", link.scripts[0].c_str());
    TEST_ASSERT_EQUAL_STRING("G1 X150.0000 Y100.0000 F3000", link.scripts[3].c_str());
}

void test_recovery_logs_warning() {
    FakeControllerLink link;
    link.scriptReplies = {replyHoming()};
    CommandDispatcher dispatcher(link, geometry);
    int warnings = 0;
    dispatcher.setLogCallback([&warnings](LogLevel level, const std::string&) {
        if (level == LogLevel::LOG_WARNING) warnings++;
    });

    dispatcher.sendWithRecovery("G1 X1 Y1 F2000");
    TEST_ASSERT_EQUAL_INT(1, warnings);
}

void test_dispatch_state_names() {
    TEST_ASSERT_EQUAL_STRING("homing_required", CommandDispatcher::stateName(DISPATCH_HOMING_REQUIRED));
    TEST_ASSERT_EQUAL_STRING("success", CommandDispatcher::stateName(DISPATCH_SUCCESS));
}

// ============================================================================
// 7. RELAY SESSION (fake sockets)
// ============================================================================

void test_relay_forwards_both_directions() {
    FakeEndpoint client, controller;
    RelaySession session(client, controller);

    TEST_ASSERT_TRUE(session.begin(1000));
    session.onControllerOpen();
    session.onClientMessage("{\"jsonrpc\":\"2.0\",\"method\":\"printer.info\",\"id\":1}");
    session.onControllerMessage("{\"jsonrpc\":\"2.0\",\"result\":{},\"id\":1}");

    TEST_ASSERT_TRUE(session.state() == RELAY_ACTIVE);
    TEST_ASSERT_EQUAL_INT(1, (int)controller.sent.size());
    TEST_ASSERT_EQUAL_STRING("{\"jsonrpc\":\"2.0\",\"method\":\"printer.info\",\"id\":1}",
                             controller.sent[0].c_str());
    TEST_ASSERT_EQUAL_INT(1, (int)client.sent.size());
    TEST_ASSERT_EQUAL_UINT32(1, session.clientToController());
    TEST_ASSERT_EQUAL_UINT32(1, session.controllerToClient());
}

void test_relay_queues_while_connecting() {
    FakeEndpoint client, controller;
    RelaySession session(client, controller);

    session.begin(0);
    session.onClientMessage("a");
    session.onClientMessage("b");
    TEST_ASSERT_TRUE(controller.sent.empty());
    TEST_ASSERT_EQUAL_INT(2, (int)session.pendingFrames());

    session.onControllerOpen();
    TEST_ASSERT_EQUAL_INT(2, (int)controller.sent.size());
    TEST_ASSERT_EQUAL_STRING("a", controller.sent[0].c_str());
    TEST_ASSERT_EQUAL_STRING("b", controller.sent[1].c_str());
    TEST_ASSERT_EQUAL_INT(0, (int)session.pendingFrames());
}

void test_relay_pending_overflow_dropped() {
    FakeEndpoint client, controller;
    RelaySession session(client, controller, 10000, 2);

    session.begin(0);
    session.onClientMessage("1");
    session.onClientMessage("2");
    session.onClientMessage("3");
    TEST_ASSERT_EQUAL_UINT32(1, session.droppedFrames());

    session.onControllerOpen();
    TEST_ASSERT_EQUAL_INT(2, (int)controller.sent.size());
}

void test_relay_client_close_closes_controller() {
    FakeEndpoint client, controller;
    RelaySession session(client, controller);

    session.begin(0);
    session.onControllerOpen();
    session.onClosed(RelaySide::SIDE_CLIENT, "browser tab closed");

    TEST_ASSERT_TRUE(session.state() == RELAY_CLOSED);
    TEST_ASSERT_EQUAL_INT(1, controller.closeCalls);
    TEST_ASSERT_EQUAL_INT(0, client.closeCalls);

    // Nothing is forwarded after teardown
    session.onControllerMessage("late telemetry");
    session.onClientMessage("late request");
    TEST_ASSERT_TRUE(client.sent.empty());
    TEST_ASSERT_TRUE(controller.sent.empty());
}

void test_relay_controller_close_closes_client() {
    FakeEndpoint client, controller;
    RelaySession session(client, controller);

    session.begin(0);
    session.onControllerOpen();
    session.onClosed(RelaySide::SIDE_CONTROLLER, "");

    TEST_ASSERT_EQUAL_INT(1, client.closeCalls);
    TEST_ASSERT_EQUAL_INT(0, controller.closeCalls);
    TEST_ASSERT_EQUAL_STRING("controller closed", session.closeReason().c_str());
}

void test_relay_error_closes_both() {
    FakeEndpoint client, controller;
    RelaySession session(client, controller);

    session.begin(0);
    session.onControllerOpen();
    session.onError(RelaySide::SIDE_CONTROLLER, "socket reset");

    TEST_ASSERT_EQUAL_INT(1, client.closeCalls);
    TEST_ASSERT_EQUAL_INT(1, controller.closeCalls);

    // Second event on a closed session is ignored
    session.onClosed(RelaySide::SIDE_CLIENT, "");
    TEST_ASSERT_EQUAL_INT(1, controller.closeCalls);
}

void test_relay_connect_timeout() {
    FakeEndpoint client, controller;
    RelaySession session(client, controller, 10000);

    session.begin(1000);
    session.onClientMessage("queued");
    session.poll(10999);
    TEST_ASSERT_TRUE(session.state() == RELAY_CONNECTING);

    session.poll(11000);
    TEST_ASSERT_TRUE(session.state() == RELAY_CLOSED);
    TEST_ASSERT_EQUAL_INT(1, client.closeCalls);
    TEST_ASSERT_EQUAL_INT(1, controller.closeCalls);
    TEST_ASSERT_EQUAL_UINT32(1, session.droppedFrames());

    // A late open does not revive the session
    session.onControllerOpen();
    TEST_ASSERT_TRUE(session.state() == RELAY_CLOSED);
}

void test_relay_timeout_across_millis_wrap() {
    FakeEndpoint client, controller;
    RelaySession session(client, controller, 10000);

    session.begin(0xFFFFFF00u);
    session.poll(0x00000100u);  // 512 ms later
    TEST_ASSERT_TRUE(session.state() == RELAY_CONNECTING);
}

void test_relay_one_session_at_a_time() {
    FakeEndpoint client, controller;
    RelaySession session(client, controller);

    TEST_ASSERT_TRUE(session.begin(0));
    TEST_ASSERT_FALSE(session.begin(5));
    session.onControllerOpen();
    TEST_ASSERT_FALSE(session.begin(10));

    session.onClosed(RelaySide::SIDE_CLIENT, "");
    TEST_ASSERT_TRUE(session.begin(20));
    TEST_ASSERT_TRUE(session.state() == RELAY_CONNECTING);
    TEST_ASSERT_EQUAL_UINT32(0, session.clientToController());
}

void test_relay_send_failure_tears_down() {
    FakeEndpoint client, controller;
    RelaySession session(client, controller);
    controller.acceptSends = false;

    session.begin(0);
    session.onControllerOpen();
    session.onClientMessage("x");

    TEST_ASSERT_TRUE(session.state() == RELAY_CLOSED);
    TEST_ASSERT_EQUAL_INT(1, client.closeCalls);
}

void test_relay_state_names() {
    TEST_ASSERT_EQUAL_STRING("idle", RelaySession::stateName(RELAY_IDLE));
    TEST_ASSERT_EQUAL_STRING("active", RelaySession::stateName(RELAY_ACTIVE));
}

// ============================================================================
// 8. SHAKER SERVICE (JSON envelopes)
// ============================================================================

static JsonDocument parseBody(const ServiceResponse& response) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, response.body);
    TEST_ASSERT_FALSE(err);
    return doc;
}

static void assertValidationError(const ServiceResponse& response, const char* field) {
    TEST_ASSERT_EQUAL_INT(422, response.status);
    JsonDocument doc = parseBody(response);
    TEST_ASSERT_FALSE(doc["success"].as<bool>());
    TEST_ASSERT_EQUAL_STRING("VALIDATION_ERROR", doc["error"]["code"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING(field, doc["error"]["field"].as<const char*>());
}

void test_service_orbital_success_envelope() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    ServiceResponse response = service.orbital("{\"rpm\":60,\"time_sec\":1,\"target\":\"target_A\"}");
    TEST_ASSERT_EQUAL_INT(200, response.status);

    JsonDocument doc = parseBody(response);
    TEST_ASSERT_TRUE(doc["success"].as<bool>());
    TEST_ASSERT_EQUAL_STRING("Orbital run complete", doc["message"].as<const char*>());

    JsonObjectConst data = doc["data"];
    TEST_ASSERT_EQUAL_STRING("target_A", data["parameters"]["target"].as<const char*>());
    TEST_ASSERT_EQUAL_INT(60, data["parameters"]["rpm"].as<int>());
    TEST_ASSERT_FLOAT_NEAR(100.0f, data["parameters"]["center_xy"][0].as<float>(), 0.001f);
    TEST_ASSERT_FLOAT_NEAR(5.0f, data["parameters"]["fixed_radius_mm"].as<float>(), 0.001f);
    TEST_ASSERT_EQUAL_INT(55, data["gcode_lines"].as<int>());
    TEST_ASSERT_EQUAL_INT(51, data["sample_count"].as<int>());
    TEST_ASSERT_EQUAL_INT(2000, data["feed_rate"].as<int>());
    TEST_ASSERT_FALSE(data["homing_recovered"].as<bool>());
    TEST_ASSERT_EQUAL_STRING("ok", data["moonraker_response"]["result"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("ok", data["home_response"]["result"].as<const char*>());
    TEST_ASSERT_FLOAT_NEAR(150.0f, data["home_position"]["x"].as<float>(), 0.001f);
}

void test_service_malformed_json_400() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    ServiceResponse response = service.linear("{\"rpm\":60,");
    TEST_ASSERT_EQUAL_INT(400, response.status);
    JsonDocument doc = parseBody(response);
    TEST_ASSERT_EQUAL_STRING("INVALID_JSON", doc["error"]["code"].as<const char*>());
    TEST_ASSERT_TRUE(link.scripts.empty());
}

void test_service_rpm_validation() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    assertValidationError(service.linear("{\"rpm\":0,\"time_sec\":1}"), "rpm");
    assertValidationError(service.linear("{\"rpm\":-5,\"time_sec\":1}"), "rpm");
    assertValidationError(service.linear("{\"rpm\":\"fast\",\"time_sec\":1}"), "rpm");
    assertValidationError(service.linear("{\"rpm\":60.5,\"time_sec\":1}"), "rpm");
    assertValidationError(service.linear("{\"time_sec\":1}"), "rpm");
    TEST_ASSERT_TRUE(link.scripts.empty());
}

void test_service_duration_validation() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    assertValidationError(service.helical("{\"rpm\":60,\"time_sec\":0}"), "time_sec");
    assertValidationError(service.helical("{\"rpm\":60,\"time_sec\":-1.5}"), "time_sec");
    assertValidationError(service.helical("{\"rpm\":60}"), "time_sec");
    TEST_ASSERT_TRUE(link.scripts.empty());
}

void test_service_duration_upper_bound() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    assertValidationError(service.linear("{\"rpm\":60,\"time_sec\":1e9}"), "time_sec");
    assertValidationError(service.helical("{\"rpm\":60,\"time_sec\":60.001}"), "time_sec");
    assertValidationError(service.orbital("{\"rpm\":60,\"time_sec\":1e300,\"target\":\"target_A\"}"),
                          "time_sec");
    TEST_ASSERT_TRUE(link.scripts.empty());

    // Exactly the limit is accepted
    ServiceResponse response = service.linear("{\"rpm\":60,\"time_sec\":60}");
    TEST_ASSERT_EQUAL_INT(200, response.status);
    JsonDocument doc = parseBody(response);
    TEST_ASSERT_EQUAL_INT(3000, doc["data"]["sample_count"].as<int>());
    TEST_ASSERT_EQUAL_INT(3000 + 5, doc["data"]["gcode_lines"].as<int>());
    TEST_ASSERT_EQUAL_INT(1, (int)link.scripts.size());
}

void test_service_target_validation() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    assertValidationError(service.orbital("{\"rpm\":60,\"time_sec\":1,\"target\":\"target_C\"}"), "target");
    assertValidationError(service.orbital("{\"rpm\":60,\"time_sec\":1}"), "target");
    assertValidationError(service.moveToTarget("{}"), "target");
    TEST_ASSERT_TRUE(link.scripts.empty());
}

void test_service_fractional_duration_accepted() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    ServiceResponse response = service.linear("{\"rpm\":90,\"time_sec\":0.5}");
    TEST_ASSERT_EQUAL_INT(200, response.status);
    JsonDocument doc = parseBody(response);
    TEST_ASSERT_EQUAL_INT(25, doc["data"]["sample_count"].as<int>());
    TEST_ASSERT_FLOAT_NEAR(25.0f, doc["data"]["parameters"]["amplitude_mm"].as<float>(), 0.001f);
}

void test_service_controller_error_mapping() {
    FakeControllerLink link;
    link.scriptReplies = {replyConnectionError()};
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    ServiceResponse response = service.linear("{\"rpm\":60,\"time_sec\":1}");
    TEST_ASSERT_EQUAL_INT(503, response.status);
    JsonDocument doc = parseBody(response);
    TEST_ASSERT_FALSE(doc["success"].as<bool>());
    TEST_ASSERT_EQUAL_STRING("CONTROLLER_CONNECTION_ERROR", doc["error"]["code"].as<const char*>());
}

// Controller link whose calls throw, as an out-of-memory HTTP client would
class ThrowingControllerLink : public ControllerLink {
public:
    ControllerResult sendScript(const std::string&) override {
        throw std::runtime_error("socket torn down");
    }
    ControllerResult fetchInfo() override { throw std::bad_alloc(); }
    std::string baseUrl() const override { return BASE_URL; }
};

void test_service_exception_becomes_internal_error() {
    ThrowingControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    ServiceResponse response = service.linear("{\"rpm\":60,\"time_sec\":1}");
    TEST_ASSERT_EQUAL_INT(500, response.status);
    JsonDocument doc = parseBody(response);
    TEST_ASSERT_FALSE(doc["success"].as<bool>());
    TEST_ASSERT_EQUAL_STRING("CONTROLLER_INTERNAL_ERROR", doc["error"]["code"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("RuntimeError: socket torn down", doc["error"]["detail"].as<const char*>());
    TEST_ASSERT_TRUE(service.lastDispatchState() == DISPATCH_FAILED);

    ServiceResponse info = service.prepare();
    TEST_ASSERT_EQUAL_INT(500, info.status);
    JsonDocument infoDoc = parseBody(info);
    std::string detail = infoDoc["error"]["detail"].as<std::string>();
    TEST_ASSERT_EQUAL_INT(0, (int)detail.rfind("OutOfMemory: ", 0));

    TEST_ASSERT_EQUAL_INT(500, service.moveToTarget("{\"target\":\"target_B\"}").status);
    TEST_ASSERT_EQUAL_INT(500, service.pause().status);
}

void test_service_helical_parameters() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    JsonDocument doc = parseBody(service.helical("{\"rpm\":60,\"time_sec\":1}"));
    JsonObjectConst params = doc["data"]["parameters"];
    TEST_ASSERT_FLOAT_NEAR(10.0f, params["orbital_radius_mm"].as<float>(), 0.001f);
    TEST_ASSERT_FLOAT_NEAR(5.0f, params["amplitude_z_mm"].as<float>(), 0.001f);
    TEST_ASSERT_EQUAL_INT(3, (int)params["center_xyz"].size());
    TEST_ASSERT_EQUAL_INT(900, doc["data"]["feed_rate"].as<int>());
}

void test_service_move_to_target() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    JsonDocument doc = parseBody(service.moveToTarget("{\"target\":\"target_A\"}"));
    TEST_ASSERT_TRUE(doc["success"].as<bool>());
    TEST_ASSERT_EQUAL_STRING("target_A", doc["data"]["target"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("G1 X100.0000 Y150.0000 F3000", link.scripts[0].c_str());
}

void test_service_printer_info_passthrough() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    JsonDocument doc = parseBody(service.printerInfo());
    TEST_ASSERT_EQUAL_STRING("ready", doc["data"]["result"]["state"].as<const char*>());
}

void test_service_parameters() {
    FakeControllerLink link;
    CommandDispatcher dispatcher(link, geometry);
    ShakerService service(dispatcher, geometry);

    JsonDocument doc = parseBody(service.parameters());
    TEST_ASSERT_FLOAT_NEAR(5.0f, doc["data"]["orbital"]["radius_mm"].as<float>(), 0.001f);
    TEST_ASSERT_FLOAT_NEAR(100.0f, doc["data"]["targets"]["target_A"]["x"].as<float>(), 0.001f);
    TEST_ASSERT_EQUAL_INT(3, (int)doc["data"]["orbital"]["sample_density"].size());
    TEST_ASSERT_TRUE(link.scripts.empty());
}

void test_attach_non_json_body_as_string() {
    JsonDocument doc;
    ShakerService::attachControllerBody(doc["r"], "plain text");
    TEST_ASSERT_EQUAL_STRING("plain text", doc["r"].as<const char*>());
}

// ============================================================================
// 9. VALIDATORS
// ============================================================================

void test_validator_rpm() {
    std::string err;
    TEST_ASSERT_TRUE(Validators::rpm(1, err));
    TEST_ASSERT_FALSE(Validators::rpm(0, err));
    TEST_ASSERT_TRUE(err.find("rpm") != std::string::npos);
}

void test_validator_duration() {
    std::string err;
    TEST_ASSERT_TRUE(Validators::duration(0.01, err));
    TEST_ASSERT_FALSE(Validators::duration(0.0, err));
    TEST_ASSERT_FALSE(Validators::duration(std::nan(""), err));
    TEST_ASSERT_EQUAL_STRING("time_sec must be greater than 0", err.c_str());
    TEST_ASSERT_TRUE(Validators::duration(MAX_DURATION_SEC, err));
    TEST_ASSERT_FALSE(Validators::duration(1e9, err));
    TEST_ASSERT_TRUE(err.find("at most 60") != std::string::npos);
}

void test_validator_target() {
    std::string err;
    NamedTarget out = TARGET_A;
    TEST_ASSERT_TRUE(Validators::target("target_B", geometry, out, err));
    TEST_ASSERT_TRUE(out == TARGET_B);
    TEST_ASSERT_FALSE(Validators::target("TARGET_B", geometry, out, err));
}

void test_validator_controller_endpoint() {
    std::string err;
    TEST_ASSERT_TRUE(Validators::controllerHost("192.168.1.50", err));
    TEST_ASSERT_TRUE(Validators::controllerHost("printer.local", err));
    TEST_ASSERT_FALSE(Validators::controllerHost("", err));
    TEST_ASSERT_FALSE(Validators::controllerHost("http://printer", err));
    TEST_ASSERT_FALSE(Validators::controllerHost(std::string(64, 'h'), err));
    TEST_ASSERT_TRUE(Validators::controllerPort(7125, err));
    TEST_ASSERT_FALSE(Validators::controllerPort(0, err));
    TEST_ASSERT_FALSE(Validators::controllerPort(70000, err));
}

void test_validator_wifi_credentials() {
    std::string err;
    TEST_ASSERT_TRUE(Validators::wifiSsid("lab-net", err));
    TEST_ASSERT_FALSE(Validators::wifiSsid("", err));
    TEST_ASSERT_TRUE(Validators::wifiSsid(std::string(31, 's'), err));
    TEST_ASSERT_FALSE(Validators::wifiSsid(std::string(32, 's'), err));
    TEST_ASSERT_TRUE(err.find("ssid") != std::string::npos);
    TEST_ASSERT_TRUE(Validators::wifiPassword("", err));
    TEST_ASSERT_TRUE(Validators::wifiPassword(std::string(63, 'p'), err));
    TEST_ASSERT_FALSE(Validators::wifiPassword(std::string(64, 'p'), err));
}

// ============================================================================
// TEST RUNNER
// ============================================================================

void setUp(void) {}
void tearDown(void) {}

int main(int argc, char** argv) {
    UNITY_BEGIN();

    // 1. Config constant integrity (5 tests)
    RUN_TEST(test_orbital_density_tiers_ordered);
    RUN_TEST(test_server_ports_distinct);
    RUN_TEST(test_relay_limits_sane);
    RUN_TEST(test_geometry_defaults);
    RUN_TEST(test_duration_cap_fits_sample_cap);

    // 2. Motion math (11 tests)
    RUN_TEST(test_rpm_to_rps);
    RUN_TEST(test_angular_velocity);
    RUN_TEST(test_orbital_feed_floor);
    RUN_TEST(test_orbital_feed_above_floor);
    RUN_TEST(test_linear_feed);
    RUN_TEST(test_helical_feed_ceiling_wins);
    RUN_TEST(test_orbital_density_tiers);
    RUN_TEST(test_sample_counts);
    RUN_TEST(test_sample_counts_capped);
    RUN_TEST(test_sample_time_inclusive_end);
    RUN_TEST(test_sample_time_exclusive_end);

    // 3. Motion profiles (12 tests)
    RUN_TEST(test_orbital_reference_run);
    RUN_TEST(test_orbital_first_and_last_angle);
    RUN_TEST(test_orbital_target_b_center);
    RUN_TEST(test_orbital_without_target_uses_default_center);
    RUN_TEST(test_orbital_medium_tier_count);
    RUN_TEST(test_orbital_points_on_circle);
    RUN_TEST(test_linear_profile);
    RUN_TEST(test_linear_ignores_target);
    RUN_TEST(test_helical_profile);
    RUN_TEST(test_short_duration_has_no_samples);
    RUN_TEST(test_long_run_trajectory_capped);
    RUN_TEST(test_pattern_names);

    // 4. G-code encoder (9 tests)
    RUN_TEST(test_encode_orbital_lines);
    RUN_TEST(test_encode_orbital_default_center_omits_z);
    RUN_TEST(test_encode_linear_rezeroes);
    RUN_TEST(test_encode_helical_uses_z);
    RUN_TEST(test_encode_zero_samples_keeps_framing);
    RUN_TEST(test_encode_is_deterministic);
    RUN_TEST(test_render_joins_without_trailing_newline);
    RUN_TEST(test_origin_return_sequence);
    RUN_TEST(test_move_to_target_omits_zero_z);

    // 5. Controller protocol (9 tests)
    RUN_TEST(test_script_body_json);
    RUN_TEST(test_transport_failure_is_connection_error);
    RUN_TEST(test_success_keeps_body);
    RUN_TEST(test_success_with_non_json_body_is_internal);
    RUN_TEST(test_homing_rejection_detected);
    RUN_TEST(test_device_error_keeps_status);
    RUN_TEST(test_info_error_body_cut_to_50);
    RUN_TEST(test_unexpected_status_is_internal);
    RUN_TEST(test_error_codes);

    // 6. Command dispatcher (13 tests)
    RUN_TEST(test_dispatch_orbital_sends_origin_return);
    RUN_TEST(test_dispatch_linear_single_script);
    RUN_TEST(test_recovery_sequence_order);
    RUN_TEST(test_second_homing_failure_propagates);
    RUN_TEST(test_non_homing_error_not_recovered);
    RUN_TEST(test_homing_command_failure_propagates);
    RUN_TEST(test_failed_orbital_skips_origin_return);
    RUN_TEST(test_origin_return_failure_reported);
    RUN_TEST(test_prepare_info_then_home);
    RUN_TEST(test_prepare_info_failure_skips_home);
    RUN_TEST(test_pause_has_no_recovery);
    RUN_TEST(test_move_to_target_recovers);
    RUN_TEST(test_recovery_logs_warning);
    RUN_TEST(test_dispatch_state_names);

    // 7. Relay session (11 tests)
    RUN_TEST(test_relay_forwards_both_directions);
    RUN_TEST(test_relay_queues_while_connecting);
    RUN_TEST(test_relay_pending_overflow_dropped);
    RUN_TEST(test_relay_client_close_closes_controller);
    RUN_TEST(test_relay_controller_close_closes_client);
    RUN_TEST(test_relay_error_closes_both);
    RUN_TEST(test_relay_connect_timeout);
    RUN_TEST(test_relay_timeout_across_millis_wrap);
    RUN_TEST(test_relay_one_session_at_a_time);
    RUN_TEST(test_relay_send_failure_tears_down);
    RUN_TEST(test_relay_state_names);

    // 8. Shaker service (14 tests)
    RUN_TEST(test_service_orbital_success_envelope);
    RUN_TEST(test_service_malformed_json_400);
    RUN_TEST(test_service_rpm_validation);
    RUN_TEST(test_service_duration_validation);
    RUN_TEST(test_service_duration_upper_bound);
    RUN_TEST(test_service_target_validation);
    RUN_TEST(test_service_fractional_duration_accepted);
    RUN_TEST(test_service_controller_error_mapping);
    RUN_TEST(test_service_exception_becomes_internal_error);
    RUN_TEST(test_service_helical_parameters);
    RUN_TEST(test_service_move_to_target);
    RUN_TEST(test_service_printer_info_passthrough);
    RUN_TEST(test_service_parameters);
    RUN_TEST(test_attach_non_json_body_as_string);

    // 9. Validators (5 tests)
    RUN_TEST(test_validator_rpm);
    RUN_TEST(test_validator_duration);
    RUN_TEST(test_validator_target);
    RUN_TEST(test_validator_controller_endpoint);
    RUN_TEST(test_validator_wifi_credentials);

    return UNITY_END();
}
