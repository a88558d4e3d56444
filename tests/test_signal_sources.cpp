/**
 * Signal Source Tests
 *
 * Scripted flight profile through the phase machine, and JSON replay.
 */

#include <cstdio>
#include <cstdint>
#include <cmath>
#include <string>
#include <vector>
#include <unistd.h>
#include "../bridge_daemon/flight_profile.hpp"
#include "../bridge_daemon/replay_source.hpp"
#include "../bridge_daemon/phase_machine.hpp"
#include "../bridge_daemon/logger.h"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

void test_profile_reaches_arrival() {
    TEST("Scripted flight reaches ARRIVED");

    PhaseMachine m;
    std::vector<std::string> codes;
    uint64_t end_ms = (uint64_t)(FlightProfileSource::durationSeconds() * 1000.0);

    // 10 Hz ticks, profile seconds taken as wall seconds
    for (uint64_t t = 0; t <= end_ms; t += 100) {
        FlightPhase reported = m.step(FlightProfileSource::sampleAt(t / 1000.0), t);
        std::string code = phaseWireCode(reported);
        if (codes.empty() || codes.back() != code) {
            codes.push_back(code);
        }
    }

    std::vector<std::string> expected = {
        "BST", "TXI", "TOF", "ENR", "TEN", "LDG", "ARR"
    };

    bool ok = true;
    ok = ok && codes == expected;
    ok = ok && m.phase() == FlightPhase::ARRIVED;
    ok = ok && m.fallbackCount() == 0;

    if (ok) {
        PASS();
    } else {
        printf("(");
        for (const auto &c : codes) printf("%s ", c.c_str());
        printf(") ");
        FAIL("Profile did not fly the nominal sequence");
    }
}

void test_profile_signals() {
    TEST("Profile signals are plausible");

    SignalSnapshot gate = FlightProfileSource::sampleAt(0.0);
    SignalSnapshot cruise = FlightProfileSource::sampleAt(700.0);
    SignalSnapshot parked = FlightProfileSource::sampleAt(5000.0);

    bool ok = true;
    ok = ok && gate.on_ground && !gate.engine_running && gate.ground_speed_ms == 0.0;
    ok = ok && !cruise.on_ground && cruise.engine_running;
    ok = ok && cruise.altitude_agl_m > 2000.0 && cruise.vertical_speed_ms == 0.0;
    ok = ok && std::fabs(cruise.radio_altitude_ft - cruise.altitude_agl_m * 3.28084) < 1e-6;
    ok = ok && cruise.elevation_m > cruise.altitude_agl_m;

    // Distance and fuel are monotonic
    ok = ok && cruise.distance_m > gate.distance_m;
    ok = ok && parked.distance_m > cruise.distance_m;
    ok = ok && cruise.fuel_total < gate.fuel_total;
    ok = ok && parked.fuel_total < cruise.fuel_total;
    ok = ok && parked.longitude_deg > gate.longitude_deg;

    // Holds after the end
    ok = ok && parked.on_ground && !parked.engine_running;
    ok = ok && parked.flight_time_s == FlightProfileSource::durationSeconds();

    if (ok) {
        PASS();
    } else {
        FAIL("Signal shape wrong");
    }
}

void test_profile_live_clock() {
    TEST("Live profile starts at the gate");

    FlightProfileSource source(1.0);
    SignalSnapshot s = source.read();

    bool ok = true;
    ok = ok && s.on_ground && !s.engine_running;
    ok = ok && source.elapsedSeconds() < 5.0;
    ok = ok && !source.isFinished();

    FlightProfileSource fast(1.0e6);
    usleep(2000);
    ok = ok && fast.isFinished();

    if (ok) {
        PASS();
    } else {
        FAIL("Clock-driven playback wrong");
    }
}

void test_replay_frames() {
    TEST("Replay plays frames in order and holds the last");

    ReplaySignalSource replay;
    bool ok = replay.parseJson(R"([
        {"on_ground": 1, "engine_running": false, "ground_speed_ms": 0,
         "latitude_deg": 40.64, "longitude_deg": -73.78, "fuel_tanks": [1000, 1500.5, 250]},
        {"on_ground": true, "engine_running": true, "ground_speed_ms": 7.5,
         "fuel_total": 2700, "paused": true},
        {"on_ground": false, "altitude_agl_m": 300, "vertical_speed_ms": 8,
         "heading_deg": "north"}
    ])");

    ok = ok && replay.frameCount() == 3;

    SignalSnapshot a = replay.read();
    SignalSnapshot b = replay.read();
    SignalSnapshot c = replay.read();
    SignalSnapshot d = replay.read();

    ok = ok && a.on_ground && !a.engine_running;
    ok = ok && a.fuel_total == 2750.5;
    ok = ok && a.latitude_deg == 40.64;
    ok = ok && b.engine_running && b.paused && b.ground_speed_ms == 7.5;
    ok = ok && b.fuel_total == 2700.0;
    ok = ok && !c.on_ground && c.altitude_agl_m == 300.0;
    ok = ok && c.heading_deg == 0.0;
    ok = ok && d.altitude_agl_m == 300.0 && !d.on_ground;
    ok = ok && replay.isFinished();

    replay.rewind();
    ok = ok && replay.position() == 0;
    ok = ok && replay.read().fuel_total == 2750.5;

    if (ok) {
        PASS();
    } else {
        FAIL("Replay output wrong");
    }
}

void test_replay_rejects_bad_input() {
    TEST("Replay rejects bad input");

    ReplaySignalSource replay;
    bool ok = true;
    ok = ok && !replay.parseJson("{\"frames\": []}");
    ok = ok && !replay.parseJson("[]");
    ok = ok && !replay.parseJson("[1, 2]");
    ok = ok && !replay.parseJson("[{\"on_ground\": true");
    ok = ok && !replay.loadFromFile("/nonexistent/replay.json");
    ok = ok && replay.frameCount() == 0;

    // Empty source reads as all zero
    SignalSnapshot s = replay.read();
    ok = ok && !s.on_ground && s.ground_speed_ms == 0.0;

    if (ok) {
        PASS();
    } else {
        FAIL("Bad input accepted");
    }
}

int main() {
    printf("=== Signal Source Tests ===\n");

    Logger::instance().setConsoleEnabled(false);

    test_profile_reaches_arrival();
    test_profile_signals();
    test_profile_live_clock();
    test_replay_frames();
    test_replay_rejects_bad_input();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
