/**
 * Unit Conversion and Phase Code Tests
 */

#include <cstdio>
#include <cmath>
#include <limits>
#include "../common/units.h"
#include "../bridge_daemon/flight_phase.hpp"
#include "../bridge_daemon/signal_source.hpp"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

static bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

void test_conversions() {
    TEST("Base unit conversions");

    bool ok = true;
    ok = ok && near(knots(1.0), 1.94384);
    ok = ok && near(feet(1.0), 3.28084);
    ok = ok && near(feetPerMinute(1.0), 196.85);
    ok = ok && near(nauticalMiles(1852.0), 1.0);
    ok = ok && near(minutes(90.0), 1.5);
    ok = ok && near(knots(0.0), 0.0);
    ok = ok && near(feet(-10.0), -32.8084);

    if (ok) {
        PASS();
    } else {
        FAIL("Conversion factor wrong");
    }
}

void test_wire_codes() {
    TEST("Phase wire codes");

    struct { FlightPhase phase; const char *code; } expected[] = {
        {FlightPhase::PAUSED,            "PSD"},
        {FlightPhase::BOARDING,          "BST"},
        {FlightPhase::READY_TO_START,    "BST"},
        {FlightPhase::PUSHBACK_TAXI_OUT, "TXI"},
        {FlightPhase::TAXI,              "TXI"},
        {FlightPhase::TAKEOFF,           "TOF"},
        {FlightPhase::AIRBORNE,          "ENR"},
        {FlightPhase::ENROUTE,           "ENR"},
        {FlightPhase::APPROACH,          "TEN"},
        {FlightPhase::LANDING,           "LDG"},
        {FlightPhase::LANDED,            "ARR"},
        {FlightPhase::ON_BLOCK,          "ARR"},
        {FlightPhase::ARRIVED,           "ARR"},
    };

    for (const auto &e : expected) {
        std::string code = phaseWireCode(e.phase);
        if (code != e.code) {
            printf("(%s got %s) ", phaseName(e.phase), code.c_str());
            FAIL("Wrong wire code");
            return;
        }
    }
    PASS();
}

void test_parse_phase_name() {
    TEST("Parse phase name");

    FlightPhase phase = FlightPhase::BOARDING;
    bool ok = true;
    ok = ok && parsePhaseName("TAXI", phase) && phase == FlightPhase::TAXI;
    ok = ok && parsePhaseName("ready_to_start", phase) && phase == FlightPhase::READY_TO_START;
    ok = ok && parsePhaseName("Enroute", phase) && phase == FlightPhase::ENROUTE;
    ok = ok && !parsePhaseName("CRUISE", phase);
    ok = ok && phase == FlightPhase::ENROUTE;

    if (ok) {
        PASS();
    } else {
        FAIL("Name lookup incorrect");
    }
}

void test_sanitize_snapshot() {
    TEST("Non-finite readings become zero");

    SignalSnapshot raw;
    raw.on_ground = true;
    raw.ground_speed_ms = std::numeric_limits<double>::quiet_NaN();
    raw.vertical_speed_ms = std::numeric_limits<double>::infinity();
    raw.latitude_deg = -std::numeric_limits<double>::infinity();
    raw.fuel_total = 1200.5;

    SignalSnapshot s = sanitizeSnapshot(raw);

    bool ok = true;
    ok = ok && s.on_ground;
    ok = ok && s.ground_speed_ms == 0.0;
    ok = ok && s.vertical_speed_ms == 0.0;
    ok = ok && s.latitude_deg == 0.0;
    ok = ok && s.fuel_total == 1200.5;

    if (ok) {
        PASS();
    } else {
        FAIL("Sanitized values incorrect");
    }
}

int main() {
    printf("=== Units Tests ===\n");

    test_conversions();
    test_wire_codes();
    test_parse_phase_name();
    test_sanitize_snapshot();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
