/**
 * Telemetry Payload Builder Tests
 */

#include <cstdio>
#include <cstdint>
#include <limits>
#include "../bridge_daemon/telemetry_payload.hpp"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

static SignalSnapshot sample() {
    SignalSnapshot s;
    s.latitude_deg = 47.4647;
    s.longitude_deg = 8.5492;
    s.elevation_m = 100.0;          // 328.08 ft
    s.altitude_agl_m = 0.1;         // 0.33 ft
    s.ground_speed_ms = 10.0;       // 19.44 kt
    s.indicated_airspeed_kt = 18.7;
    s.vertical_speed_ms = -2.0;     // -393.7 fpm
    s.heading_deg = 359.9;
    s.distance_m = 3704.5;          // 2.0002 nm
    s.fuel_total = 1234.9;
    s.flight_time_s = 119.0;
    return s;
}

void test_status_code() {
    TEST("Status carries the wire code");

    TelemetryPayload a = buildPayload(sample(), FlightPhase::READY_TO_START, 0);
    TelemetryPayload b = buildPayload(sample(), FlightPhase::PAUSED, 0);
    TelemetryPayload c = buildPayload(sample(), FlightPhase::ON_BLOCK, 0);

    if (a.status == "BST" && b.status == "PSD" && c.status == "ARR") {
        PASS();
    } else {
        FAIL("Wrong status code");
    }
}

void test_rounding() {
    TEST("Field rounding");

    TelemetryPayload p = buildPayload(sample(), FlightPhase::TAXI, 0);
    const PayloadPosition &pos = p.position;

    bool ok = true;
    ok = ok && pos.lat == 47.4647 && pos.lon == 8.5492;
    ok = ok && pos.altitude_msl == 329;     // ceil
    ok = ok && pos.altitude_agl == 1;       // ceil
    ok = ok && pos.gs == 19;                // trunc
    ok = ok && pos.ias == 18;               // trunc
    ok = ok && pos.vs == -393;              // trunc toward zero
    ok = ok && pos.heading == 359;
    ok = ok && pos.distance == 2;           // floor
    ok = ok && p.fuel == 1234;
    ok = ok && p.flight_time == 1;          // minutes, trunc

    if (ok) {
        PASS();
    } else {
        printf("(msl=%lld agl=%lld gs=%lld vs=%lld dist=%lld) ",
               (long long)pos.altitude_msl, (long long)pos.altitude_agl,
               (long long)pos.gs, (long long)pos.vs, (long long)pos.distance);
        FAIL("Rounding incorrect");
    }
}

void test_clamping() {
    TEST("Negative readings clamp at zero");

    SignalSnapshot s = sample();
    s.altitude_agl_m = -3.0;
    s.indicated_airspeed_kt = -4.0;
    s.distance_m = -500.0;
    s.fuel_total = -1.0;
    s.elevation_m = -10.0;          // below sea level stays negative

    TelemetryPayload p = buildPayload(s, FlightPhase::TAXI, 0);

    bool ok = true;
    ok = ok && p.position.altitude_agl == 0;
    ok = ok && p.position.ias == 0;
    ok = ok && p.position.distance == 0;
    ok = ok && p.fuel == 0;
    ok = ok && p.position.altitude_msl == -32;

    if (ok) {
        PASS();
    } else {
        FAIL("Clamp incorrect");
    }
}

void test_out_of_range_saturates() {
    TEST("Readings past the integer range saturate");

    const int64_t kMax = std::numeric_limits<int64_t>::max();
    const int64_t kMin = std::numeric_limits<int64_t>::min();

    SignalSnapshot s = sample();
    s.fuel_total = 1e30;
    s.vertical_speed_ms = -1e30;
    s.elevation_m = 1e300;
    s.distance_m = 1e30;
    s.flight_time_s = 1e30;
    s.heading_deg = -1e19;

    TelemetryPayload p = buildPayload(s, FlightPhase::ENROUTE, 0);

    bool ok = true;
    ok = ok && p.fuel == kMax;
    ok = ok && p.position.vs == kMin;
    ok = ok && p.position.altitude_msl == kMax;
    ok = ok && p.position.distance == kMax;
    ok = ok && p.flight_time == kMax;
    ok = ok && p.position.heading == kMin;
    ok = ok && p.position.gs == 19;

    if (ok) {
        PASS();
    } else {
        FAIL("Out of range value not saturated");
    }
}

void test_flight_time_minutes() {
    TEST("Flight time in whole minutes");

    SignalSnapshot s = sample();
    bool ok = true;

    s.flight_time_s = 59.9;
    ok = ok && buildPayload(s, FlightPhase::TAXI, 0).flight_time == 0;
    s.flight_time_s = 120.0;
    ok = ok && buildPayload(s, FlightPhase::TAXI, 0).flight_time == 2;
    s.flight_time_s = 3599.0;
    ok = ok && buildPayload(s, FlightPhase::TAXI, 0).flight_time == 59;

    if (ok) {
        PASS();
    } else {
        FAIL("Minutes incorrect");
    }
}

void test_timestamp() {
    TEST("UTC timestamp format");

    bool ok = true;
    ok = ok && formatUtcTimestamp(0) == "1970-01-01T00:00:00Z";
    ok = ok && formatUtcTimestamp(1700000000) == "2023-11-14T22:13:20Z";
    ok = ok && formatUtcTimestamp(951782400) == "2000-02-29T00:00:00Z";

    TelemetryPayload p = buildPayload(sample(), FlightPhase::TAXI, 1700000000);
    ok = ok && p.position.sim_time == "2023-11-14T22:13:20Z";

    if (ok) {
        PASS();
    } else {
        FAIL("Timestamp format wrong");
    }
}

void test_pure_function() {
    TEST("Same inputs build equal payloads");

    TelemetryPayload a = buildPayload(sample(), FlightPhase::ENROUTE, 1700000000);
    TelemetryPayload b = buildPayload(sample(), FlightPhase::ENROUTE, 1700000000);
    TelemetryPayload c = buildPayload(sample(), FlightPhase::ENROUTE, 1700000001);

    if (a == b && !(a == c)) {
        PASS();
    } else {
        FAIL("Payload not deterministic");
    }
}

int main() {
    printf("=== Payload Tests ===\n");

    test_status_code();
    test_rounding();
    test_clamping();
    test_out_of_range_saturates();
    test_flight_time_minutes();
    test_timestamp();
    test_pure_function();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
