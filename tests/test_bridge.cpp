/**
 * Bridge Tick Tests
 *
 * End to end with a scripted signal source and a recording socket.
 */

#include <cstdio>
#include <cstdint>
#include <cmath>
#include <limits>
#include <string>
#include <nlohmann/json.hpp>
#include "mocks/mock_datagram_socket.hpp"
#include "mocks/mock_signal_source.hpp"
#include "../bridge_daemon/bridge.hpp"
#include "../bridge_daemon/logger.h"

using json = nlohmann::json;

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

static const std::time_t kNow = 1700000000;    // 2023-11-14T22:13:20Z

static SignalSnapshot atGate() {
    SignalSnapshot s = SnapshotBuilder().ground(true).engine(false).gsKt(0.0);
    s.latitude_deg = 47.4647;
    s.longitude_deg = 8.5492;
    s.elevation_m = 432.0;
    s.heading_deg = 123.4;
    s.fuel_total = 5200.7;
    return s;
}

void test_first_tick_sends() {
    TEST("First tick sends a full payload");

    MockSignalSource source;
    MockDatagramSocket socket;
    ErrorHandler errors;
    ConfigStore config;
    source.set(atGate());

    Bridge bridge(source, socket, errors, config);
    TickResult r = bridge.tick(0, kNow);

    bool ok = true;
    ok = ok && r.send == SendResult::SENT;
    ok = ok && r.reported == FlightPhase::READY_TO_START;
    ok = ok && socket.sent().size() == 1;

    if (ok) {
        try {
            json j = json::parse(socket.sent()[0]);
            ok = ok && j["status"] == "BST";
            ok = ok && j["position"]["lat"].get<double>() == 47.4647;
            ok = ok && j["position"]["altitude_msl"].get<int64_t>() == 1418;
            ok = ok && j["position"]["heading"].get<int64_t>() == 123;
            ok = ok && j["position"]["sim_time"] == "2023-11-14T22:13:20Z";
            ok = ok && j["fuel"].get<int64_t>() == 5200;
        } catch (const json::exception &e) {
            printf("(%s) ", e.what());
            ok = false;
        }
    }

    if (ok) {
        PASS();
    } else {
        FAIL("Payload wrong or not sent");
    }
}

void test_throttled_ticks_still_step() {
    TEST("Throttled ticks advance the phase but send nothing");

    MockSignalSource source;
    MockDatagramSocket socket;
    ErrorHandler errors;
    ConfigStore config;
    config.send_interval_s = 0.5;
    config.taxi_dwell_s = 0.0;

    source.set(atGate());
    Bridge bridge(source, socket, errors, config);

    bool ok = true;
    ok = ok && bridge.tick(0, kNow).send == SendResult::SENT;

    source.set(SnapshotBuilder().ground(true).engine(true).gsKt(15));
    TickResult r = bridge.tick(100, kNow);
    ok = ok && r.send == SendResult::THROTTLED;
    ok = ok && r.reported == FlightPhase::PUSHBACK_TAXI_OUT;
    ok = ok && socket.sent().size() == 1;
    ok = ok && source.reads() == 2;

    r = bridge.tick(500, kNow + 1);
    ok = ok && r.send == SendResult::SENT;
    ok = ok && r.reported == FlightPhase::TAXI;
    ok = ok && socket.sent().size() == 2;
    ok = ok && socket.sent()[1].find("\"status\":\"TXI\"") != std::string::npos;

    if (ok) {
        PASS();
    } else {
        FAIL("Tick pipeline wrong");
    }
}

void test_paused_reports_psd() {
    TEST("Paused simulator sends PSD");

    MockSignalSource source;
    MockDatagramSocket socket;
    ErrorHandler errors;
    ConfigStore config;

    SignalSnapshot s = atGate();
    s.paused = true;
    source.set(s);

    Bridge bridge(source, socket, errors, config);
    TickResult r = bridge.tick(0, kNow);

    bool ok = true;
    ok = ok && r.reported == FlightPhase::PAUSED;
    ok = ok && socket.sent().size() == 1;
    ok = ok && socket.sent()[0].find("\"status\":\"PSD\"") != std::string::npos;
    ok = ok && bridge.machine().phase() == FlightPhase::BOARDING;

    if (ok) {
        PASS();
    } else {
        FAIL("Pause not reported");
    }
}

void test_send_failure_not_fatal() {
    TEST("Send failure does not stop ticking");

    MockSignalSource source;
    MockDatagramSocket socket;
    ErrorHandler errors;
    ConfigStore config;
    source.set(atGate());
    socket.setFailing(true);

    Bridge bridge(source, socket, errors, config);

    bool ok = true;
    for (uint64_t t = 0; t < 3000; t += 100) {
        TickResult r = bridge.tick(t, kNow);
        ok = ok && r.send != SendResult::SENT;
        ok = ok && !r.encode_failed;
    }
    ok = ok && bridge.transport().getFailedCount() == 6;
    ok = ok && errors.getCount(ErrorLevel::ERROR) == 1;

    socket.setFailing(false);
    ok = ok && bridge.tick(3000, kNow).send == SendResult::SENT;
    ok = ok && !errors.isActive("udp_send");

    if (ok) {
        PASS();
    } else {
        FAIL("Failure handling wrong");
    }
}

/**
 * Encoder that always fails, as nlohmann does on invalid UTF-8.
 */
class FailingEncoder : public PayloadEncoder {
public:
    const char *name() const override { return "failing"; }
    EncodeResult encode(const TelemetryPayload &payload) const override {
        (void)payload;
        EncodeResult r;
        r.error = "invalid UTF-8 byte";
        return r;
    }
};

void test_encode_failure_skips_tick() {
    TEST("Encode failure skips the send");

    MockSignalSource source;
    MockDatagramSocket socket;
    ErrorHandler errors;
    ConfigStore config;
    source.set(atGate());

    Bridge bridge(source, socket, errors, config,
                  std::unique_ptr<PayloadEncoder>(new FailingEncoder()));

    TickResult r = bridge.tick(0, kNow);

    bool ok = true;
    ok = ok && r.encode_failed;
    ok = ok && r.send == SendResult::FAILED;
    ok = ok && r.reported == FlightPhase::READY_TO_START;
    ok = ok && socket.attempts() == 0;
    ok = ok && bridge.stats().getEncodeFailures() == 1;
    ok = ok && errors.getCount(ErrorLevel::ERROR) == 1;
    ok = ok && std::string(bridge.encoderName()) == "failing";

    // Nothing was sent, so the next tick is still due
    r = bridge.tick(100, kNow);
    ok = ok && r.encode_failed;
    ok = ok && bridge.stats().getEncodeFailures() == 2;
    ok = ok && bridge.machine().phase() == FlightPhase::READY_TO_START;

    if (ok) {
        PASS();
    } else {
        FAIL("Encode failure handling wrong");
    }
}

void test_null_encoder_uses_config() {
    TEST("Null encoder falls back to the configured one");

    MockSignalSource source;
    MockDatagramSocket socket;
    ErrorHandler errors;
    ConfigStore config;
    config.encoder = EncoderKind::MINIMAL;
    source.set(atGate());

    Bridge bridge(source, socket, errors, config, std::unique_ptr<PayloadEncoder>());
    TickResult r = bridge.tick(0, kNow);

    bool ok = true;
    ok = ok && std::string(bridge.encoderName()) == "minimal";
    ok = ok && r.send == SendResult::SENT;
    ok = ok && !r.encode_failed;
    ok = ok && socket.sent().size() == 1;

    if (ok) {
        PASS();
    } else {
        FAIL("Bridge without encoder did not send");
    }
}

void test_non_finite_signals() {
    TEST("Non-finite signals become zero on the wire");

    MockSignalSource source;
    MockDatagramSocket socket;
    ErrorHandler errors;
    ConfigStore config;

    SignalSnapshot s = atGate();
    s.latitude_deg = std::numeric_limits<double>::quiet_NaN();
    s.ground_speed_ms = std::numeric_limits<double>::infinity();
    source.set(s);

    Bridge bridge(source, socket, errors, config);
    TickResult r = bridge.tick(0, kNow);

    bool ok = r.send == SendResult::SENT;
    if (ok) {
        try {
            json j = json::parse(socket.sent()[0]);
            ok = ok && j["position"]["lat"].get<double>() == 0.0;
            ok = ok && j["position"]["gs"].get<int64_t>() == 0;
        } catch (const json::exception &e) {
            printf("(%s) ", e.what());
            ok = false;
        }
    }

    if (ok) {
        PASS();
    } else {
        FAIL("Non-finite value leaked");
    }
}

void test_minimal_encoder_matches() {
    TEST("Minimal encoder sends the same bytes");

    MockSignalSource source;
    MockDatagramSocket rich_socket;
    MockDatagramSocket minimal_socket;
    ErrorHandler errors;
    source.set(atGate());

    ConfigStore rich_config;
    rich_config.encoder = EncoderKind::NLOHMANN;
    ConfigStore minimal_config;
    minimal_config.encoder = EncoderKind::MINIMAL;

    Bridge rich(source, rich_socket, errors, rich_config);
    Bridge minimal(source, minimal_socket, errors, minimal_config);
    rich.tick(0, kNow);
    minimal.tick(0, kNow);

    bool ok = true;
    ok = ok && rich_socket.sent().size() == 1 && minimal_socket.sent().size() == 1;
    ok = ok && rich_socket.sent()[0] == minimal_socket.sent()[0];

    if (ok) {
        PASS();
    } else {
        FAIL("Encoders disagree");
    }
}

void test_reset_flight() {
    TEST("Reset starts the next flight");

    MockSignalSource source;
    MockDatagramSocket socket;
    ErrorHandler errors;
    ConfigStore config;
    config.initial_phase = FlightPhase::ON_BLOCK;

    SignalSnapshot s = atGate();
    s.flight_time_s = 3700;
    source.set(s);

    Bridge bridge(source, socket, errors, config);

    bool ok = true;
    ok = ok && bridge.tick(0, kNow).reported == FlightPhase::ARRIVED;
    ok = ok && bridge.tick(1000, kNow).reported == FlightPhase::ARRIVED;
    bridge.resetFlight();
    ok = ok && bridge.machine().phase() == FlightPhase::ON_BLOCK;

    std::string summary = bridge.statusSummary(1000);
    ok = ok && summary.find("phase=ON_BLOCK") != std::string::npos;
    ok = ok && summary.find("sent=2") != std::string::npos;
    ok = ok && summary.find("fallbacks=0") != std::string::npos;

    if (ok) {
        PASS();
    } else {
        printf("(%s) ", summary.c_str());
        FAIL("Reset or summary wrong");
    }
}

int main() {
    printf("=== Bridge Tests ===\n");

    Logger::instance().setConsoleEnabled(false);

    test_first_tick_sends();
    test_throttled_ticks_still_step();
    test_paused_reports_psd();
    test_send_failure_not_fatal();
    test_encode_failure_skips_tick();
    test_null_encoder_uses_config();
    test_non_finite_signals();
    test_minimal_encoder_matches();
    test_reset_flight();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
