#ifndef MOCK_SIGNAL_SOURCE_HPP
#define MOCK_SIGNAL_SOURCE_HPP

#include "../../bridge_daemon/signal_source.hpp"

/**
 * MockSignalSource - returns whatever snapshot the test set last
 */
class MockSignalSource : public SignalSource {
public:
    SignalSnapshot read() override {
        m_reads++;
        return m_snapshot;
    }

    void set(const SignalSnapshot &s) { m_snapshot = s; }
    SignalSnapshot &snapshot() { return m_snapshot; }
    int reads() const { return m_reads; }

private:
    SignalSnapshot m_snapshot;
    int m_reads = 0;
};

/**
 * Snapshot builders in rule-friendly units
 */
struct SnapshotBuilder {
    SignalSnapshot s;

    SnapshotBuilder &ground(bool v) { s.on_ground = v; return *this; }
    SnapshotBuilder &engine(bool v) { s.engine_running = v; return *this; }
    SnapshotBuilder &paused(bool v) { s.paused = v; return *this; }
    SnapshotBuilder &gsKt(double kt) { s.ground_speed_ms = kt / 1.94384; return *this; }
    SnapshotBuilder &iasKt(double kt) { s.indicated_airspeed_kt = kt; return *this; }
    SnapshotBuilder &vsFpm(double fpm) { s.vertical_speed_ms = fpm / 196.85; return *this; }
    SnapshotBuilder &aglFt(double ft) { s.altitude_agl_m = ft / 3.28084; return *this; }
    SnapshotBuilder &radaltFt(double ft) { s.radio_altitude_ft = ft; return *this; }
    SnapshotBuilder &flightTime(double sec) { s.flight_time_s = sec; return *this; }

    operator SignalSnapshot() const { return s; }
};

#endif // MOCK_SIGNAL_SOURCE_HPP
