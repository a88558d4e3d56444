#ifndef SIGNAL_SOURCE_HPP
#define SIGNAL_SOURCE_HPP

/**
 * One tick's worth of simulator readouts, in the units the simulator
 * publishes them. Captured once per tick so every rule sees the same values.
 */
struct SignalSnapshot {
    bool on_ground = false;
    bool engine_running = false;
    bool paused = false;

    double ground_speed_ms = 0.0;
    double indicated_airspeed_kt = 0.0;
    double vertical_speed_ms = 0.0;
    double radio_altitude_ft = 0.0;
    double altitude_agl_m = 0.0;
    double flight_time_s = 0.0;
    double heading_deg = 0.0;
    double distance_m = 0.0;
    double fuel_total = 0.0;        // sum over all tanks

    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    double elevation_m = 0.0;
};

/**
 * Replace NaN and infinite readings with zero.
 */
SignalSnapshot sanitizeSnapshot(const SignalSnapshot &raw);

/**
 * Signal Source Interface
 *
 * Supplies the latest simulator readouts. read() must not block and must
 * not throw; readouts the host cannot provide come back as zero/false.
 * Implementations: FlightProfileSource, ReplaySignalSource
 */
class SignalSource {
public:
    virtual ~SignalSource() = default;

    /**
     * Capture all signals at once.
     */
    virtual SignalSnapshot read() = 0;
};

#endif // SIGNAL_SOURCE_HPP
