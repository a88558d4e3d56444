#ifndef FLIGHT_PROFILE_HPP
#define FLIGHT_PROFILE_HPP

#include <cstdint>

#include "signal_source.hpp"

/**
 * FlightProfileSource - scripted gate-to-gate flight
 *
 * Boarding, engine start, taxi, takeoff, climb, cruise, descent, landing,
 * taxi-in and shutdown, played against the monotonic clock. Used to drive
 * the bridge without a simulator attached.
 */
class FlightProfileSource : public SignalSource {
public:
    /**
     * time_scale > 1 plays the profile faster than real time.
     */
    explicit FlightProfileSource(double time_scale = 1.0);

    SignalSnapshot read() override;

    /**
     * Signals at t_s profile seconds after start.
     */
    static SignalSnapshot sampleAt(double t_s);

    /**
     * Profile length in profile seconds; signals hold after this.
     */
    static double durationSeconds();

    double elapsedSeconds() const;
    bool isFinished() const { return elapsedSeconds() >= durationSeconds(); }

private:
    double m_time_scale;
    uint64_t m_start_ms;
};

#endif // FLIGHT_PROFILE_HPP
