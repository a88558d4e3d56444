#ifndef TELEMETRY_PAYLOAD_HPP
#define TELEMETRY_PAYLOAD_HPP

#include <cstdint>
#include <ctime>
#include <string>

#include "flight_phase.hpp"
#include "signal_source.hpp"

/**
 * Position sub-record of the wire payload, in public units.
 */
struct PayloadPosition {
    double lat = 0.0;
    double lon = 0.0;
    int64_t altitude_msl = 0;   // ft
    int64_t altitude_agl = 0;   // ft
    int64_t gs = 0;             // kt
    int64_t ias = 0;            // kt
    int64_t vs = 0;             // fpm
    int64_t heading = 0;        // deg
    int64_t distance = 0;       // nm
    std::string sim_time;       // ISO-8601 UTC, "Z" suffix
};

/**
 * TelemetryPayload - one datagram's worth of telemetry
 */
struct TelemetryPayload {
    std::string status;
    PayloadPosition position;
    int64_t fuel = 0;
    int64_t flight_time = 0;    // minutes
};

bool operator==(const PayloadPosition &a, const PayloadPosition &b);
bool operator==(const TelemetryPayload &a, const TelemetryPayload &b);

/**
 * Compose the payload for a tick. Pure function of its inputs.
 */
TelemetryPayload buildPayload(const SignalSnapshot &snapshot, FlightPhase reported,
                              std::time_t utc_now);

/**
 * Format as "YYYY-MM-DDTHH:MM:SSZ" regardless of host locale and time zone.
 */
std::string formatUtcTimestamp(std::time_t t);

#endif // TELEMETRY_PAYLOAD_HPP
