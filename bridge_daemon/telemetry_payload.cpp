/**
 * Telemetry payload builder
 *
 * Altitudes round up and never go below ground, distance rounds down and
 * never goes negative, speeds and times truncate toward zero.
 */

#include "telemetry_payload.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

#include "../common/units.h"

// 2^63: the first double past the int64_t range
static const double kInt64Limit = 9223372036854775808.0;

static int64_t saturateToInt(double v) {
    if (v >= kInt64Limit) return std::numeric_limits<int64_t>::max();
    if (v < -kInt64Limit) return std::numeric_limits<int64_t>::min();
    return (int64_t)v;
}

static int64_t truncToInt(double v) {
    return saturateToInt(std::trunc(v));
}

static int64_t ceilToInt(double v) {
    return saturateToInt(std::ceil(v));
}

std::string formatUtcTimestamp(std::time_t t) {
    struct tm tm_info;
    if (gmtime_r(&t, &tm_info) == nullptr) {
        return "1970-01-01T00:00:00Z";
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
             tm_info.tm_year + 1900, tm_info.tm_mon + 1, tm_info.tm_mday,
             tm_info.tm_hour, tm_info.tm_min, tm_info.tm_sec);
    return buf;
}

TelemetryPayload buildPayload(const SignalSnapshot &snapshot, FlightPhase reported,
                              std::time_t utc_now) {
    TelemetryPayload p;
    p.status = phaseWireCode(reported);

    PayloadPosition &pos = p.position;
    pos.lat = snapshot.latitude_deg;
    pos.lon = snapshot.longitude_deg;
    pos.altitude_msl = ceilToInt(feet(snapshot.elevation_m));
    pos.altitude_agl = std::max<int64_t>(0, ceilToInt(feet(snapshot.altitude_agl_m)));
    pos.gs = truncToInt(knots(snapshot.ground_speed_ms));
    pos.ias = std::max<int64_t>(0, truncToInt(snapshot.indicated_airspeed_kt));
    pos.vs = truncToInt(feetPerMinute(snapshot.vertical_speed_ms));
    pos.heading = truncToInt(snapshot.heading_deg);
    pos.distance = std::max<int64_t>(0, saturateToInt(std::floor(nauticalMiles(snapshot.distance_m))));
    pos.sim_time = formatUtcTimestamp(utc_now);

    p.fuel = std::max<int64_t>(0, truncToInt(snapshot.fuel_total));
    p.flight_time = truncToInt(minutes(snapshot.flight_time_s));
    return p;
}

bool operator==(const PayloadPosition &a, const PayloadPosition &b) {
    return a.lat == b.lat && a.lon == b.lon &&
           a.altitude_msl == b.altitude_msl && a.altitude_agl == b.altitude_agl &&
           a.gs == b.gs && a.ias == b.ias && a.vs == b.vs &&
           a.heading == b.heading && a.distance == b.distance &&
           a.sim_time == b.sim_time;
}

bool operator==(const TelemetryPayload &a, const TelemetryPayload &b) {
    return a.status == b.status && a.position == b.position &&
           a.fuel == b.fuel && a.flight_time == b.flight_time;
}
