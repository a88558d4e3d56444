/**
 * SignalSource helpers
 */

#include "signal_source.hpp"

#include <cmath>

static double finiteOrZero(double v) {
    return std::isfinite(v) ? v : 0.0;
}

SignalSnapshot sanitizeSnapshot(const SignalSnapshot &raw) {
    SignalSnapshot s = raw;
    s.ground_speed_ms = finiteOrZero(raw.ground_speed_ms);
    s.indicated_airspeed_kt = finiteOrZero(raw.indicated_airspeed_kt);
    s.vertical_speed_ms = finiteOrZero(raw.vertical_speed_ms);
    s.radio_altitude_ft = finiteOrZero(raw.radio_altitude_ft);
    s.altitude_agl_m = finiteOrZero(raw.altitude_agl_m);
    s.flight_time_s = finiteOrZero(raw.flight_time_s);
    s.heading_deg = finiteOrZero(raw.heading_deg);
    s.distance_m = finiteOrZero(raw.distance_m);
    s.fuel_total = finiteOrZero(raw.fuel_total);
    s.latitude_deg = finiteOrZero(raw.latitude_deg);
    s.longitude_deg = finiteOrZero(raw.longitude_deg);
    s.elevation_m = finiteOrZero(raw.elevation_m);
    return s;
}
