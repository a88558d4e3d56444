/**
 * FlightProfileSource Implementation
 *
 * Ground speed and height above ground are linear between keyframes;
 * vertical speed is the slope of height. Ground contact and engine state
 * come from the keyframe a segment starts at.
 */

#include "flight_profile.hpp"
#include "bridge.hpp"

#include <cmath>

#include "../common/units.h"

struct Keyframe {
    double t_s;
    bool on_ground;
    bool engine_running;
    double gs_ms;
    double agl_m;
};

static const Keyframe kProfile[] = {
    {   0.0, true,  false,   0.0,    0.0},   // boarding
    {  20.0, true,  true,    0.0,    0.0},   // engine start
    {  40.0, true,  true,    0.0,    0.0},   // taxi out
    {  45.0, true,  true,    8.0,    0.0},
    { 160.0, true,  true,    8.0,    0.0},   // takeoff roll
    { 188.0, false, true,   75.0,    0.0},   // liftoff
    { 400.0, false, true,  120.0, 2100.0},   // cruise
    {1000.0, false, true,  120.0, 2100.0},   // descent
    {1380.0, false, true,   75.0,  200.0},   // final
    {1420.0, true,  true,   70.0,    0.0},   // touchdown
    {1450.0, true,  true,    4.0,    0.0},   // taxi in
    {1540.0, true,  true,    4.0,    0.0},
    {1550.0, true,  true,    0.0,    0.0},   // on block
    {1570.0, true,  false,   0.0,    0.0},   // shutdown
    {1600.0, true,  false,   0.0,    0.0},
};

static const size_t kKeyframeCount = sizeof(kProfile) / sizeof(kProfile[0]);

static const double kOriginLat = 47.4647;
static const double kOriginLon = 8.5492;
static const double kFieldElevationM = 432.0;
static const double kHeadingDeg = 90.0;
static const double kFuelStartKg = 6000.0;
static const double kFuelBurnKgS = 0.6;
static const double kMetresPerDegLat = 111320.0;
static const double kPi = 3.14159265358979323846;

static size_t segmentIndex(double t) {
    for (size_t i = 0; i + 1 < kKeyframeCount; i++) {
        if (t < kProfile[i + 1].t_s) {
            return i;
        }
    }
    return kKeyframeCount - 1;
}

static double lerp(double a, double b, double f) {
    return a + (b - a) * f;
}

FlightProfileSource::FlightProfileSource(double time_scale)
    : m_time_scale(time_scale > 0.0 ? time_scale : 1.0),
      m_start_ms(Bridge::monotonicMs()) {
}

double FlightProfileSource::durationSeconds() {
    return kProfile[kKeyframeCount - 1].t_s;
}

double FlightProfileSource::elapsedSeconds() const {
    uint64_t now = Bridge::monotonicMs();
    return (double)(now - m_start_ms) / 1000.0 * m_time_scale;
}

SignalSnapshot FlightProfileSource::read() {
    return sampleAt(elapsedSeconds());
}

SignalSnapshot FlightProfileSource::sampleAt(double t_s) {
    double t = t_s;
    if (t < 0.0) t = 0.0;
    if (t > durationSeconds()) t = durationSeconds();

    size_t i = segmentIndex(t);
    const Keyframe &k0 = kProfile[i];

    double gs = k0.gs_ms;
    double agl = k0.agl_m;
    double vs = 0.0;
    if (i + 1 < kKeyframeCount) {
        const Keyframe &k1 = kProfile[i + 1];
        double dt = k1.t_s - k0.t_s;
        double f = (t - k0.t_s) / dt;
        gs = lerp(k0.gs_ms, k1.gs_ms, f);
        agl = lerp(k0.agl_m, k1.agl_m, f);
        vs = (k1.agl_m - k0.agl_m) / dt;
    }

    // Distance: exact integral of the piecewise-linear ground speed
    double distance = 0.0;
    for (size_t j = 0; j < i; j++) {
        const Keyframe &a = kProfile[j];
        const Keyframe &b = kProfile[j + 1];
        distance += (a.gs_ms + b.gs_ms) * 0.5 * (b.t_s - a.t_s);
    }
    distance += (k0.gs_ms + gs) * 0.5 * (t - k0.t_s);

    double engine_on_s = 0.0;
    double start = kProfile[1].t_s;
    double stop = kProfile[kKeyframeCount - 2].t_s;
    if (t > start) {
        engine_on_s = (t < stop ? t : stop) - start;
    }

    SignalSnapshot s;
    s.on_ground = k0.on_ground;
    s.engine_running = k0.engine_running;
    s.paused = false;
    s.ground_speed_ms = gs;
    s.indicated_airspeed_kt = knots(gs);
    s.vertical_speed_ms = vs;
    s.altitude_agl_m = agl;
    s.radio_altitude_ft = feet(agl);
    s.flight_time_s = t;
    s.heading_deg = kHeadingDeg;
    s.distance_m = distance;
    s.fuel_total = kFuelStartKg - kFuelBurnKgS * engine_on_s;
    s.latitude_deg = kOriginLat;
    s.longitude_deg = kOriginLon +
        distance / (kMetresPerDegLat * std::cos(kOriginLat * kPi / 180.0));
    s.elevation_m = kFieldElevationM + agl;
    return s;
}
