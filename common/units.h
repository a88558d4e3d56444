#ifndef FLIGHTLINK_UNITS_H
#define FLIGHTLINK_UNITS_H

/**
 * Unit conversion from simulator base units (metres, m/s, seconds)
 * to the aviation units used by the phase rules and the wire payload.
 */

#define MS_TO_KNOTS       1.94384
#define METRES_TO_FEET    3.28084
#define MS_TO_FPM         196.85
#define METRES_PER_NM     1852.0
#define SECONDS_PER_MIN   60.0

static inline double knots(double ms) {
    return ms * MS_TO_KNOTS;
}

static inline double feet(double metres) {
    return metres * METRES_TO_FEET;
}

static inline double feetPerMinute(double ms) {
    return ms * MS_TO_FPM;
}

static inline double nauticalMiles(double metres) {
    return metres / METRES_PER_NM;
}

static inline double minutes(double seconds) {
    return seconds / SECONDS_PER_MIN;
}

#endif // FLIGHTLINK_UNITS_H
