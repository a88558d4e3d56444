#ifndef FLIGHTLINK_FLIGHT_LIMITS_H
#define FLIGHTLINK_FLIGHT_LIMITS_H

// Phase rule thresholds, in rule units (kt, ft, fpm, s)

// Ground movement
#define GS_STATIONARY_KT          1.0
#define GS_TAXI_KT                5.0
#define GS_ROLLOUT_KT             10.0
#define AGL_BOARDING_MAX_FT       30.0

// Takeoff and climb
#define IAS_TAKEOFF_KT            50.0
#define VS_TAKEOFF_CLIMB_FPM      100.0
#define AGL_AIRBORNE_FT           100.0
#define VS_AIRBORNE_CLIMB_FPM     100.0

// Cruise-like: Takeoff may skip straight to Enroute above these
#define AGL_CRUISE_FT             1000.0
#define GS_CRUISE_KT              50.0

// Approach and landing
#define AGL_APPROACH_MAX_FT       5000.0
#define VS_APPROACH_FPM           -300.0
#define RADALT_APPROACH_FT        2000.0
#define AGL_LANDING_FT            100.0
#define VS_LANDING_FPM            -100.0
#define RADALT_LANDING_FT         50.0

// Arrival
#define FLIGHT_TIME_ARRIVAL_MIN_S 60.0

// Diagnostic fallback
#define RADALT_FALLBACK_AIR_FT    100.0

// Default dwell and send spacing
#define TAXI_DWELL_DEFAULT_S      5.0
#define STOP_DWELL_DEFAULT_S      10.0
#define SEND_INTERVAL_DEFAULT_S   0.5

#endif // FLIGHTLINK_FLIGHT_LIMITS_H
