#ifndef FLIGHT_PHASE_HPP
#define FLIGHT_PHASE_HPP

#include <string>

/**
 * Flight phase enumeration
 *
 * Declared in nominal flight order. PAUSED is an overlay reported while the
 * simulator is paused and is never stored as the machine's phase.
 */
enum class FlightPhase {
    PAUSED,
    BOARDING,
    READY_TO_START,
    PUSHBACK_TAXI_OUT,
    TAXI,
    TAKEOFF,
    AIRBORNE,
    ENROUTE,
    APPROACH,
    LANDING,
    LANDED,
    ON_BLOCK,
    ARRIVED
};

/**
 * Wire identifier (PIREP status code) reported for a phase.
 */
const char *phaseWireCode(FlightPhase phase);

/**
 * Upper-case phase name, e.g. "READY_TO_START".
 */
const char *phaseName(FlightPhase phase);

/**
 * Parse a phase name (case-insensitive). Returns false if unknown.
 */
bool parsePhaseName(const std::string &name, FlightPhase &out);

#endif // FLIGHT_PHASE_HPP
