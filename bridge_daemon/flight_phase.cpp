/**
 * FlightPhase Implementation
 */

#include "flight_phase.hpp"

#include <algorithm>
#include <cctype>

struct PhaseInfo {
    FlightPhase phase;
    const char *name;
    const char *wire;
};

static const PhaseInfo kPhases[] = {
    {FlightPhase::PAUSED,            "PAUSED",            "PSD"},
    {FlightPhase::BOARDING,          "BOARDING",          "BST"},
    {FlightPhase::READY_TO_START,    "READY_TO_START",    "BST"},
    {FlightPhase::PUSHBACK_TAXI_OUT, "PUSHBACK_TAXI_OUT", "TXI"},
    {FlightPhase::TAXI,              "TAXI",              "TXI"},
    {FlightPhase::TAKEOFF,           "TAKEOFF",           "TOF"},
    {FlightPhase::AIRBORNE,          "AIRBORNE",          "ENR"},
    {FlightPhase::ENROUTE,           "ENROUTE",           "ENR"},
    {FlightPhase::APPROACH,          "APPROACH",          "TEN"},
    {FlightPhase::LANDING,           "LANDING",           "LDG"},
    {FlightPhase::LANDED,            "LANDED",            "ARR"},
    {FlightPhase::ON_BLOCK,          "ON_BLOCK",          "ARR"},
    {FlightPhase::ARRIVED,           "ARRIVED",           "ARR"},
};

static const PhaseInfo *findInfo(FlightPhase phase) {
    for (const auto &info : kPhases) {
        if (info.phase == phase) return &info;
    }
    return nullptr;
}

const char *phaseWireCode(FlightPhase phase) {
    const PhaseInfo *info = findInfo(phase);
    return info ? info->wire : "INI";
}

const char *phaseName(FlightPhase phase) {
    const PhaseInfo *info = findInfo(phase);
    return info ? info->name : "UNKNOWN";
}

bool parsePhaseName(const std::string &name, FlightPhase &out) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return (char)std::toupper(c); });
    for (const auto &info : kPhases) {
        if (upper == info.name) {
            out = info.phase;
            return true;
        }
    }
    return false;
}
