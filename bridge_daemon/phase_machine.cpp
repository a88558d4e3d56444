/**
 * PhaseMachine Implementation
 *
 * Transition rules follow the PIREP status flow:
 * BOARDING -> READY_TO_START -> PUSHBACK_TAXI_OUT -> TAXI -> TAKEOFF ->
 * AIRBORNE -> ENROUTE -> APPROACH -> LANDING -> LANDED -> ON_BLOCK -> ARRIVED
 */

#include "phase_machine.hpp"
#include "logger.h"

#include "../common/units.h"
#include "../common/flight_limits.h"

PhaseInputs PhaseInputs::fromSnapshot(const SignalSnapshot &s) {
    PhaseInputs in;
    in.on_ground = s.on_ground;
    in.engine_running = s.engine_running;
    in.gs_kt = knots(s.ground_speed_ms);
    in.ias_kt = s.indicated_airspeed_kt;
    in.vs_fpm = feetPerMinute(s.vertical_speed_ms);
    in.agl_ft = feet(s.altitude_agl_m);
    in.radalt_ft = s.radio_altitude_ft;
    in.flight_time_s = s.flight_time_s;
    return in;
}

// Predicates

static bool boardingComplete(const PhaseInputs &in) {
    return in.on_ground && !in.engine_running &&
           in.gs_kt < GS_STATIONARY_KT && in.agl_ft < AGL_BOARDING_MAX_FT;
}

static bool taxiOutMoving(const PhaseInputs &in) {
    return in.on_ground && in.engine_running && in.gs_kt > GS_TAXI_KT;
}

static bool takeoffRoll(const PhaseInputs &in) {
    return in.ias_kt > IAS_TAKEOFF_KT && in.vs_fpm > VS_TAKEOFF_CLIMB_FPM;
}

static bool climbingOut(const PhaseInputs &in) {
    return !in.on_ground && in.agl_ft > AGL_AIRBORNE_FT &&
           in.vs_fpm > VS_AIRBORNE_CLIMB_FPM;
}

static bool cruiseLike(const PhaseInputs &in) {
    return !in.on_ground && in.agl_ft > AGL_CRUISE_FT && in.gs_kt > GS_CRUISE_KT;
}

static bool descendingToApproach(const PhaseInputs &in) {
    return !in.on_ground && in.agl_ft < AGL_APPROACH_MAX_FT &&
           in.vs_fpm < VS_APPROACH_FPM && in.radalt_ft < RADALT_APPROACH_FT;
}

static bool shortFinal(const PhaseInputs &in) {
    return !in.on_ground && in.agl_ft < AGL_LANDING_FT &&
           in.vs_fpm < VS_LANDING_FPM && in.radalt_ft < RADALT_LANDING_FT;
}

static bool rollout(const PhaseInputs &in) {
    return in.on_ground && in.gs_kt < GS_ROLLOUT_KT;
}

static bool stopped(const PhaseInputs &in) {
    return in.on_ground && in.gs_kt < GS_STATIONARY_KT;
}

static bool flightComplete(const PhaseInputs &in) {
    return stopped(in) && in.flight_time_s > FLIGHT_TIME_ARRIVAL_MIN_S;
}

const std::vector<PhaseTransition> &PhaseMachine::transitions() {
    static const std::vector<PhaseTransition> table = {
        {FlightPhase::BOARDING, boardingComplete,
         FlightPhase::READY_TO_START, FlightPhase::READY_TO_START,
         DwellKind::NONE, nullptr, FlightPhase::BOARDING, "boarding complete"},

        {FlightPhase::READY_TO_START, taxiOutMoving,
         FlightPhase::PUSHBACK_TAXI_OUT, FlightPhase::PUSHBACK_TAXI_OUT,
         DwellKind::TAXI_START, nullptr, FlightPhase::READY_TO_START, "taxi-out started"},

        {FlightPhase::PUSHBACK_TAXI_OUT, taxiOutMoving,
         FlightPhase::TAXI, FlightPhase::TAXI,
         DwellKind::NONE, nullptr, FlightPhase::PUSHBACK_TAXI_OUT, "taxiing"},

        {FlightPhase::TAXI, takeoffRoll,
         FlightPhase::TAKEOFF, FlightPhase::TAKEOFF,
         DwellKind::NONE, nullptr, FlightPhase::TAXI, "takeoff"},

        {FlightPhase::TAKEOFF, climbingOut,
         FlightPhase::AIRBORNE, FlightPhase::AIRBORNE,
         DwellKind::NONE, cruiseLike, FlightPhase::ENROUTE, "airborne"},

        {FlightPhase::AIRBORNE, cruiseLike,
         FlightPhase::ENROUTE, FlightPhase::ENROUTE,
         DwellKind::NONE, nullptr, FlightPhase::AIRBORNE, "enroute"},

        {FlightPhase::ENROUTE, descendingToApproach,
         FlightPhase::APPROACH, FlightPhase::APPROACH,
         DwellKind::NONE, nullptr, FlightPhase::ENROUTE, "approach"},

        {FlightPhase::APPROACH, shortFinal,
         FlightPhase::LANDING, FlightPhase::LANDING,
         DwellKind::NONE, nullptr, FlightPhase::APPROACH, "landing"},

        {FlightPhase::LANDING, rollout,
         FlightPhase::LANDED, FlightPhase::LANDED,
         DwellKind::NONE, nullptr, FlightPhase::LANDING, "touchdown"},

        {FlightPhase::LANDED, stopped,
         FlightPhase::ON_BLOCK, FlightPhase::ON_BLOCK,
         DwellKind::FULL_STOP, nullptr, FlightPhase::LANDED, "on block"},

        {FlightPhase::ON_BLOCK, flightComplete,
         FlightPhase::ARRIVED, FlightPhase::ARRIVED,
         DwellKind::NONE, nullptr, FlightPhase::ON_BLOCK, "arrived"},
    };
    return table;
}

bool PhaseMachine::holds(FlightPhase phase, const PhaseInputs &in) {
    switch (phase) {
        case FlightPhase::BOARDING:
            return in.on_ground && !in.engine_running && in.gs_kt < GS_STATIONARY_KT;
        case FlightPhase::READY_TO_START:
            return in.on_ground && in.gs_kt <= GS_TAXI_KT;
        case FlightPhase::LANDED:
        case FlightPhase::ON_BLOCK:
            return in.on_ground;
        case FlightPhase::PUSHBACK_TAXI_OUT:
        case FlightPhase::TAXI:
            return in.on_ground && in.engine_running;
        case FlightPhase::TAKEOFF:
            return !in.on_ground || in.ias_kt > IAS_TAKEOFF_KT;
        case FlightPhase::AIRBORNE:
        case FlightPhase::ENROUTE:
        case FlightPhase::APPROACH:
            return !in.on_ground;
        case FlightPhase::LANDING:
            return in.on_ground || in.agl_ft < AGL_LANDING_FT;
        case FlightPhase::ARRIVED:
            return true;
        case FlightPhase::PAUSED:
            return false;
    }
    return false;
}

FlightPhase PhaseMachine::fallbackPhase(const PhaseInputs &in) {
    if (in.on_ground) {
        return in.gs_kt < GS_STATIONARY_KT ? FlightPhase::ARRIVED : FlightPhase::TAXI;
    }
    if (in.radalt_ft < RADALT_FALLBACK_AIR_FT) {
        return FlightPhase::TAKEOFF;
    }
    return FlightPhase::ENROUTE;
}

PhaseMachine::PhaseMachine(const PhaseMachineConfig &config)
    : m_config(config) {
    m_state.phase = config.initial_phase;
}

void PhaseMachine::reset() {
    m_state = PhaseMachineState();
    m_state.phase = m_config.initial_phase;
    m_last_kind = StepKind::HOLD;
    LOG_INFO("Phase", "Reset to %s", phaseName(m_state.phase));
}

void PhaseMachine::setPhase(FlightPhase phase) {
    if (phase == FlightPhase::PAUSED) {
        return;
    }
    m_state.phase = phase;
    m_state.timer_start_ms.reset();
    m_state.dwell_watching = false;
}

bool PhaseMachine::dwellSatisfied(DwellKind dwell, uint64_t now_ms) const {
    // Unset only before the row was first evaluated in this phase
    if (!m_state.timer_start_ms) {
        return true;
    }
    uint64_t start = *m_state.timer_start_ms;
    uint64_t elapsed = (now_ms > start) ? now_ms - start : 0;
    uint64_t required = (dwell == DwellKind::TAXI_START) ? m_config.taxi_dwell_ms
                                                         : m_config.stop_dwell_ms;
    return elapsed >= required;
}

void PhaseMachine::enter(FlightPhase phase) {
    m_state.phase = phase;
    m_state.timer_start_ms.reset();
    m_state.dwell_watching = false;

    // Phases whose exit is dwell-guarded start the timer on first observation
    for (const auto &row : transitions()) {
        if (row.from == phase && row.dwell != DwellKind::NONE) {
            m_state.dwell_watching = true;
            break;
        }
    }
}

FlightPhase PhaseMachine::step(const SignalSnapshot &snapshot, uint64_t now_ms) {
    if (snapshot.paused) {
        m_last_kind = StepKind::PAUSED;
        return FlightPhase::PAUSED;
    }

    PhaseInputs in = PhaseInputs::fromSnapshot(snapshot);
    bool dwell_pending = false;

    for (const auto &row : transitions()) {
        if (row.from != m_state.phase) {
            continue;
        }

        bool matched = row.predicate(in);
        if (row.dwell != DwellKind::NONE) {
            if (!matched) {
                // Condition must hold continuously; wait until it is seen again
                m_state.timer_start_ms.reset();
                m_state.dwell_watching = true;
                continue;
            }
            if (!m_state.timer_start_ms && m_state.dwell_watching) {
                m_state.timer_start_ms = now_ms;
            }
            if (!dwellSatisfied(row.dwell, now_ms)) {
                dwell_pending = true;
                continue;
            }
        } else if (!matched) {
            continue;
        }

        FlightPhase from = m_state.phase;
        FlightPhase to = row.to;
        FlightPhase reported = row.reported;
        if (row.skip_when && row.skip_when(in)) {
            to = row.skip_to;
            reported = row.skip_to;
        }
        enter(to);
        m_last_kind = StepKind::TRANSITION;
        LOG_INFO("Phase", "%s -> %s (%s), reporting %s",
                 phaseName(from), phaseName(to), row.label, phaseWireCode(reported));
        return reported;
    }

    if (dwell_pending || holds(m_state.phase, in)) {
        m_last_kind = StepKind::HOLD;
        return m_state.phase;
    }

    FlightPhase reported = fallbackPhase(in);
    logFallback(in, reported);
    m_fallback_count++;
    m_last_kind = StepKind::FALLBACK;
    return reported;
}

void PhaseMachine::logFallback(const PhaseInputs &in, FlightPhase reported) {
    // One structured line per fallback; repeats within a run drop to DEBUG
    LogLevel level = (m_last_kind == StepKind::FALLBACK) ? LogLevel::DEBUG : LogLevel::WARN;
    Logger::instance().log(level, "Phase",
        "event=phase_fallback phase=%s reported=%s on_ground=%d engine_running=%d "
        "gs_kt=%.1f ias_kt=%.1f vs_fpm=%.0f agl_ft=%.0f radalt_ft=%.0f flight_time_s=%.0f",
        phaseName(m_state.phase), phaseWireCode(reported),
        in.on_ground ? 1 : 0, in.engine_running ? 1 : 0,
        in.gs_kt, in.ias_kt, in.vs_fpm, in.agl_ft, in.radalt_ft, in.flight_time_s);
}
