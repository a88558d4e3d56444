#ifndef PHASE_MACHINE_HPP
#define PHASE_MACHINE_HPP

#include <cstdint>
#include <optional>
#include <vector>

#include "flight_phase.hpp"
#include "signal_source.hpp"

/**
 * Snapshot converted to rule units (kt, ft, fpm, s).
 */
struct PhaseInputs {
    bool on_ground = false;
    bool engine_running = false;
    double gs_kt = 0.0;
    double ias_kt = 0.0;
    double vs_fpm = 0.0;
    double agl_ft = 0.0;
    double radalt_ft = 0.0;
    double flight_time_s = 0.0;

    static PhaseInputs fromSnapshot(const SignalSnapshot &s);
};

/**
 * Stored machine state: current phase plus the hysteresis timer.
 *
 * timer_start_ms is the first tick the dwell condition was observed.
 * dwell_watching is set once the dwell row has been evaluated in this
 * phase; until then an unset timer counts as satisfied.
 */
struct PhaseMachineState {
    FlightPhase phase = FlightPhase::BOARDING;
    std::optional<uint64_t> timer_start_ms;
    bool dwell_watching = false;
};

enum class DwellKind {
    NONE,
    TAXI_START,     // ground speed above taxi threshold
    FULL_STOP       // ground speed near zero after landing
};

/**
 * One row of the ordered transition table.
 *
 * The first row whose `from` matches the current phase and whose predicate
 * holds (for dwell rows: continuously for the dwell) fires. If `skip_when`
 * is set and also holds, the machine goes to `skip_to` instead of `to`.
 */
struct PhaseTransition {
    FlightPhase from;
    bool (*predicate)(const PhaseInputs &in);
    FlightPhase to;
    FlightPhase reported;
    DwellKind dwell;
    bool (*skip_when)(const PhaseInputs &in);
    FlightPhase skip_to;
    const char *label;
};

enum class StepKind {
    PAUSED,
    TRANSITION,
    HOLD,
    FALLBACK
};

struct PhaseMachineConfig {
    FlightPhase initial_phase = FlightPhase::BOARDING;
    uint64_t taxi_dwell_ms = 5000;
    uint64_t stop_dwell_ms = 10000;
};

/**
 * PhaseMachine - Flight phase detection
 *
 * Called once per tick. Never fails: inputs are already sanitized and an
 * inconsistent snapshot falls back to a best-effort phase derived from
 * ground contact, speed and altitude alone.
 */
class PhaseMachine {
public:
    explicit PhaseMachine(const PhaseMachineConfig &config = PhaseMachineConfig());

    /**
     * Advance the machine with this tick's snapshot and return the phase
     * to report. now_ms is a monotonic timestamp used for dwell timing.
     */
    FlightPhase step(const SignalSnapshot &snapshot, uint64_t now_ms);

    /**
     * Start over for a new flight from the configured initial phase.
     */
    void reset();

    /**
     * Force a phase, e.g. to resume a flight after restart. Clears the timer,
     * so a dwell row out of this phase fires on its first matching tick.
     */
    void setPhase(FlightPhase phase);

    const PhaseMachineState &state() const { return m_state; }
    FlightPhase phase() const { return m_state.phase; }
    StepKind lastStepKind() const { return m_last_kind; }
    uint32_t fallbackCount() const { return m_fallback_count; }

    /**
     * The ordered transition table, first match wins.
     */
    static const std::vector<PhaseTransition> &transitions();

    /**
     * Steady-state condition for a phase: no transition and no fallback.
     * A dwell that is still running also holds, see step().
     */
    static bool holds(FlightPhase phase, const PhaseInputs &in);

    /**
     * Best-effort phase from raw conditions, independent of stored phase.
     */
    static FlightPhase fallbackPhase(const PhaseInputs &in);

private:
    bool dwellSatisfied(DwellKind dwell, uint64_t now_ms) const;
    void enter(FlightPhase phase);
    void logFallback(const PhaseInputs &in, FlightPhase reported);

    PhaseMachineConfig m_config;
    PhaseMachineState m_state;
    StepKind m_last_kind = StepKind::HOLD;
    uint32_t m_fallback_count = 0;
};

#endif // PHASE_MACHINE_HPP
