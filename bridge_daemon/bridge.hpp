#ifndef BRIDGE_HPP
#define BRIDGE_HPP

#include <cstdint>
#include <ctime>
#include <memory>
#include <string>

#include "signal_source.hpp"
#include "phase_machine.hpp"
#include "payload_encoder.hpp"
#include "rate_limited_transport.hpp"
#include "error_handler.hpp"
#include "config_store.hpp"
#include "loop_stats.hpp"

/**
 * Outcome of one tick
 */
struct TickResult {
    FlightPhase reported = FlightPhase::BOARDING;
    SendResult send = SendResult::THROTTLED;
    bool encode_failed = false;
};

/**
 * Bridge - one simulator-to-ground telemetry bridge
 *
 * Owns the phase machine and rate limiter state. Driven by the host through
 * tick(); creates no thread or timer and never blocks. Not thread-safe:
 * call tick() from one thread only.
 */
class Bridge {
public:
    Bridge(SignalSource &source, DatagramSocket &socket,
           ErrorHandler &errors, const ConfigStore &config);

    /**
     * Use the given encoder instead of the one named in config.
     */
    Bridge(SignalSource &source, DatagramSocket &socket,
           ErrorHandler &errors, const ConfigStore &config,
           std::unique_ptr<PayloadEncoder> encoder);

    /**
     * Sample, detect phase, build, and (rate permitting) encode and send.
     * now_ms is monotonic, utc_now stamps the payload.
     */
    TickResult tick(uint64_t now_ms, std::time_t utc_now);

    /**
     * tick() using the system clocks.
     */
    TickResult tick();

    /**
     * Start phase detection over for the next flight.
     */
    void resetFlight();

    const PhaseMachine &machine() const { return m_machine; }
    const RateLimitedTransport &transport() const { return m_transport; }
    const LoopStats &stats() const { return m_stats; }
    const char *encoderName() const { return m_encoder->name(); }

    /**
     * One-line status for periodic logging.
     */
    std::string statusSummary(uint64_t now_ms) const;

    static uint64_t monotonicMs();

private:
    SignalSource &m_source;
    ErrorHandler &m_errors;

    PhaseMachine m_machine;
    std::unique_ptr<PayloadEncoder> m_encoder;
    RateLimitedTransport m_transport;
    LoopStats m_stats;

    FlightPhase m_last_reported;
    bool m_has_reported = false;
};

#endif // BRIDGE_HPP
