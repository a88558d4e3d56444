/**
 * Bridge Implementation
 *
 * Per tick: read snapshot -> phase step -> build payload ->
 * rate check -> encode -> send. Every failure skips this tick's telemetry.
 */

#include "bridge.hpp"
#include "telemetry_payload.hpp"
#include "logger.h"

#include <chrono>
#include <utility>
#include <sstream>

static PhaseMachineConfig machineConfig(const ConfigStore &config) {
    PhaseMachineConfig mc;
    mc.initial_phase = config.initial_phase;
    mc.taxi_dwell_ms = config.taxiDwellMs();
    mc.stop_dwell_ms = config.stopDwellMs();
    return mc;
}

uint64_t Bridge::monotonicMs() {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

Bridge::Bridge(SignalSource &source, DatagramSocket &socket,
               ErrorHandler &errors, const ConfigStore &config)
    : Bridge(source, socket, errors, config, createEncoder(config.encoder)) {
}

Bridge::Bridge(SignalSource &source, DatagramSocket &socket,
               ErrorHandler &errors, const ConfigStore &config,
               std::unique_ptr<PayloadEncoder> encoder)
    : m_source(source),
      m_errors(errors),
      m_machine(machineConfig(config)),
      m_encoder(std::move(encoder)),
      m_transport(socket, errors, config.sendIntervalMs()),
      m_stats(monotonicMs()),
      m_last_reported(config.initial_phase) {
    if (!m_encoder) {
        m_encoder = createEncoder(config.encoder);
    }
    LOG_INFO("Bridge", "Initial phase %s, encoder %s, send interval %llu ms",
             phaseName(config.initial_phase), m_encoder->name(),
             (unsigned long long)config.sendIntervalMs());
}

TickResult Bridge::tick() {
    return tick(monotonicMs(), std::time(nullptr));
}

TickResult Bridge::tick(uint64_t now_ms, std::time_t utc_now) {
    TickResult result;
    m_stats.tick(now_ms);

    SignalSnapshot snapshot = sanitizeSnapshot(m_source.read());
    result.reported = m_machine.step(snapshot, now_ms);

    if (!m_has_reported || result.reported != m_last_reported) {
        LOG_INFO("Bridge", "Reporting %s (%s)",
                 phaseWireCode(result.reported), phaseName(result.reported));
        m_last_reported = result.reported;
        m_has_reported = true;
    }

    if (!m_transport.isDue(now_ms)) {
        result.send = SendResult::THROTTLED;
        return result;
    }

    TelemetryPayload payload = buildPayload(snapshot, result.reported, utc_now);
    EncodeResult encoded = m_encoder->encode(payload);
    if (!encoded.ok) {
        m_stats.incrementEncodeFailures();
        m_errors.report(ErrorLevel::ERROR, "Encode failed, tick skipped: " + encoded.error);
        result.encode_failed = true;
        result.send = SendResult::FAILED;
        return result;
    }

    result.send = m_transport.maybeSend(encoded.bytes, now_ms);
    if (result.send == SendResult::SENT) {
        LOG_DEBUG("Bridge", "Sent %s", encoded.bytes.c_str());
    }
    return result;
}

void Bridge::resetFlight() {
    m_machine.reset();
    m_has_reported = false;
}

std::string Bridge::statusSummary(uint64_t now_ms) const {
    std::ostringstream ss;
    ss << "phase=" << phaseName(m_machine.phase())
       << " reporting=" << phaseWireCode(m_last_reported)
       << " uptime_s=" << m_stats.getUptimeSeconds(now_ms)
       << " loop_hz=" << m_stats.getLoopHz()
       << " sent=" << m_transport.getSentCount()
       << " send_failed=" << m_transport.getFailedCount()
       << " encode_failed=" << m_stats.getEncodeFailures()
       << " fallbacks=" << m_machine.fallbackCount();
    return ss.str();
}
