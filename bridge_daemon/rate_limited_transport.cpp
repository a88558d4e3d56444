/**
 * RateLimitedTransport Implementation
 */

#include "rate_limited_transport.hpp"
#include "logger.h"

static const char *kSendErrorKey = "udp_send";

RateLimitedTransport::RateLimitedTransport(DatagramSocket &socket, ErrorHandler &errors,
                                           uint64_t interval_ms)
    : m_socket(socket), m_errors(errors), m_interval_ms(interval_ms) {
}

bool RateLimitedTransport::isDue(uint64_t now_ms) const {
    if (!m_state.last_sent_ms) {
        return true;
    }
    uint64_t last = *m_state.last_sent_ms;
    // A clock that went backwards counts as due rather than stalling
    if (now_ms < last) {
        return true;
    }
    return now_ms - last >= m_interval_ms;
}

SendResult RateLimitedTransport::maybeSend(const std::string &bytes, uint64_t now_ms) {
    if (!isDue(now_ms)) {
        m_throttled++;
        return SendResult::THROTTLED;
    }

    // Stamp before writing: a failed write waits for the next interval
    m_state.last_sent_ms = now_ms;

    if (!m_socket.send(bytes.data(), bytes.size())) {
        m_failed++;
        m_errors.reportOnce(kSendErrorKey, ErrorLevel::ERROR, m_socket.lastError());
        return SendResult::FAILED;
    }

    if (m_errors.clear(kSendErrorKey)) {
        LOG_INFO("Transport", "Datagram send recovered");
    }
    m_sent++;
    return SendResult::SENT;
}
