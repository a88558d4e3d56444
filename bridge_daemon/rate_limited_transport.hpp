#ifndef RATE_LIMITED_TRANSPORT_HPP
#define RATE_LIMITED_TRANSPORT_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "udp_socket.hpp"
#include "error_handler.hpp"

struct RateLimiterState {
    std::optional<uint64_t> last_sent_ms;
};

enum class SendResult {
    SENT,
    THROTTLED,
    FAILED
};

/**
 * RateLimitedTransport - at most one datagram per interval
 *
 * Fire-and-forget. A failed write is surfaced once through the
 * ErrorHandler and never retried; the next eligible tick sends fresh data.
 */
class RateLimitedTransport {
public:
    RateLimitedTransport(DatagramSocket &socket, ErrorHandler &errors, uint64_t interval_ms);

    /**
     * True if a send at now_ms would go out.
     */
    bool isDue(uint64_t now_ms) const;

    /**
     * Send bytes if the interval has elapsed since the last send.
     */
    SendResult maybeSend(const std::string &bytes, uint64_t now_ms);

    const RateLimiterState &state() const { return m_state; }
    uint64_t intervalMs() const { return m_interval_ms; }

    uint32_t getSentCount() const { return m_sent; }
    uint32_t getThrottledCount() const { return m_throttled; }
    uint32_t getFailedCount() const { return m_failed; }

private:
    DatagramSocket &m_socket;
    ErrorHandler &m_errors;
    uint64_t m_interval_ms;
    RateLimiterState m_state;

    uint32_t m_sent = 0;
    uint32_t m_throttled = 0;
    uint32_t m_failed = 0;
};

#endif // RATE_LIMITED_TRANSPORT_HPP
