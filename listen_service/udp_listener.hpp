#ifndef UDP_LISTENER_HPP
#define UDP_LISTENER_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

#define LISTENER_LOG_LINES      500
#define LISTENER_MAX_DATAGRAM   2048

/**
 * Last accepted position report
 */
struct ListenerPosition {
    double lat = 0.0;
    double lon = 0.0;
    int64_t altitude_msl = 0;
    int64_t altitude_agl = 0;
    int64_t gs = 0;
    int64_t ias = 0;
    int64_t vs = 0;
    int64_t heading = 0;
    int64_t distance = 0;
    std::string sim_time;
};

/**
 * UdpListener - ground-side receiver for bridge telemetry
 *
 * Binds a UDP port and drains it without blocking. Each datagram is decoded
 * with nlohmann/json and checked for the payload shape the bridge sends.
 * Malformed datagrams are counted and logged, never fatal.
 */
class UdpListener {
public:
    UdpListener();
    ~UdpListener();

    UdpListener(const UdpListener&) = delete;
    UdpListener& operator=(const UdpListener&) = delete;

    /**
     * Bind to bind_addr:port (IPv4). Port 0 picks a free port.
     */
    bool open(const std::string &bind_addr, uint16_t port);
    void close();
    bool isOpen() const { return m_fd >= 0; }

    /**
     * Port actually bound, 0 if not open.
     */
    uint16_t boundPort() const { return m_bound_port; }

    /**
     * Read every pending datagram. Returns how many were handled.
     */
    int poll();

    /**
     * Decode and validate one datagram body, updating counters and state.
     * Returns true if it was a well-formed payload.
     */
    bool handleDatagram(const std::string &body);

    uint32_t getOkCount() const { return m_ok_count; }
    uint32_t getErrorCount() const { return m_error_count; }
    const std::string &lastError() const { return m_last_error; }

    bool hasPayload() const { return m_ok_count > 0; }
    const std::string &lastStatus() const { return m_last_status; }
    const ListenerPosition &lastPosition() const { return m_last_position; }
    int64_t lastFuel() const { return m_last_fuel; }
    int64_t lastFlightTime() const { return m_last_flight_time; }

    /**
     * Most recent log lines, oldest first, at most LISTENER_LOG_LINES.
     */
    const std::deque<std::string> &logLines() const { return m_log; }

    std::string statusSummary() const;

private:
    void appendLog(const std::string &line);
    void reject(const std::string &reason);

    int m_fd = -1;
    uint16_t m_bound_port = 0;

    uint32_t m_ok_count = 0;
    uint32_t m_error_count = 0;
    std::string m_last_error;

    std::string m_last_status;
    ListenerPosition m_last_position;
    int64_t m_last_fuel = 0;
    int64_t m_last_flight_time = 0;

    std::deque<std::string> m_log;
};

#endif // UDP_LISTENER_HPP
