#ifndef UDP_SOCKET_HPP
#define UDP_SOCKET_HPP

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * Datagram Socket Interface
 *
 * A socket connected to one fixed peer. send() never blocks.
 */
class DatagramSocket {
public:
    virtual ~DatagramSocket() = default;

    /**
     * Send one datagram. Returns false on failure; lastError() describes it.
     */
    virtual bool send(const void *data, size_t len) = 0;

    virtual std::string lastError() const = 0;
};

/**
 * UdpSocket - non-blocking UDP socket connected to host:port
 */
class UdpSocket : public DatagramSocket {
public:
    UdpSocket();
    ~UdpSocket() override;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /**
     * Resolve host (IPv4 name or address) and connect. Connecting a UDP
     * socket only fixes the peer; nothing is sent.
     */
    bool open(const std::string &host, uint16_t port);

    void close();

    bool isOpen() const { return m_fd >= 0; }

    bool send(const void *data, size_t len) override;

    std::string lastError() const override { return m_last_error; }

private:
    int m_fd = -1;
    std::string m_last_error;
};

#endif // UDP_SOCKET_HPP
