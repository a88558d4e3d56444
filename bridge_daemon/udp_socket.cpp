/**
 * UdpSocket Implementation
 */

#include "udp_socket.hpp"
#include "logger.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

UdpSocket::UdpSocket() {
}

UdpSocket::~UdpSocket() {
    close();
}

bool UdpSocket::open(const std::string &host, uint16_t port) {
    close();

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    struct addrinfo *res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0 || res == nullptr) {
        m_last_error = std::string("resolve ") + host + ": " + gai_strerror(rc);
        LOG_ERROR("Udp", "%s", m_last_error.c_str());
        return false;
    }

    m_fd = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (m_fd < 0) {
        m_last_error = std::string("socket() failed: ") + strerror(errno);
        LOG_ERROR("Udp", "%s", m_last_error.c_str());
        freeaddrinfo(res);
        return false;
    }

    int flags = fcntl(m_fd, F_GETFL, 0);
    if (flags < 0 || fcntl(m_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        m_last_error = std::string("fcntl(O_NONBLOCK) failed: ") + strerror(errno);
        LOG_ERROR("Udp", "%s", m_last_error.c_str());
        freeaddrinfo(res);
        close();
        return false;
    }

    if (::connect(m_fd, res->ai_addr, res->ai_addrlen) < 0) {
        m_last_error = std::string("connect() failed: ") + strerror(errno);
        LOG_ERROR("Udp", "%s", m_last_error.c_str());
        freeaddrinfo(res);
        close();
        return false;
    }
    freeaddrinfo(res);

    LOG_INFO("Udp", "Sending to %s:%u", host.c_str(), (unsigned)port);
    return true;
}

void UdpSocket::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool UdpSocket::send(const void *data, size_t len) {
    if (m_fd < 0) {
        m_last_error = "socket not open";
        return false;
    }

    ssize_t n = ::send(m_fd, data, len, MSG_DONTWAIT | MSG_NOSIGNAL);
    if (n < 0) {
        // ECONNREFUSED here reports an ICMP error from an earlier datagram
        m_last_error = strerror(errno);
        return false;
    }
    if ((size_t)n != len) {
        m_last_error = "short write";
        return false;
    }
    return true;
}
