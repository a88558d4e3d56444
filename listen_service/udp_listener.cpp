/**
 * UdpListener Implementation
 *
 * Uses nlohmann/json for decoding.
 */

#include "udp_listener.hpp"
#include "../bridge_daemon/logger.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static bool readInteger(const json &obj, const char *key, int64_t &out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_integer()) {
        return false;
    }
    out = it->get<int64_t>();
    return true;
}

static bool readNumber(const json &obj, const char *key, double &out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return false;
    }
    out = it->get<double>();
    return true;
}

UdpListener::UdpListener() {
}

UdpListener::~UdpListener() {
    close();
}

bool UdpListener::open(const std::string &bind_addr, uint16_t port) {
    close();

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, bind_addr.c_str(), &addr.sin_addr) != 1) {
        m_last_error = "invalid bind address " + bind_addr;
        LOG_ERROR("Listen", "%s", m_last_error.c_str());
        return false;
    }

    m_fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (m_fd < 0) {
        m_last_error = std::string("socket() failed: ") + strerror(errno);
        LOG_ERROR("Listen", "%s", m_last_error.c_str());
        return false;
    }

    int opt = 1;
    setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    int flags = fcntl(m_fd, F_GETFL, 0);
    if (flags < 0 || fcntl(m_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        m_last_error = std::string("fcntl(O_NONBLOCK) failed: ") + strerror(errno);
        LOG_ERROR("Listen", "%s", m_last_error.c_str());
        close();
        return false;
    }

    if (bind(m_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        m_last_error = std::string("bind() failed: ") + strerror(errno);
        LOG_ERROR("Listen", "%s", m_last_error.c_str());
        close();
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(m_fd, (struct sockaddr*)&addr, &len) == 0) {
        m_bound_port = ntohs(addr.sin_port);
    } else {
        m_bound_port = port;
    }

    LOG_INFO("Listen", "Listening on %s:%u", bind_addr.c_str(), (unsigned)m_bound_port);
    return true;
}

void UdpListener::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
    m_bound_port = 0;
}

int UdpListener::poll() {
    if (m_fd < 0) return 0;

    int handled = 0;
    char buf[LISTENER_MAX_DATAGRAM];
    while (true) {
        struct sockaddr_in from;
        socklen_t from_len = sizeof(from);
        ssize_t n = recvfrom(m_fd, buf, sizeof(buf), 0,
                             (struct sockaddr*)&from, &from_len);
        if (n < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_WARN("Listen", "recvfrom() failed: %s", strerror(errno));
            }
            break;
        }
        handleDatagram(std::string(buf, (size_t)n));
        handled++;
    }
    return handled;
}

bool UdpListener::handleDatagram(const std::string &body) {
    json root;
    try {
        root = json::parse(body);
    } catch (const json::exception &e) {
        reject(std::string("not JSON: ") + e.what());
        return false;
    }

    if (!root.is_object()) {
        reject("top level is not an object");
        return false;
    }

    auto status = root.find("status");
    if (status == root.end() || !status->is_string()) {
        reject("missing status");
        return false;
    }

    auto pos = root.find("position");
    if (pos == root.end() || !pos->is_object()) {
        reject("missing position");
        return false;
    }

    ListenerPosition p;
    if (!readNumber(*pos, "lat", p.lat) || !readNumber(*pos, "lon", p.lon)) {
        reject("position lat/lon not numeric");
        return false;
    }
    if (!readInteger(*pos, "altitude_msl", p.altitude_msl) ||
        !readInteger(*pos, "altitude_agl", p.altitude_agl) ||
        !readInteger(*pos, "gs", p.gs) ||
        !readInteger(*pos, "ias", p.ias) ||
        !readInteger(*pos, "vs", p.vs) ||
        !readInteger(*pos, "heading", p.heading) ||
        !readInteger(*pos, "distance", p.distance)) {
        reject("position field not an integer");
        return false;
    }
    auto sim_time = pos->find("sim_time");
    if (sim_time == pos->end() || !sim_time->is_string()) {
        reject("missing sim_time");
        return false;
    }
    p.sim_time = sim_time->get<std::string>();

    int64_t fuel = 0;
    int64_t flight_time = 0;
    if (!readInteger(root, "fuel", fuel) || !readInteger(root, "flight_time", flight_time)) {
        reject("fuel/flight_time not an integer");
        return false;
    }

    std::string new_status = status->get<std::string>();
    if (new_status != m_last_status) {
        LOG_INFO("Listen", "Status %s -> %s",
                 m_last_status.empty() ? "-" : m_last_status.c_str(), new_status.c_str());
    }

    m_last_status = new_status;
    m_last_position = p;
    m_last_fuel = fuel;
    m_last_flight_time = flight_time;
    m_ok_count++;

    appendLog(body);
    return true;
}

void UdpListener::reject(const std::string &reason) {
    m_error_count++;
    m_last_error = reason;
    LOG_WARN("Listen", "Dropped datagram: %s", reason.c_str());
    appendLog("ERROR " + reason);
}

void UdpListener::appendLog(const std::string &line) {
    m_log.push_back(line);
    while (m_log.size() > LISTENER_LOG_LINES) {
        m_log.pop_front();
    }
}

std::string UdpListener::statusSummary() const {
    std::ostringstream ss;
    ss << "ok=" << m_ok_count
       << " err=" << m_error_count;
    if (hasPayload()) {
        ss << " status=" << m_last_status
           << " lat=" << m_last_position.lat
           << " lon=" << m_last_position.lon
           << " alt=" << m_last_position.altitude_msl
           << " gs=" << m_last_position.gs
           << " fuel=" << m_last_fuel
           << " flight_time=" << m_last_flight_time;
    }
    if (!m_last_error.empty()) {
        ss << " last_error=\"" << m_last_error << "\"";
    }
    return ss.str();
}
