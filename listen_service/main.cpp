/**
 * FlightLink - Telemetry Listener
 *
 * Receives bridge datagrams on a UDP port, validates them and prints a
 * periodic summary. Stands in for the ground-side tracker during testing.
 */

#include <iostream>
#include <csignal>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <unistd.h>
#include <getopt.h>

#include "udp_listener.hpp"
#include "../bridge_daemon/logger.h"

#define DEFAULT_BIND_ADDR       "0.0.0.0"
#define DEFAULT_LISTEN_PORT     47777
#define POLL_INTERVAL_US        10000
#define SUMMARY_INTERVAL_S      5

static std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown.store(true);
}

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -b, --bind ADDR        Bind address (default: " << DEFAULT_BIND_ADDR << ")\n"
              << "  -p, --port PORT        UDP port (default: " << DEFAULT_LISTEN_PORT << ")\n"
              << "  -l, --log-level LEVEL  DEBUG, INFO, WARN, ERROR (default: INFO)\n"
              << "  -f, --log-file PATH    Log to file (in addition to stdout)\n"
              << "  -h, --help             Show this help\n";
}

int main(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"bind",      required_argument, 0, 'b'},
        {"port",      required_argument, 0, 'p'},
        {"log-level", required_argument, 0, 'l'},
        {"log-file",  required_argument, 0, 'f'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    std::string bind_addr = DEFAULT_BIND_ADDR;
    long port = DEFAULT_LISTEN_PORT;
    std::string log_level = "INFO";
    std::string log_file;
    char *end = nullptr;

    int opt;
    while ((opt = getopt_long(argc, argv, "b:p:l:f:h", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'b':
            bind_addr = optarg;
            break;
        case 'p':
            errno = 0;
            port = strtol(optarg, &end, 10);
            if (errno != 0 || end == optarg || *end != '\0' || port < 0 || port > 65535) {
                std::cerr << "Invalid port: " << optarg << std::endl;
                return 1;
            }
            break;
        case 'l':
            log_level = optarg;
            break;
        case 'f':
            log_file = optarg;
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!Logger::instance().setLevel(log_level)) {
        std::cerr << "Unknown log level: " << log_level << std::endl;
        return 1;
    }
    if (!log_file.empty()) {
        if (!Logger::instance().openFile(log_file)) {
            std::cerr << "Warning: Could not open log file: " << log_file << std::endl;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    UdpListener listener;
    if (!listener.open(bind_addr, (uint16_t)port)) {
        LOG_ERROR("Main", "Cannot listen: %s", listener.lastError().c_str());
        return 1;
    }

    time_t last_summary = time(nullptr);
    uint32_t last_total = 0;
    while (!g_shutdown.load()) {
        listener.poll();

        time_t now = time(nullptr);
        uint32_t total = listener.getOkCount() + listener.getErrorCount();
        if (now - last_summary >= SUMMARY_INTERVAL_S && total != last_total) {
            LOG_INFO("Stats", "%s", listener.statusSummary().c_str());
            last_summary = now;
            last_total = total;
        }

        usleep(POLL_INTERVAL_US);
    }

    LOG_INFO("Main", "Shutting down: %s", listener.statusSummary().c_str());
    listener.close();
    return 0;
}
