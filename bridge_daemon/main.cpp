/**
 * FlightLink - Bridge Daemon
 *
 * Main entry point for the simulator-to-ground telemetry bridge.
 * Responsibilities:
 * - Load configuration, apply command line overrides
 * - Choose the signal source (scripted flight profile or recorded replay)
 * - Drive Bridge::tick() at the configured rate until SIGINT/SIGTERM
 * - Periodic status line
 */

#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <unistd.h>
#include <getopt.h>

#include "bridge.hpp"
#include "config_store.hpp"
#include "error_handler.hpp"
#include "flight_profile.hpp"
#include "replay_source.hpp"
#include "udp_socket.hpp"
#include "logger.h"

#define DEFAULT_CONFIG_PATH     "/etc/flightlink/config.json"
#define STATS_LOG_INTERVAL_MS   30000

static std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    (void)sig;
    g_shutdown.store(true);
}

static void on_critical(const std::string &message) {
    (void)message;
    g_shutdown.store(true);
}

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -c, --config PATH      Config file (default: " << DEFAULT_CONFIG_PATH << ")\n"
              << "  -H, --host HOST        Destination host\n"
              << "  -p, --port PORT        Destination UDP port\n"
              << "  -i, --interval SEC     Minimum seconds between datagrams\n"
              << "  -P, --profile SCALE    Play the scripted flight, SCALE times real time (default source)\n"
              << "  -r, --replay FILE      Play recorded snapshots from a JSON file\n"
              << "  -e, --encoder NAME     auto, nlohmann or minimal\n"
              << "  -t, --tick-hz HZ       Loop rate (default: 10)\n"
              << "  -l, --log-level LEVEL  DEBUG, INFO, WARN, ERROR (default: INFO)\n"
              << "  -f, --log-file PATH    Log to file (in addition to stdout)\n"
              << "  -h, --help             Show this help\n";
}

static bool parseLong(const char *text, long min, long max, long &out) {
    char *end = nullptr;
    errno = 0;
    long v = strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || v < min || v > max) {
        return false;
    }
    out = v;
    return true;
}

static bool parseSeconds(const char *text, double &out) {
    char *end = nullptr;
    errno = 0;
    double v = strtod(text, &end);
    if (errno != 0 || end == text || *end != '\0' || !std::isfinite(v) || v < 0.0) {
        return false;
    }
    out = v;
    return true;
}

int main(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"config",    required_argument, 0, 'c'},
        {"host",      required_argument, 0, 'H'},
        {"port",      required_argument, 0, 'p'},
        {"interval",  required_argument, 0, 'i'},
        {"profile",   required_argument, 0, 'P'},
        {"replay",    required_argument, 0, 'r'},
        {"encoder",   required_argument, 0, 'e'},
        {"tick-hz",   required_argument, 0, 't'},
        {"log-level", required_argument, 0, 'l'},
        {"log-file",  required_argument, 0, 'f'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    std::string config_path = DEFAULT_CONFIG_PATH;
    std::string host, replay_file, encoder_name, log_level, log_file;
    long port = -1;
    long tick_hz = -1;
    double interval_s = -1.0;
    double time_scale = 1.0;
    long value = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "c:H:p:i:P:r:e:t:l:f:h", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'c':
            config_path = optarg;
            break;
        case 'H':
            host = optarg;
            break;
        case 'p':
            if (!parseLong(optarg, 1, 65535, value)) {
                std::cerr << "Invalid port: " << optarg << std::endl;
                return 1;
            }
            port = value;
            break;
        case 'i':
            if (!parseSeconds(optarg, interval_s)) {
                std::cerr << "Invalid interval: " << optarg << std::endl;
                return 1;
            }
            break;
        case 'P':
            if (!parseSeconds(optarg, time_scale) || time_scale == 0.0) {
                std::cerr << "Invalid profile time scale: " << optarg << std::endl;
                return 1;
            }
            break;
        case 'r':
            replay_file = optarg;
            break;
        case 'e':
            encoder_name = optarg;
            break;
        case 't':
            if (!parseLong(optarg, 1, 1000, value)) {
                std::cerr << "Invalid tick rate: " << optarg << std::endl;
                return 1;
            }
            tick_hz = value;
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

    ConfigStore config;
    bool config_loaded = config.load(config_path);

    // Command line wins over the file
    if (!host.empty()) config.host = host;
    if (port > 0) config.port = (uint16_t)port;
    if (interval_s >= 0.0) config.send_interval_s = interval_s;
    if (tick_hz > 0) config.tick_hz = (int)tick_hz;
    if (!log_level.empty()) config.log_level = log_level;
    if (!log_file.empty()) config.log_file = log_file;
    if (!encoder_name.empty() && !parseEncoderKind(encoder_name, config.encoder)) {
        std::cerr << "Unknown encoder: " << encoder_name << std::endl;
        return 1;
    }

    if (!Logger::instance().setLevel(config.log_level)) {
        std::cerr << "Unknown log level: " << config.log_level << std::endl;
        return 1;
    }
    if (!config.log_file.empty()) {
        if (!Logger::instance().openFile(config.log_file)) {
            std::cerr << "Warning: Could not open log file: " << config.log_file << std::endl;
        }
    }

    if (!config_loaded) {
        LOG_WARN("Main", "Config %s not loaded, using defaults", config_path.c_str());
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ErrorHandler error_handler;
    error_handler.setCriticalCallback(on_critical);

    UdpSocket socket;
    if (!socket.open(config.host, config.port)) {
        error_handler.report(ErrorLevel::CRITICAL, "Failed to open UDP socket to " +
                             config.host + ": " + socket.lastError());
        return 1;
    }

    std::unique_ptr<SignalSource> source;
    if (!replay_file.empty()) {
        std::unique_ptr<ReplaySignalSource> replay(new ReplaySignalSource());
        if (!replay->loadFromFile(replay_file)) {
            error_handler.report(ErrorLevel::CRITICAL, "Failed to load replay " + replay_file);
            return 1;
        }
        source = std::move(replay);
    } else {
        LOG_INFO("Main", "Playing scripted flight at %.1fx (%.0f s)",
                 time_scale, FlightProfileSource::durationSeconds() / time_scale);
        source.reset(new FlightProfileSource(time_scale));
    }

    Bridge bridge(*source, socket, error_handler, config);

    LOG_INFO("Main", "Sending to %s:%u at %d Hz tick rate",
             config.host.c_str(), (unsigned)config.port, config.tick_hz);

    useconds_t period_us = (useconds_t)(1000000 / config.tick_hz);
    uint64_t last_stats_ms = Bridge::monotonicMs();

    while (!g_shutdown.load()) {
        bridge.tick();

        uint64_t now = Bridge::monotonicMs();
        if (now - last_stats_ms >= STATS_LOG_INTERVAL_MS) {
            LOG_INFO("Stats", "%s", bridge.statusSummary(now).c_str());
            last_stats_ms = now;
        }

        usleep(period_us);
    }

    LOG_INFO("Main", "Shutting down: %s", bridge.statusSummary(Bridge::monotonicMs()).c_str());
    socket.close();

    LOG_INFO("Main", "Exited cleanly");
    return 0;
}
