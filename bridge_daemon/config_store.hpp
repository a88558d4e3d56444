#ifndef CONFIG_STORE_HPP
#define CONFIG_STORE_HPP

#include <string>
#include <cstdint>

#include "flight_phase.hpp"
#include "payload_encoder.hpp"
#include "../common/flight_limits.h"

/**
 * ConfigStore - Bridge configuration
 *
 * Loads and saves a JSON file. Every key is optional; a value of the wrong
 * type or out of range is ignored with a warning and the default kept.
 */
class ConfigStore {
public:
    ConfigStore();

    /**
     * Load configuration from file. False if unreadable or not JSON.
     */
    bool load(const std::string &path);

    /**
     * Apply settings from a JSON document.
     */
    bool parseJson(const std::string &json_content);

    /**
     * Save configuration to file.
     */
    bool save(const std::string &path) const;

    std::string toJson() const;

    uint64_t sendIntervalMs() const;
    uint64_t taxiDwellMs() const;
    uint64_t stopDwellMs() const;

    // Destination
    std::string host = "127.0.0.1";
    uint16_t port = 47777;

    // Timing (seconds)
    double send_interval_s = SEND_INTERVAL_DEFAULT_S;
    double taxi_dwell_s = TAXI_DWELL_DEFAULT_S;
    double stop_dwell_s = STOP_DWELL_DEFAULT_S;
    int tick_hz = 10;

    FlightPhase initial_phase = FlightPhase::BOARDING;
    EncoderKind encoder = EncoderKind::AUTO;

    std::string log_level = "INFO";
    std::string log_file;

private:
    std::string m_config_path;
};

#endif // CONFIG_STORE_HPP
