/**
 * ConfigStore Implementation
 *
 * Uses nlohmann/json for parsing and writing.
 */

#include "config_store.hpp"
#include "logger.h"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static const char *encoderKindName(EncoderKind kind) {
    switch (kind) {
        case EncoderKind::AUTO:     return "auto";
        case EncoderKind::NLOHMANN: return "nlohmann";
        case EncoderKind::MINIMAL:  return "minimal";
    }
    return "auto";
}

static uint64_t secondsToMs(double s) {
    // Inputs are validated non-negative; saturate instead of overflowing
    double ms = std::round(s * 1000.0);
    if (ms >= 18446744073709551616.0) {
        return std::numeric_limits<uint64_t>::max();
    }
    return (uint64_t)ms;
}

static bool readSeconds(const json &root, const char *key, double &out) {
    if (!root.contains(key)) return true;
    const json &v = root[key];
    if (!v.is_number() || !std::isfinite(v.get<double>()) || v.get<double>() < 0.0) {
        LOG_WARN("Config", "Ignoring %s: expected non-negative number", key);
        return false;
    }
    out = v.get<double>();
    return true;
}

static bool readString(const json &root, const char *key, std::string &out) {
    if (!root.contains(key)) return true;
    const json &v = root[key];
    if (!v.is_string()) {
        LOG_WARN("Config", "Ignoring %s: expected string", key);
        return false;
    }
    out = v.get<std::string>();
    return true;
}

ConfigStore::ConfigStore() {
}

bool ConfigStore::load(const std::string &path) {
    m_config_path = path;

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!parseJson(buffer.str())) {
        return false;
    }

    LOG_INFO("Config", "Loaded from %s", path.c_str());
    return true;
}

bool ConfigStore::parseJson(const std::string &json_content) {
    json root;
    try {
        root = json::parse(json_content);
    } catch (const json::exception &e) {
        LOG_ERROR("Config", "Parse error: %s", e.what());
        return false;
    }

    if (!root.is_object()) {
        LOG_ERROR("Config", "Top level must be an object");
        return false;
    }

    std::string host_val = host;
    if (readString(root, "host", host_val)) {
        if (host_val.empty()) {
            LOG_WARN("Config", "Ignoring empty host");
        } else {
            host = host_val;
        }
    }

    if (root.contains("port")) {
        const json &v = root["port"];
        if (v.is_number_integer() && v.get<int64_t>() > 0 && v.get<int64_t>() <= 65535) {
            port = (uint16_t)v.get<int64_t>();
        } else {
            LOG_WARN("Config", "Ignoring port: expected 1..65535");
        }
    }

    readSeconds(root, "send_interval_s", send_interval_s);
    readSeconds(root, "taxi_dwell_s", taxi_dwell_s);
    readSeconds(root, "stop_dwell_s", stop_dwell_s);

    if (root.contains("tick_hz")) {
        const json &v = root["tick_hz"];
        if (v.is_number_integer() && v.get<int64_t>() >= 1 && v.get<int64_t>() <= 1000) {
            tick_hz = (int)v.get<int64_t>();
        } else {
            LOG_WARN("Config", "Ignoring tick_hz: expected 1..1000");
        }
    }

    std::string phase_name;
    if (readString(root, "initial_phase", phase_name) && !phase_name.empty()) {
        FlightPhase phase;
        if (parsePhaseName(phase_name, phase) && phase != FlightPhase::PAUSED) {
            initial_phase = phase;
        } else {
            LOG_WARN("Config", "Ignoring initial_phase: unknown phase %s", phase_name.c_str());
        }
    }

    std::string encoder_name;
    if (readString(root, "encoder", encoder_name) && !encoder_name.empty()) {
        if (!parseEncoderKind(encoder_name, encoder)) {
            LOG_WARN("Config", "Ignoring encoder: unknown encoder %s", encoder_name.c_str());
        }
    }

    std::string level = log_level;
    if (readString(root, "log_level", level)) {
        LogLevel parsed;
        if (Logger::parseLevel(level, parsed)) {
            log_level = level;
        } else {
            LOG_WARN("Config", "Ignoring log_level: unknown level %s", level.c_str());
        }
    }

    readString(root, "log_file", log_file);
    return true;
}

std::string ConfigStore::toJson() const {
    json root;
    root["host"] = host;
    root["port"] = port;
    root["send_interval_s"] = send_interval_s;
    root["taxi_dwell_s"] = taxi_dwell_s;
    root["stop_dwell_s"] = stop_dwell_s;
    root["tick_hz"] = tick_hz;
    root["initial_phase"] = phaseName(initial_phase);
    root["encoder"] = encoderKindName(encoder);
    root["log_level"] = log_level;
    root["log_file"] = log_file;
    return root.dump(2);
}

bool ConfigStore::save(const std::string &path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }
    file << toJson() << "\n";
    return file.good();
}

uint64_t ConfigStore::sendIntervalMs() const {
    return secondsToMs(send_interval_s);
}

uint64_t ConfigStore::taxiDwellMs() const {
    return secondsToMs(taxi_dwell_s);
}

uint64_t ConfigStore::stopDwellMs() const {
    return secondsToMs(stop_dwell_s);
}
