/**
 * ReplaySignalSource Implementation
 *
 * Uses nlohmann/json for parsing.
 */

#include "replay_source.hpp"
#include "logger.h"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static double numberOr(const json &frame, const char *key, double fallback) {
    auto it = frame.find(key);
    if (it == frame.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<double>();
}

static bool flagOr(const json &frame, const char *key, bool fallback) {
    auto it = frame.find(key);
    if (it == frame.end()) {
        return fallback;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    // Simulator datarefs publish flags as 0/1
    if (it->is_number()) {
        return it->get<double>() != 0.0;
    }
    return fallback;
}

static SignalSnapshot frameFromJson(const json &frame) {
    SignalSnapshot s;
    s.on_ground = flagOr(frame, "on_ground", false);
    s.engine_running = flagOr(frame, "engine_running", false);
    s.paused = flagOr(frame, "paused", false);

    s.ground_speed_ms = numberOr(frame, "ground_speed_ms", 0.0);
    s.indicated_airspeed_kt = numberOr(frame, "indicated_airspeed_kt", 0.0);
    s.vertical_speed_ms = numberOr(frame, "vertical_speed_ms", 0.0);
    s.radio_altitude_ft = numberOr(frame, "radio_altitude_ft", 0.0);
    s.altitude_agl_m = numberOr(frame, "altitude_agl_m", 0.0);
    s.flight_time_s = numberOr(frame, "flight_time_s", 0.0);
    s.heading_deg = numberOr(frame, "heading_deg", 0.0);
    s.distance_m = numberOr(frame, "distance_m", 0.0);
    s.fuel_total = numberOr(frame, "fuel_total", 0.0);

    auto tanks = frame.find("fuel_tanks");
    if (tanks != frame.end() && tanks->is_array()) {
        double total = 0.0;
        for (const auto &tank : *tanks) {
            if (tank.is_number()) {
                total += tank.get<double>();
            }
        }
        s.fuel_total = total;
    }

    s.latitude_deg = numberOr(frame, "latitude_deg", 0.0);
    s.longitude_deg = numberOr(frame, "longitude_deg", 0.0);
    s.elevation_m = numberOr(frame, "elevation_m", 0.0);
    return s;
}

bool ReplaySignalSource::loadFromFile(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Replay", "Cannot open %s", path.c_str());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!parseJson(buffer.str())) {
        return false;
    }

    LOG_INFO("Replay", "Loaded %zu frames from %s", m_frames.size(), path.c_str());
    return true;
}

bool ReplaySignalSource::parseJson(const std::string &json_content) {
    try {
        json root = json::parse(json_content);

        if (!root.is_array() || root.empty()) {
            LOG_ERROR("Replay", "Expected a non-empty array of frames");
            return false;
        }

        std::vector<SignalSnapshot> frames;
        frames.reserve(root.size());
        for (const auto &frame : root) {
            if (!frame.is_object()) {
                LOG_ERROR("Replay", "Frame %zu is not an object", frames.size());
                return false;
            }
            frames.push_back(frameFromJson(frame));
        }

        m_frames.swap(frames);
        m_index = 0;
        return true;
    } catch (const json::exception &e) {
        LOG_ERROR("Replay", "Parse error: %s", e.what());
        return false;
    }
}

SignalSnapshot ReplaySignalSource::read() {
    if (m_frames.empty()) {
        return SignalSnapshot();
    }
    if (m_index < m_frames.size()) {
        return m_frames[m_index++];
    }
    return m_frames.back();
}
