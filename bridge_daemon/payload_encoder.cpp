/**
 * Payload encoders
 */

#include "payload_encoder.hpp"
#include "minimal_json.hpp"

#include <nlohmann/json.hpp>

// ordered_json keeps members in insertion order
using json = nlohmann::ordered_json;

EncodeResult NlohmannEncoder::encode(const TelemetryPayload &payload) const {
    EncodeResult result;
    try {
        json root;
        root["status"] = payload.status;

        const PayloadPosition &p = payload.position;
        json pos;
        pos["lat"] = p.lat;
        pos["lon"] = p.lon;
        pos["altitude_msl"] = p.altitude_msl;
        pos["altitude_agl"] = p.altitude_agl;
        pos["gs"] = p.gs;
        pos["ias"] = p.ias;
        pos["vs"] = p.vs;
        pos["heading"] = p.heading;
        pos["distance"] = p.distance;
        pos["sim_time"] = p.sim_time;
        root["position"] = pos;

        root["fuel"] = payload.fuel;
        root["flight_time"] = payload.flight_time;

        result.bytes = root.dump();
        result.ok = true;
    } catch (const json::exception &e) {
        // e.g. invalid UTF-8 in a string member
        result.error = e.what();
    }
    return result;
}

EncodeResult MinimalJsonEncoder::encode(const TelemetryPayload &payload) const {
    const PayloadPosition &p = payload.position;

    MiniJsonValue pos = MiniJsonValue::object();
    pos.set("lat", MiniJsonValue::number(p.lat));
    pos.set("lon", MiniJsonValue::number(p.lon));
    pos.set("altitude_msl", MiniJsonValue::integer(p.altitude_msl));
    pos.set("altitude_agl", MiniJsonValue::integer(p.altitude_agl));
    pos.set("gs", MiniJsonValue::integer(p.gs));
    pos.set("ias", MiniJsonValue::integer(p.ias));
    pos.set("vs", MiniJsonValue::integer(p.vs));
    pos.set("heading", MiniJsonValue::integer(p.heading));
    pos.set("distance", MiniJsonValue::integer(p.distance));
    pos.set("sim_time", MiniJsonValue::string(p.sim_time));

    MiniJsonValue root = MiniJsonValue::object();
    root.set("status", MiniJsonValue::string(payload.status));
    root.set("position", pos);
    root.set("fuel", MiniJsonValue::integer(payload.fuel));
    root.set("flight_time", MiniJsonValue::integer(payload.flight_time));

    EncodeResult result;
    result.bytes = root.dump();
    result.ok = true;
    return result;
}

bool parseEncoderKind(const std::string &name, EncoderKind &out) {
    if (name == "auto") out = EncoderKind::AUTO;
    else if (name == "nlohmann") out = EncoderKind::NLOHMANN;
    else if (name == "minimal") out = EncoderKind::MINIMAL;
    else return false;
    return true;
}

std::unique_ptr<PayloadEncoder> createEncoder(EncoderKind kind) {
    switch (kind) {
        case EncoderKind::MINIMAL:
            return std::make_unique<MinimalJsonEncoder>();
        case EncoderKind::AUTO:
        case EncoderKind::NLOHMANN:
            break;
    }
    return std::make_unique<NlohmannEncoder>();
}
