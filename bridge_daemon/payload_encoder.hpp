#ifndef PAYLOAD_ENCODER_HPP
#define PAYLOAD_ENCODER_HPP

#include <memory>
#include <string>

#include "telemetry_payload.hpp"

struct EncodeResult {
    bool ok = false;
    std::string bytes;
    std::string error;
};

/**
 * Payload Encoder Interface
 *
 * Serializes a TelemetryPayload to compact JSON. Every implementation emits
 * members in the same order:
 * status, position{lat, lon, altitude_msl, altitude_agl, gs, ias, vs,
 * heading, distance, sim_time}, fuel, flight_time
 */
class PayloadEncoder {
public:
    virtual ~PayloadEncoder() = default;

    virtual const char *name() const = 0;

    /**
     * Never throws; failures come back in EncodeResult::error.
     */
    virtual EncodeResult encode(const TelemetryPayload &payload) const = 0;
};

/**
 * nlohmann/json backed encoder.
 */
class NlohmannEncoder : public PayloadEncoder {
public:
    const char *name() const override { return "nlohmann"; }
    EncodeResult encode(const TelemetryPayload &payload) const override;
};

/**
 * Self-contained encoder built on MiniJsonValue.
 */
class MinimalJsonEncoder : public PayloadEncoder {
public:
    const char *name() const override { return "minimal"; }
    EncodeResult encode(const TelemetryPayload &payload) const override;
};

enum class EncoderKind {
    AUTO,
    NLOHMANN,
    MINIMAL
};

bool parseEncoderKind(const std::string &name, EncoderKind &out);

/**
 * Select the encoder once at startup. AUTO picks the richest available.
 */
std::unique_ptr<PayloadEncoder> createEncoder(EncoderKind kind);

#endif // PAYLOAD_ENCODER_HPP
