#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace sdrbridge::protocol {

/// Telemetry datagram layout, big-endian:
///   offset 0: meter id (u16)
///   offset 2: signal value (i16), dBm * 128
///   offset 4..15: reserved
/// Datagrams shorter than the 16-byte header are malformed.
inline constexpr size_t kTelemetryHeaderSize = 16;
inline constexpr double kTelemetryScale = 128.0;

struct TelemetryReading {
    uint16_t meter_id = 0;
    double value_dbm = 0.0;
    std::chrono::steady_clock::time_point received_at{};
};

inline uint16_t read_be_u16(const uint8_t *p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

/// The signal field is two's complement; reading it as unsigned turns every
/// negative dBm into a large positive one.
inline int16_t read_be_i16(const uint8_t *p) { return static_cast<int16_t>(read_be_u16(p)); }

/// Decode one telemetry datagram.
/// Returns std::nullopt for a malformed payload; never reads past `data`.
inline std::optional<TelemetryReading>
decode_reading(std::span<const uint8_t> data,
               std::chrono::steady_clock::time_point received_at =
                   std::chrono::steady_clock::now()) {
    if (data.size() < kTelemetryHeaderSize) {
        return std::nullopt;
    }

    TelemetryReading reading;
    reading.meter_id = read_be_u16(data.data());
    reading.value_dbm = static_cast<double>(read_be_i16(data.data() + 2)) / kTelemetryScale;
    reading.received_at = received_at;
    return reading;
}

} // namespace sdrbridge::protocol
