#pragma once

#include "sdrbridge/data/state_sync.hpp"
#include "sdrbridge/data/throttle.hpp"
#include "sdrbridge/protocol/telemetry.hpp"
#include "sdrbridge/protocol/udp_socket.hpp"
#include "sdrbridge/protocol/wire.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <thread>

namespace sdrbridge::protocol {

/// Which meter id feeds which DeviceState field.
struct MeterMap {
    uint16_t s_meter = 1;
    uint16_t power = 2;
    uint16_t swr = 3;
};

struct TelemetryStreamConfig {
    uint16_t port = kTelemetryPort;
    std::chrono::milliseconds throttle{3000};
    MeterMap meters;
};

/// dBm -> watts for the forward power meter.
double dbm_to_watts(double dbm);

enum class ReaderStep { Receive, Stop, Idle };

/// What the reader does after poll() reports `socket_events` on the telemetry
/// socket and `wake_events` on the wake pipe. A pending socket error is read
/// (recvfrom clears it); an invalid or hung-up socket ends the reader.
ReaderStep reader_step(short socket_events, short wake_events);

/// Errors recvfrom() reports for one bad datagram or ICMP notice. The reader
/// keeps going after these and stops after anything else.
bool is_transient_receive_error(int err);

/// Owns the telemetry UDP socket. A reader thread decodes every datagram and
/// passes it through a per-meter throttle gate before folding it into the
/// StateSynchronizer. Readings that arrive too soon are dropped, not queued.
class TelemetryStream {
  public:
    TelemetryStream(data::StateSynchronizer &sync, TelemetryStreamConfig config);
    ~TelemetryStream();

    TelemetryStream(const TelemetryStream &) = delete;
    TelemetryStream &operator=(const TelemetryStream &) = delete;

    /// Bind the socket and start the reader. Returns false if already
    /// running or the socket cannot be bound.
    bool start();

    /// Stop the reader and close the socket. Safe if never started.
    void stop();

    /// Decode, throttle and apply one datagram. Returns true if the reading
    /// reached the state model. Reader thread only (or tests, when not started).
    bool ingest(std::span<const uint8_t> datagram,
                std::chrono::steady_clock::time_point received_at =
                    std::chrono::steady_clock::now());

    [[nodiscard]] bool running() const { return reader_.joinable(); }
    [[nodiscard]] uint16_t local_port() const { return bound_port_.load(); }

    [[nodiscard]] uint64_t received_count() const { return received_.load(); }
    [[nodiscard]] uint64_t malformed_count() const { return malformed_.load(); }
    [[nodiscard]] uint64_t throttled_count() const { return throttled_.load(); }
    [[nodiscard]] uint64_t applied_count() const { return applied_.load(); }
    [[nodiscard]] uint64_t unmapped_count() const { return unmapped_.load(); }
    [[nodiscard]] uint64_t receive_error_count() const { return receive_errors_.load(); }

  private:
    void reader_loop();
    std::optional<data::StateUpdate> to_update(const TelemetryReading &reading) const;

    data::StateSynchronizer &sync_;
    TelemetryStreamConfig config_;
    data::MeterThrottle throttle_;

    UdpSocket socket_;
    int wake_[2] = {-1, -1};
    std::thread reader_;
    std::atomic<bool> stopping_{false};
    std::atomic<uint16_t> bound_port_{0};

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> throttled_{0};
    std::atomic<uint64_t> applied_{0};
    std::atomic<uint64_t> unmapped_{0};
    std::atomic<uint64_t> receive_errors_{0};
};

} // namespace sdrbridge::protocol
