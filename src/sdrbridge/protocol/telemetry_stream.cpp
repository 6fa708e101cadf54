#include "sdrbridge/protocol/telemetry_stream.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace sdrbridge::protocol {

namespace {

constexpr size_t kMaxDatagram = 2048;
// Upper bound on how long the reader can miss a stop request.
constexpr int kPollTimeoutMs = 250;

} // namespace

double dbm_to_watts(double dbm) { return std::pow(10.0, (dbm - 30.0) / 10.0); }

ReaderStep reader_step(short socket_events, short wake_events) {
    if (wake_events != 0) {
        return ReaderStep::Stop;
    }
    if (socket_events & POLLNVAL) {
        return ReaderStep::Stop;
    }
    if (socket_events & (POLLIN | POLLERR)) {
        return ReaderStep::Receive;
    }
    if (socket_events & POLLHUP) {
        return ReaderStep::Stop;
    }
    return ReaderStep::Idle;
}

bool is_transient_receive_error(int err) {
    switch (err) {
    case EINTR:
    case EAGAIN:
#if EWOULDBLOCK != EAGAIN
    case EWOULDBLOCK:
#endif
    case ECONNREFUSED:
    case EHOSTUNREACH:
    case ENETUNREACH:
    case EMSGSIZE:
        return true;
    default:
        return false;
    }
}

TelemetryStream::TelemetryStream(data::StateSynchronizer &sync, TelemetryStreamConfig config)
    : sync_(sync), config_(config), throttle_(config.throttle) {}

TelemetryStream::~TelemetryStream() { stop(); }

bool TelemetryStream::start() {
    if (reader_.joinable()) {
        return false;
    }

    std::string error;
    if (!socket_.bind(config_.port, false, error)) {
        std::fprintf(stderr, "[Telemetry] %s\n", error.c_str());
        return false;
    }
    if (::pipe(wake_) < 0) {
        std::fprintf(stderr, "[Telemetry] pipe(): %s\n", std::strerror(errno));
        socket_.close();
        return false;
    }

    throttle_.reset();
    stopping_.store(false);
    bound_port_.store(socket_.local_port());
    std::printf("[Telemetry] Listening on UDP %u (throttle %lld ms)\n", bound_port_.load(),
                static_cast<long long>(config_.throttle.count()));

    reader_ = std::thread(&TelemetryStream::reader_loop, this);
    return true;
}

void TelemetryStream::stop() {
    if (reader_.joinable()) {
        stopping_.store(true);
        const char b = 0;
        ssize_t n = 0;
        do {
            n = ::write(wake_[1], &b, 1);
        } while (n < 0 && errno == EINTR);
        if (n != 1) {
            std::fprintf(stderr, "[Telemetry] Wake write failed (%s); waiting for poll timeout\n",
                         std::strerror(errno));
        }
        reader_.join();
    }
    for (int &fd : wake_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
    if (socket_.is_open()) {
        socket_.close();
        std::printf("[Telemetry] Stopped (%llu received, %llu malformed, %llu throttled)\n",
                    static_cast<unsigned long long>(received_.load()),
                    static_cast<unsigned long long>(malformed_.load()),
                    static_cast<unsigned long long>(throttled_.load()));
    }
    bound_port_.store(0);
}

bool TelemetryStream::ingest(std::span<const uint8_t> datagram,
                             std::chrono::steady_clock::time_point received_at) {
    received_.fetch_add(1, std::memory_order_relaxed);

    auto reading = decode_reading(datagram, received_at);
    if (!reading) {
        malformed_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    auto update = to_update(*reading);
    if (!update) {
        unmapped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    if (!throttle_.admit(reading->meter_id, reading->received_at)) {
        throttled_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    sync_.apply(*update);
    applied_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::optional<data::StateUpdate> TelemetryStream::to_update(const TelemetryReading &reading) const {
    data::StateUpdate update;
    if (reading.meter_id == config_.meters.s_meter) {
        update.s_meter_dbm = static_cast<float>(reading.value_dbm);
    } else if (reading.meter_id == config_.meters.power) {
        update.power_meter_watts = static_cast<float>(dbm_to_watts(reading.value_dbm));
    } else if (reading.meter_id == config_.meters.swr) {
        update.swr_ratio = static_cast<float>(reading.value_dbm);
    } else {
        return std::nullopt;
    }
    return update;
}

void TelemetryStream::reader_loop() {
    uint8_t buf[kMaxDatagram];

    while (!stopping_.load()) {
        pollfd fds[2]{};
        fds[0].fd = socket_.fd();
        fds[0].events = POLLIN;
        fds[1].fd = wake_[0];
        fds[1].events = POLLIN;

        if (::poll(fds, 2, kPollTimeoutMs) < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::fprintf(stderr, "[Telemetry] poll(): %s\n", std::strerror(errno));
            break;
        }

        const ReaderStep step = reader_step(fds[0].revents, fds[1].revents);
        if (step == ReaderStep::Stop) {
            if (fds[1].revents == 0) {
                std::fprintf(stderr, "[Telemetry] Socket closed (revents 0x%x); reader exiting\n",
                             static_cast<unsigned>(fds[0].revents));
            }
            break;
        }
        if (step == ReaderStep::Idle) {
            continue;
        }

        ssize_t n = socket_.receive(buf, sizeof(buf), 0);
        if (n > 0) {
            ingest(std::span<const uint8_t>(buf, static_cast<size_t>(n)));
        } else if (n < 0) {
            const int err = errno;
            receive_errors_.fetch_add(1, std::memory_order_relaxed);
            if (!is_transient_receive_error(err)) {
                std::fprintf(stderr, "[Telemetry] recvfrom(): %s; reader exiting\n",
                             std::strerror(err));
                break;
            }
        }
    }
}

} // namespace sdrbridge::protocol
