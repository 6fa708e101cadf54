#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace sdrbridge::protocol {

/// Owning wrapper around a bound IPv4 UDP socket.
/// The descriptor is closed by close() or the destructor, whichever comes first.
class UdpSocket {
  public:
    UdpSocket() = default;
    ~UdpSocket();

    UdpSocket(const UdpSocket &) = delete;
    UdpSocket &operator=(const UdpSocket &) = delete;
    UdpSocket(UdpSocket &&other) noexcept;
    UdpSocket &operator=(UdpSocket &&other) noexcept;

    /// Bind to INADDR_ANY:port with SO_REUSEADDR (and SO_BROADCAST if asked).
    /// Port 0 picks an ephemeral port. Returns false and fills `error` on failure.
    bool bind(uint16_t port, bool broadcast, std::string &error);

    /// Receive one datagram, waiting at most timeout_ms (-1 waits forever).
    /// Returns bytes received, 0 on timeout, -1 on error.
    /// `sender_ip` receives the dotted-quad source address when non-null.
    ssize_t receive(uint8_t *buffer, size_t size, int timeout_ms, std::string *sender_ip = nullptr);

    void close();

    [[nodiscard]] bool is_open() const { return fd_ >= 0; }
    [[nodiscard]] int fd() const { return fd_; }
    [[nodiscard]] uint16_t local_port() const;

  private:
    int fd_ = -1;
};

} // namespace sdrbridge::protocol
