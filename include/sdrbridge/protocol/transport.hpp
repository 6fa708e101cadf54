#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace sdrbridge::protocol {

struct DeviceAddress {
    std::string host;
    uint16_t port = 0;

    [[nodiscard]] std::string to_string() const { return host + ":" + std::to_string(port); }

    bool operator==(const DeviceAddress &) const = default;
};

/// Byte-stream connection used by the command channel.
/// open/write/close may be called from any thread; read() is called only by
/// the channel's reader thread and must return promptly after close().
class Transport {
  public:
    virtual ~Transport() = default;

    /// Returns false and fills `error` on failure.
    virtual bool open(const DeviceAddress &address, std::string &error) = 0;

    /// Writes the whole buffer. Returns false on transport failure.
    virtual bool write(std::string_view data) = 0;

    /// Blocks for data. Returns bytes read, 0 on orderly close, -1 on error.
    virtual ssize_t read(char *buffer, size_t size) = 0;

    /// Idempotent. Unblocks a pending read().
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

/// TCP implementation over POSIX sockets.
class TcpTransport : public Transport {
  public:
    TcpTransport() = default;
    ~TcpTransport() override;

    TcpTransport(const TcpTransport &) = delete;
    TcpTransport &operator=(const TcpTransport &) = delete;

    bool open(const DeviceAddress &address, std::string &error) override;
    bool write(std::string_view data) override;
    ssize_t read(char *buffer, size_t size) override;
    void close() override;

  private:
    std::mutex mu_;
    int fd_ = -1;
    bool shut_down_ = false;
};

std::unique_ptr<Transport> make_tcp_transport();

} // namespace sdrbridge::protocol
