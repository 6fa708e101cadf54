#include "sdrbridge/protocol/transport.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace sdrbridge::protocol {

namespace {

constexpr int kConnectTimeoutSec = 5;

} // namespace

TcpTransport::~TcpTransport() {
    close();
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

bool TcpTransport::open(const DeviceAddress &address, std::string &error) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *result = nullptr;
    const std::string port = std::to_string(address.port);
    if (int rc = ::getaddrinfo(address.host.c_str(), port.c_str(), &hints, &result); rc != 0) {
        error = "resolve " + address.host + ": " + ::gai_strerror(rc);
        return false;
    }

    int fd = ::socket(result->ai_family, result->ai_socktype, result->ai_protocol);
    if (fd < 0) {
        error = std::string("socket(): ") + std::strerror(errno);
        ::freeaddrinfo(result);
        return false;
    }

    // Bounds the blocking connect() on Linux.
    timeval tv{};
    tv.tv_sec = kConnectTimeoutSec;
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (::connect(fd, result->ai_addr, result->ai_addrlen) < 0) {
        error = "connect " + address.to_string() + ": " + std::strerror(errno);
        ::close(fd);
        ::freeaddrinfo(result);
        return false;
    }
    ::freeaddrinfo(result);

    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    std::lock_guard lock(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
    shut_down_ = false;
    return true;
}

bool TcpTransport::write(std::string_view data) {
    std::lock_guard lock(mu_);
    if (fd_ < 0 || shut_down_) {
        return false;
    }

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

ssize_t TcpTransport::read(char *buffer, size_t size) {
    int fd = -1;
    {
        std::lock_guard lock(mu_);
        if (shut_down_) {
            return 0;
        }
        fd = fd_;
    }
    if (fd < 0) {
        return -1;
    }

    while (true) {
        ssize_t n = ::recv(fd, buffer, size, 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return n;
    }
}

void TcpTransport::close() {
    std::lock_guard lock(mu_);
    if (fd_ >= 0 && !shut_down_) {
        // The descriptor itself is released in the destructor, after the
        // reader thread has left recv().
        ::shutdown(fd_, SHUT_RDWR);
    }
    shut_down_ = true;
}

std::unique_ptr<Transport> make_tcp_transport() { return std::make_unique<TcpTransport>(); }

} // namespace sdrbridge::protocol
