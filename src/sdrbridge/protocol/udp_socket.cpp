#include "sdrbridge/protocol/udp_socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace sdrbridge::protocol {

UdpSocket::~UdpSocket() { close(); }

UdpSocket::UdpSocket(UdpSocket &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

UdpSocket &UdpSocket::operator=(UdpSocket &&other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

bool UdpSocket::bind(uint16_t port, bool broadcast, std::string &error) {
    close();

    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
        error = std::string("socket(): ") + std::strerror(errno);
        return false;
    }

    int opt = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (broadcast) {
        ::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &opt, sizeof(opt));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);

    if (::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
        error = "bind(" + std::to_string(port) + "): " + std::strerror(errno);
        close();
        return false;
    }
    return true;
}

ssize_t UdpSocket::receive(uint8_t *buffer, size_t size, int timeout_ms, std::string *sender_ip) {
    if (fd_ < 0) {
        return -1;
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int ready = ::poll(&pfd, 1, timeout_ms);
    if (ready < 0) {
        return errno == EINTR ? 0 : -1;
    }
    if (ready == 0) {
        return 0;
    }

    sockaddr_in sender{};
    socklen_t slen = sizeof(sender);
    ssize_t n = ::recvfrom(fd_, buffer, size, 0, reinterpret_cast<sockaddr *>(&sender), &slen);
    if (n < 0) {
        return -1;
    }
    if (sender_ip != nullptr) {
        char text[INET_ADDRSTRLEN]{};
        ::inet_ntop(AF_INET, &sender.sin_addr, text, sizeof(text));
        *sender_ip = text;
    }
    return n;
}

void UdpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

uint16_t UdpSocket::local_port() const {
    if (fd_ < 0) {
        return 0;
    }
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

} // namespace sdrbridge::protocol
