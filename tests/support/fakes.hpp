#pragma once

#include "sdrbridge/display_server.hpp"
#include "sdrbridge/protocol/command_channel.hpp"
#include "sdrbridge/protocol/transport.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace sdrbridge::test_support {

/// Poll `pred` until it holds or the timeout expires.
template <typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

/// Send one datagram to 127.0.0.1:port.
inline bool send_udp(uint16_t port, const void *data, size_t size) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
        return false;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ssize_t n =
        ::sendto(fd, data, size, 0, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr));
    ::close(fd);
    return n == static_cast<ssize_t>(size);
}

inline bool send_udp(uint16_t port, const std::string &text) {
    return send_udp(port, text.data(), text.size());
}

/// Shared between a test and every FakeTransport the channel creates.
struct FakeLink {
    std::mutex mu;
    std::condition_variable cv;
    std::vector<std::string> writes;
    std::deque<std::string> inbound;
    bool closed = true;
    bool fail_open = false;
    bool fail_write = false;
    int opens = 0;
    int closes = 0;

    void deliver(std::string chunk) {
        {
            std::lock_guard lock(mu);
            inbound.push_back(std::move(chunk));
        }
        cv.notify_all();
    }

    /// The device drops the connection.
    void remote_close() {
        {
            std::lock_guard lock(mu);
            closed = true;
        }
        cv.notify_all();
    }

    std::vector<std::string> written() {
        std::lock_guard lock(mu);
        return writes;
    }

    size_t write_count() {
        std::lock_guard lock(mu);
        return writes.size();
    }

    /// Number of writes containing `needle`.
    size_t count_containing(const std::string &needle) {
        std::lock_guard lock(mu);
        size_t n = 0;
        for (const auto &w : writes) {
            if (w.find(needle) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }
};

class FakeTransport : public protocol::Transport {
  public:
    explicit FakeTransport(std::shared_ptr<FakeLink> link) : link_(std::move(link)) {}

    bool open(const protocol::DeviceAddress & /*address*/, std::string &error) override {
        std::lock_guard lock(link_->mu);
        ++link_->opens;
        if (link_->fail_open) {
            error = "connection refused";
            return false;
        }
        link_->closed = false;
        link_->inbound.clear();
        return true;
    }

    bool write(std::string_view data) override {
        std::lock_guard lock(link_->mu);
        if (link_->closed || link_->fail_write) {
            return false;
        }
        link_->writes.emplace_back(data);
        return true;
    }

    ssize_t read(char *buffer, size_t size) override {
        std::unique_lock lock(link_->mu);
        link_->cv.wait(lock, [this] { return link_->closed || !link_->inbound.empty(); });
        if (link_->inbound.empty()) {
            return 0;
        }
        std::string chunk = std::move(link_->inbound.front());
        link_->inbound.pop_front();
        const size_t n = std::min(size, chunk.size());
        std::copy(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n), buffer);
        if (n < chunk.size()) {
            link_->inbound.push_front(chunk.substr(n));
        }
        return static_cast<ssize_t>(n);
    }

    void close() override {
        {
            std::lock_guard lock(link_->mu);
            link_->closed = true;
            ++link_->closes;
        }
        link_->cv.notify_all();
    }

  private:
    std::shared_ptr<FakeLink> link_;
};

inline protocol::TransportFactory fake_factory(std::shared_ptr<FakeLink> link) {
    return [link]() -> std::unique_ptr<protocol::Transport> {
        return std::make_unique<FakeTransport>(link);
    };
}

/// Records every command instead of sending it.
class RecordingSink : public protocol::CommandSink {
  public:
    std::optional<uint32_t> send(std::string_view verb, std::string_view args) override {
        if (!connected) {
            return std::nullopt;
        }
        commands.emplace_back(std::string(verb), std::string(args));
        return next_id++;
    }

    bool connected = true;
    uint32_t next_id = 1;
    std::vector<std::pair<std::string, std::string>> commands;
};

/// Collects display pushes.
class RecordingDisplay : public DisplaySurface {
  public:
    void push(const nlohmann::json &message) override {
        std::lock_guard lock(mu_);
        messages_.push_back(message);
    }

    std::vector<nlohmann::json> messages() {
        std::lock_guard lock(mu_);
        return messages_;
    }

    size_t count_of(const std::string &type) {
        std::lock_guard lock(mu_);
        size_t n = 0;
        for (const auto &m : messages_) {
            if (m.value("type", "") == type) {
                ++n;
            }
        }
        return n;
    }

    void clear() {
        std::lock_guard lock(mu_);
        messages_.clear();
    }

  private:
    std::mutex mu_;
    std::vector<nlohmann::json> messages_;
};

} // namespace sdrbridge::test_support
