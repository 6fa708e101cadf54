#include "sdrbridge/protocol/discovery.hpp"
#include "sdrbridge/protocol/udp_socket.hpp"

#include <charconv>
#include <cstdio>
#include <string>

namespace sdrbridge::protocol {

namespace {

constexpr size_t kMaxAnnouncement = 2048;

bool is_separator(char c) { return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\0'; }

} // namespace

Announcement parse_announcement(std::string_view payload) {
    Announcement fields;
    size_t pos = 0;
    while (pos < payload.size()) {
        while (pos < payload.size() && is_separator(payload[pos])) {
            ++pos;
        }
        size_t end = pos;
        while (end < payload.size() && !is_separator(payload[end])) {
            ++end;
        }
        const std::string_view token = payload.substr(pos, end - pos);
        const auto eq = token.find('=');
        if (eq != std::string_view::npos && eq > 0) {
            fields[std::string(token.substr(0, eq))] = std::string(token.substr(eq + 1));
        }
        pos = end;
    }
    return fields;
}

std::optional<DeviceAddress> match_announcement(const Announcement &announcement,
                                                const DiscoveryConfig &config,
                                                const std::string &sender_ip) {
    auto marker = announcement.find(config.marker_key);
    if (marker == announcement.end() || marker->second != config.marker_value) {
        return std::nullopt;
    }

    DeviceAddress address;
    address.port = kCommandPort;

    auto ip = announcement.find("ip");
    address.host = (ip != announcement.end() && !ip->second.empty()) ? ip->second : sender_ip;
    if (address.host.empty()) {
        return std::nullopt;
    }

    auto port = announcement.find("port");
    if (port != announcement.end()) {
        uint16_t value = 0;
        const std::string &text = port->second;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size() && value != 0) {
            address.port = value;
        }
    }
    return address;
}

const char *discovery_outcome_label(DiscoveryOutcome outcome) {
    switch (outcome) {
    case DiscoveryOutcome::Found:
        return "found";
    case DiscoveryOutcome::NotFound:
        return "not found";
    case DiscoveryOutcome::Error:
        return "error";
    }
    return "unknown";
}

DiscoveryService::DiscoveryService(DiscoveryConfig config) : config_(std::move(config)) {}

DiscoveryResult DiscoveryService::discover(std::chrono::milliseconds timeout) {
    DiscoveryResult result;
    UdpSocket socket;
    if (!socket.bind(config_.port, true, result.error)) {
        std::fprintf(stderr, "[Discovery] %s\n", result.error.c_str());
        result.outcome = DiscoveryOutcome::Error;
        return result;
    }

    std::printf("[Discovery] Listening on UDP %u for %s=%s (%lld ms)\n", config_.port,
                config_.marker_key.c_str(), config_.marker_value.c_str(),
                static_cast<long long>(timeout.count()));

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    uint8_t buf[kMaxAnnouncement];

    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        std::string sender_ip;
        ssize_t n = socket.receive(buf, sizeof(buf), static_cast<int>(remaining.count()),
                                   &sender_ip);
        if (n < 0) {
            result.error = "receive on UDP " + std::to_string(config_.port) + " failed";
            std::fprintf(stderr, "[Discovery] %s\n", result.error.c_str());
            result.outcome = DiscoveryOutcome::Error;
            return result;
        }
        if (n == 0) {
            continue;
        }

        const std::string_view payload(reinterpret_cast<const char *>(buf),
                                       static_cast<size_t>(n));
        auto announcement = parse_announcement(payload);
        if (auto address = match_announcement(announcement, config_, sender_ip)) {
            std::printf("[Discovery] Found device at %s\n", address->to_string().c_str());
            result.outcome = DiscoveryOutcome::Found;
            result.address = std::move(address);
            return result;
        }
    }

    std::printf("[Discovery] No device found\n");
    result.outcome = DiscoveryOutcome::NotFound;
    return result;
}

} // namespace sdrbridge::protocol
