#pragma once

#include "sdrbridge/protocol/transport.hpp"
#include "sdrbridge/protocol/wire.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sdrbridge::protocol {

struct DiscoveryConfig {
    uint16_t port = kDiscoveryPort;
    std::string marker_key = "type";
    std::string marker_value = "radio";
};

using Announcement = std::map<std::string, std::string, std::less<>>;

/// Parse a "key=value key=value" announcement. Tokens without '=' and
/// NUL padding are ignored.
Announcement parse_announcement(std::string_view payload);

/// Resolve the device address from an announcement that carries the marker.
/// Uses the announced ip/port when present, otherwise the datagram source and
/// the well-known command port. Returns std::nullopt if the marker is missing.
std::optional<DeviceAddress> match_announcement(const Announcement &announcement,
                                                const DiscoveryConfig &config,
                                                const std::string &sender_ip);

enum class DiscoveryOutcome {
    Found,    // a matching announcement arrived
    NotFound, // the timeout passed in silence
    Error,    // the discovery socket could not be bound or read
};

const char *discovery_outcome_label(DiscoveryOutcome outcome);

struct DiscoveryResult {
    DiscoveryOutcome outcome = DiscoveryOutcome::NotFound;
    std::optional<DeviceAddress> address; // set only when Found
    std::string error;                    // set only on Error

    [[nodiscard]] bool found() const { return outcome == DiscoveryOutcome::Found; }
};

/// Listens for device broadcasts on the discovery port.
class DiscoveryService {
  public:
    explicit DiscoveryService(DiscoveryConfig config = {});

    /// Wait up to `timeout` for the first matching announcement.
    /// A socket failure is reported as Error, not NotFound, so a busy port
    /// or missing permission is not mistaken for an absent device. The
    /// caller decides whether to retry. The socket is released before
    /// returning on every path.
    DiscoveryResult discover(std::chrono::milliseconds timeout);

    [[nodiscard]] const DiscoveryConfig &config() const { return config_; }

  private:
    DiscoveryConfig config_;
};

} // namespace sdrbridge::protocol
