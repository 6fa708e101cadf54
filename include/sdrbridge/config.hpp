#pragma once

#include "sdrbridge/input/descriptors.hpp"
#include "sdrbridge/protocol/discovery.hpp"
#include "sdrbridge/protocol/telemetry_stream.hpp"
#include "sdrbridge/protocol/wire.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sdrbridge {

/// Everything the bridge reads from the deployment.
struct BridgeConfig {
    /// Empty means discover on start.
    std::string device_address;
    uint16_t device_port = protocol::kCommandPort;

    protocol::DiscoveryConfig discovery;
    std::chrono::milliseconds discovery_timeout{5000};

    protocol::TelemetryStreamConfig telemetry;

    std::string display_host = "127.0.0.1";
    uint16_t display_port = 8765;
    std::chrono::milliseconds push_interval{1000};

    /// 0 disables reconnection.
    std::chrono::milliseconds reconnect_interval{5000};

    /// Key bindings submitted by the mapping subsystem.
    std::vector<input::KeyDescriptor> keys;
};

/// Apply a JSON document on top of `config`. Missing keys keep their value.
/// Throws std::runtime_error naming the offending key on a type mismatch.
void apply_config_json(const nlohmann::json &doc, BridgeConfig &config);

/// Read and apply a JSON config file. Throws std::runtime_error.
void load_config_file(const std::string &path, BridgeConfig &config);

/// "host" or "host:port".
void apply_address(const std::string &text, BridgeConfig &config);

/// Result of command-line parsing.
struct CommandLine {
    BridgeConfig config;
    bool show_help = false;
};

/// Parse argv. --config is applied first, the other flags override it.
/// Throws std::runtime_error on a bad flag or value.
CommandLine parse_command_line(int argc, const char *const argv[]);

const char *usage();

} // namespace sdrbridge
