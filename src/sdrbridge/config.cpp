#include "sdrbridge/config.hpp"

#include <charconv>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace sdrbridge {

namespace {

std::string key_path(const std::string &path, const char *key) {
    return path.empty() ? std::string(key) : path + "." + key;
}

const nlohmann::json *section(const nlohmann::json &doc, const char *key) {
    if (!doc.contains(key)) {
        return nullptr;
    }
    const auto &value = doc[key];
    if (!value.is_object()) {
        throw std::runtime_error(std::string("Config '") + key + "' must be an object");
    }
    return &value;
}

void read_string(const nlohmann::json &obj, const char *key, const std::string &path,
                 std::string &out) {
    if (!obj.contains(key)) {
        return;
    }
    if (!obj[key].is_string()) {
        throw std::runtime_error("Config '" + key_path(path, key) + "' must be a string");
    }
    out = obj[key].get<std::string>();
}

void read_u16(const nlohmann::json &obj, const char *key, const std::string &path, uint16_t &out) {
    if (!obj.contains(key)) {
        return;
    }
    const auto &value = obj[key];
    if (!value.is_number_unsigned() ||
        value.get<uint64_t>() > std::numeric_limits<uint16_t>::max()) {
        throw std::runtime_error("Config '" + key_path(path, key) +
                                 "' must be an integer 0-65535");
    }
    out = value.get<uint16_t>();
}

void read_ms(const nlohmann::json &obj, const char *key, const std::string &path,
             std::chrono::milliseconds &out) {
    if (!obj.contains(key)) {
        return;
    }
    if (!obj[key].is_number_unsigned()) {
        throw std::runtime_error("Config '" + key_path(path, key) +
                                 "' must be a non-negative integer (ms)");
    }
    out = std::chrono::milliseconds(obj[key].get<uint64_t>());
}

input::KeyDescriptor parse_key(const nlohmann::json &entry, size_t index) {
    const std::string path = "keys[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        throw std::runtime_error("Config '" + path + "' must be an object");
    }

    input::KeyDescriptor key;
    read_string(entry, "id", path, key.id);
    read_string(entry, "description", path, key.description);
    if (entry.contains("mode")) {
        // Passed through verbatim; the registry decides whether it is valid.
        if (!entry["mode"].is_string()) {
            throw std::runtime_error("Config '" + path + ".mode' must be a string");
        }
        key.mode = entry["mode"].get<std::string>();
    }
    return key;
}

uint16_t parse_port(std::string_view text, const char *what) {
    uint16_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::runtime_error(std::string("Invalid ") + what + " '" + std::string(text) + "'");
    }
    return value;
}

} // namespace

void apply_config_json(const nlohmann::json &doc, BridgeConfig &config) {
    if (!doc.is_object()) {
        throw std::runtime_error("Config root must be an object");
    }

    if (auto *device = section(doc, "device")) {
        read_string(*device, "address", "device", config.device_address);
        read_u16(*device, "port", "device", config.device_port);
    }

    if (auto *discovery = section(doc, "discovery")) {
        read_u16(*discovery, "port", "discovery", config.discovery.port);
        read_ms(*discovery, "timeout_ms", "discovery", config.discovery_timeout);
        read_string(*discovery, "marker_key", "discovery", config.discovery.marker_key);
        read_string(*discovery, "marker_value", "discovery", config.discovery.marker_value);
    }

    if (auto *telemetry = section(doc, "telemetry")) {
        read_u16(*telemetry, "port", "telemetry", config.telemetry.port);
        read_ms(*telemetry, "throttle_ms", "telemetry", config.telemetry.throttle);
        if (auto *meters = section(*telemetry, "meters")) {
            read_u16(*meters, "s_meter", "telemetry.meters", config.telemetry.meters.s_meter);
            read_u16(*meters, "power", "telemetry.meters", config.telemetry.meters.power);
            read_u16(*meters, "swr", "telemetry.meters", config.telemetry.meters.swr);
        }
    }

    if (auto *display = section(doc, "display")) {
        read_string(*display, "host", "display", config.display_host);
        read_u16(*display, "port", "display", config.display_port);
        read_ms(*display, "push_interval_ms", "display", config.push_interval);
    }

    read_ms(doc, "reconnect_interval_ms", "", config.reconnect_interval);

    if (doc.contains("keys")) {
        if (!doc["keys"].is_array()) {
            throw std::runtime_error("Config 'keys' must be an array");
        }
        config.keys.clear();
        size_t index = 0;
        for (const auto &entry : doc["keys"]) {
            config.keys.push_back(parse_key(entry, index++));
        }
    }
}

void load_config_file(const std::string &path, BridgeConfig &config) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file '" + path + "'");
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error &e) {
        throw std::runtime_error("Config file '" + path + "': " + e.what());
    }
    apply_config_json(doc, config);
}

void apply_address(const std::string &text, BridgeConfig &config) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos) {
        config.device_address = text;
        return;
    }
    config.device_address = text.substr(0, colon);
    config.device_port = parse_port(std::string_view(text).substr(colon + 1), "device port");
}

CommandLine parse_command_line(int argc, const char *const argv[]) {
    CommandLine result;

    auto value_of = [&](int &i) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(std::string("Missing value for ") + argv[i]);
        }
        return argv[++i];
    };

    // Config file first so flags win regardless of order.
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) == "--config") {
            load_config_file(value_of(i), result.config);
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            result.show_help = true;
        } else if (arg == "--config") {
            ++i;
        } else if (arg == "--address") {
            apply_address(value_of(i), result.config);
        } else if (arg == "--display-port") {
            result.config.display_port = parse_port(value_of(i), "display port");
        } else if (arg == "--telemetry-port") {
            result.config.telemetry.port = parse_port(value_of(i), "telemetry port");
        } else {
            throw std::runtime_error("Unknown argument '" + std::string(arg) + "'");
        }
    }
    return result;
}

const char *usage() {
    return "usage: sdrbridge [--config <file.json>] [--address <host[:port]>]\n"
           "                 [--display-port <port>] [--telemetry-port <port>]\n";
}

} // namespace sdrbridge
