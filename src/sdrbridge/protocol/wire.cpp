#include "sdrbridge/protocol/wire.hpp"

#include <charconv>
#include <cstdio>
#include <limits>

namespace sdrbridge::protocol {

namespace {

template <typename T> std::optional<T> parse_number(std::string_view text, int base = 10) {
    if (text.empty()) {
        return std::nullopt;
    }
    T value{};
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value, base);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parse_flag(std::string_view text) {
    if (text == "1") {
        return true;
    }
    if (text == "0") {
        return false;
    }
    return std::nullopt;
}

// Splits "<prefix><number>|<rest>" and returns the number text and rest.
bool split_header(std::string_view line, std::string_view &number, std::string_view &rest) {
    const auto bar = line.find('|');
    if (bar == std::string_view::npos || bar < 2) {
        return false;
    }
    number = line.substr(1, bar - 1);
    rest = line.substr(bar + 1);
    return true;
}

StatusMessage parse_status_body(uint32_t handle, std::string_view body) {
    StatusMessage status;
    status.handle = handle;

    size_t pos = 0;
    while (pos < body.size()) {
        while (pos < body.size() && body[pos] == ' ') {
            ++pos;
        }
        if (pos >= body.size()) {
            break;
        }
        auto end = body.find(' ', pos);
        if (end == std::string_view::npos) {
            end = body.size();
        }
        const std::string_view token = body.substr(pos, end - pos);
        const auto eq = token.find('=');
        if (eq == std::string_view::npos) {
            if (status.object.empty()) {
                status.object = std::string(token);
            } else {
                status.positional.emplace_back(token);
            }
        } else {
            status.fields[std::string(token.substr(0, eq))] = std::string(token.substr(eq + 1));
        }
        pos = end;
    }
    return status;
}

std::optional<std::string_view> field(const StatusMessage &status, std::string_view key) {
    auto it = status.fields.find(key);
    if (it == status.fields.end()) {
        return std::nullopt;
    }
    return std::string_view(it->second);
}

std::optional<data::StateUpdate> slice_update(const StatusMessage &status) {
    // Only the first slice drives the VFO model.
    if (status.positional.empty() || status.positional[0] != "0") {
        return std::nullopt;
    }

    data::StateUpdate update;
    if (auto freq = field(status, "RF_frequency")) {
        update.frequency_hz = parse_mhz(*freq);
        if (!update.frequency_hz) {
            std::fprintf(stderr, "[CommandChannel] Bad RF_frequency '%.*s'\n",
                         static_cast<int>(freq->size()), freq->data());
        }
    }
    if (auto mode = field(status, "mode")) {
        update.mode = data::parse_mode(*mode);
        if (!update.mode) {
            std::fprintf(stderr, "[CommandChannel] Unknown mode '%.*s'\n",
                         static_cast<int>(mode->size()), mode->data());
        }
    }
    if (auto nb = field(status, "nb")) {
        update.nb_enabled = parse_flag(*nb);
    }
    if (auto nr = field(status, "nr")) {
        update.nr_enabled = parse_flag(*nr);
    }
    if (auto step = field(status, "step")) {
        if (auto hz = parse_number<uint32_t>(*step)) {
            for (size_t i = 0; i < data::kTuningSteps.size(); ++i) {
                if (data::kTuningSteps[i] == *hz) {
                    update.tuning_step_index = i;
                }
            }
        }
    }
    return update;
}

std::optional<data::StateUpdate> interlock_update(const StatusMessage &status) {
    auto state = field(status, "state");
    if (!state) {
        return std::nullopt;
    }

    data::StateUpdate update;
    if (*state == "TRANSMITTING") {
        update.tx_active = true;
    } else if (*state == "READY" || *state == "RECEIVE" || *state == "NOT_READY") {
        update.tx_active = false;
    } else {
        // Transitional states (PTT_REQUESTED, UNKEY_REQUESTED) change nothing yet.
        return std::nullopt;
    }
    return update;
}

std::optional<data::StateUpdate> memory_update(const StatusMessage &status) {
    if (status.positional.empty()) {
        return std::nullopt;
    }
    auto slot_number = parse_number<size_t>(status.positional[0]);
    if (!slot_number || *slot_number < 1 || *slot_number > data::kMemorySlotCount) {
        return std::nullopt;
    }

    data::MemorySlotUpdate slot_update;
    slot_update.index = *slot_number - 1;

    const bool removed = status.positional.size() > 1 && status.positional[1] == "removed";
    if (!removed) {
        auto freq = field(status, "freq");
        auto mode = field(status, "mode");
        if (!freq || !mode) {
            return std::nullopt;
        }
        auto hz = parse_mhz(*freq);
        auto parsed_mode = data::parse_mode(*mode);
        if (!hz || !parsed_mode) {
            return std::nullopt;
        }
        slot_update.slot = data::MemorySlot{*hz, *parsed_mode};
    }

    data::StateUpdate update;
    update.memory_slots.push_back(slot_update);
    return update;
}

} // namespace

std::string format_command(uint32_t sequence_id, std::string_view verb, std::string_view args) {
    std::string line = "C" + std::to_string(sequence_id) + "|";
    line.append(verb);
    if (!args.empty()) {
        line.push_back(' ');
        line.append(args);
    }
    line.push_back(kLineTerminator);
    return line;
}

InboundLine parse_line(std::string_view line) {
    InboundLine parsed;
    parsed.text = std::string(line);
    if (line.empty()) {
        return parsed;
    }

    std::string_view number;
    std::string_view rest;

    switch (line[0]) {
    case 'R': {
        if (!split_header(line, number, rest)) {
            return parsed;
        }
        auto seq = parse_number<uint32_t>(number);
        if (!seq) {
            return parsed;
        }
        const auto bar = rest.find('|');
        const std::string_view status_text = rest.substr(0, bar);
        auto status = parse_number<uint32_t>(status_text, 16);
        if (!status) {
            return parsed;
        }
        parsed.kind = LineKind::Response;
        parsed.response.sequence_id = *seq;
        parsed.response.status = *status;
        if (bar != std::string_view::npos) {
            parsed.response.data = std::string(rest.substr(bar + 1));
        }
        parsed.text.clear();
        return parsed;
    }
    case 'S': {
        if (!split_header(line, number, rest)) {
            return parsed;
        }
        auto handle = parse_number<uint32_t>(number, 16);
        if (!handle) {
            return parsed;
        }
        parsed.kind = LineKind::Status;
        parsed.status = parse_status_body(*handle, rest);
        parsed.text.clear();
        return parsed;
    }
    case 'V':
        parsed.kind = LineKind::Version;
        parsed.text = std::string(line.substr(1));
        return parsed;
    case 'H': {
        auto handle = parse_number<uint32_t>(line.substr(1), 16);
        if (!handle) {
            return parsed;
        }
        parsed.kind = LineKind::Handle;
        parsed.handle = *handle;
        parsed.text.clear();
        return parsed;
    }
    case 'M': {
        if (!split_header(line, number, rest)) {
            return parsed;
        }
        parsed.kind = LineKind::Message;
        parsed.text = std::string(rest);
        return parsed;
    }
    default:
        return parsed;
    }
}

std::optional<uint64_t> parse_mhz(std::string_view text) {
    const auto dot = text.find('.');
    const std::string_view whole = text.substr(0, dot);
    auto mhz = parse_number<uint64_t>(whole);
    if (!mhz) {
        return std::nullopt;
    }

    if (*mhz > (std::numeric_limits<uint64_t>::max() - 999'999) / 1'000'000) {
        return std::nullopt;
    }

    uint64_t fraction_hz = 0;
    if (dot != std::string_view::npos) {
        std::string_view fraction = text.substr(dot + 1);
        if (fraction.size() > 6) {
            // Sub-hertz digits are truncated but must still be digits.
            const std::string_view extra = fraction.substr(6);
            for (char c : extra) {
                if (c < '0' || c > '9') {
                    return std::nullopt;
                }
            }
            fraction = fraction.substr(0, 6);
        }
        if (!fraction.empty()) {
            auto digits = parse_number<uint64_t>(fraction);
            if (!digits) {
                return std::nullopt;
            }
            fraction_hz = *digits;
            for (size_t i = fraction.size(); i < 6; ++i) {
                fraction_hz *= 10;
            }
        }
    }
    return *mhz * 1'000'000 + fraction_hz;
}

std::string format_mhz(uint64_t frequency_hz) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%llu.%06llu",
                  static_cast<unsigned long long>(frequency_hz / 1'000'000),
                  static_cast<unsigned long long>(frequency_hz % 1'000'000));
    return buf;
}

std::optional<data::StateUpdate> status_to_update(const StatusMessage &status) {
    if (status.object == "slice") {
        return slice_update(status);
    }
    if (status.object == "interlock") {
        return interlock_update(status);
    }
    if (status.object == "memory") {
        return memory_update(status);
    }
    return std::nullopt;
}

} // namespace sdrbridge::protocol
