#pragma once

#include "sdrbridge/data/state_sync.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdrbridge::protocol {

/// Well-known ports of the device.
inline constexpr uint16_t kCommandPort = 4992;
inline constexpr uint16_t kDiscoveryPort = 4992;
inline constexpr uint16_t kTelemetryPort = 4991;

inline constexpr char kLineTerminator = '\n';

/// Longest inbound line kept while waiting for its terminator.
inline constexpr size_t kMaxLineLength = 16 * 1024;

/// Frame an outbound command: "C<seq>|<verb> <args>\n".
/// The space and args are omitted when args is empty.
std::string format_command(uint32_t sequence_id, std::string_view verb, std::string_view args);

/// "R<seq>|<status>|<data>". Status is hexadecimal, 0 means success.
struct CommandResponse {
    uint32_t sequence_id = 0;
    uint32_t status = 0;
    std::string data;
    std::string verb; // filled by the channel from its outstanding table

    [[nodiscard]] bool ok() const { return status == 0; }
};

/// "S<handle>|<object> <positional...> key=value ..."
struct StatusMessage {
    uint32_t handle = 0;
    std::string object;
    std::vector<std::string> positional;
    std::map<std::string, std::string, std::less<>> fields;
};

enum class LineKind {
    Response, // R
    Status,   // S
    Version,  // V
    Handle,   // H
    Message,  // M
    Unknown,
};

struct InboundLine {
    LineKind kind = LineKind::Unknown;
    CommandResponse response;
    StatusMessage status;
    uint32_t handle = 0; // H lines
    std::string text;    // V and M payloads, or the raw line when Unknown
};

/// Classify and parse one complete line (terminator already removed).
/// Lines that look like a known kind but fail to parse come back Unknown.
InboundLine parse_line(std::string_view line);

/// Reassembles lines from a byte stream.
/// Partial lines are held until their terminator arrives; a trailing '\r'
/// is stripped and empty lines are skipped. A line longer than
/// kMaxLineLength is dropped whole, up to and including its terminator.
class LineSplitter {
  public:
    template <typename OnLine> void feed(std::string_view chunk, OnLine &&on_line) {
        for (char c : chunk) {
            if (c == kLineTerminator) {
                if (discarding_) {
                    discarding_ = false;
                    continue;
                }
                if (!buffer_.empty() && buffer_.back() == '\r') {
                    buffer_.pop_back();
                }
                if (!buffer_.empty()) {
                    on_line(std::string_view(buffer_));
                }
                buffer_.clear();
                continue;
            }
            if (discarding_) {
                continue;
            }
            if (buffer_.size() >= kMaxLineLength) {
                // No terminator in sight; drop the line and resync on the next one.
                buffer_.clear();
                discarding_ = true;
                ++overflows_;
                continue;
            }
            buffer_.push_back(c);
        }
    }

    void clear() {
        buffer_.clear();
        discarding_ = false;
    }

    [[nodiscard]] size_t pending_size() const { return buffer_.size(); }
    [[nodiscard]] size_t overflows() const { return overflows_; }

  private:
    std::string buffer_;
    bool discarding_ = false;
    size_t overflows_ = 0;
};

/// "14.074000" -> 14074000. Up to six fractional digits; extra digits are truncated.
/// Values that do not fit in 64 bits of hertz are rejected.
std::optional<uint64_t> parse_mhz(std::string_view text);

/// 14074000 -> "14.074000"
std::string format_mhz(uint64_t frequency_hz);

/// Translate a status message into a partial state update.
/// Returns std::nullopt for objects the bridge does not track.
std::optional<data::StateUpdate> status_to_update(const StatusMessage &status);

} // namespace sdrbridge::protocol
