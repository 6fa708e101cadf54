#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sdrbridge::input {

/// An action the mapping subsystem and the display may bind to.
struct ActionDescriptor {
    std::string id;
    std::string display_name;
    std::string description;
    std::string category;
    std::optional<std::vector<std::string>> value_options;
    std::optional<std::string> default_value;
};

/// Activation modes a physical key binding may declare.
enum class KeyMode {
    Press,
    Release,
    Hold,
    DoubleTap,
    LongPress,
    Toggle,
    Repeat,
    Latch,
    Momentary,
    EncoderCw,
    EncoderCcw,
    EncoderPush,
};

inline constexpr std::array<std::string_view, 12> kKeyModeNames = {
    "press",  "release", "hold",  "double_tap", "long_press", "toggle",
    "repeat", "latch",   "momentary", "encoder_cw", "encoder_ccw", "encoder_push"};

const char *key_mode_name(KeyMode mode);

/// Exact match against kKeyModeNames. Anything else, "default" included, is
/// not a mode.
std::optional<KeyMode> parse_key_mode(std::string_view name);

/// A physical key binding as submitted by the mapping subsystem.
/// `mode` is the raw submitted string; it is validated on registration.
struct KeyDescriptor {
    std::string id;
    std::string description;
    std::optional<std::string> mode;
};

struct RegisteredKey {
    std::string id;
    std::string description;
    std::optional<KeyMode> mode;
};

/// A descriptor failed validation. Carries which descriptor and which field.
class InvalidRegistration : public std::runtime_error {
  public:
    InvalidRegistration(std::string descriptor_id, std::string field, const std::string &reason);

    [[nodiscard]] const std::string &descriptor_id() const { return descriptor_id_; }
    [[nodiscard]] const std::string &field() const { return field_; }

  private:
    std::string descriptor_id_;
    std::string field_;
};

/// Registered actions and keys, keyed by id.
/// Registering an id again replaces the earlier record (last write wins);
/// it never creates a second entry. Thread-safe.
class ActionRegistry {
  public:
    /// Throws InvalidRegistration.
    void register_action(const ActionDescriptor &descriptor);
    void register_key(const KeyDescriptor &descriptor);

    /// Registration boundary for external callers: returns the failure
    /// reason instead of throwing, std::nullopt on success.
    std::optional<std::string> try_register_key(const KeyDescriptor &descriptor);

    [[nodiscard]] std::optional<ActionDescriptor> find_action(std::string_view id) const;
    [[nodiscard]] std::optional<RegisteredKey> find_key(std::string_view id) const;
    [[nodiscard]] bool has_action(std::string_view id) const;

    [[nodiscard]] std::vector<ActionDescriptor> actions() const;
    [[nodiscard]] size_t action_count() const;
    [[nodiscard]] size_t key_count() const;

  private:
    static void validate(const ActionDescriptor &descriptor);
    static RegisteredKey validate(const KeyDescriptor &descriptor);

    mutable std::mutex mu_;
    std::map<std::string, ActionDescriptor, std::less<>> actions_;
    std::map<std::string, RegisteredKey, std::less<>> keys_;
};

} // namespace sdrbridge::input
