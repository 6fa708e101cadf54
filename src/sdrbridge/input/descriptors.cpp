#include "sdrbridge/input/descriptors.hpp"

#include <algorithm>

namespace sdrbridge::input {

const char *key_mode_name(KeyMode mode) {
    const auto index = static_cast<size_t>(mode);
    if (index < kKeyModeNames.size()) {
        return kKeyModeNames[index].data();
    }
    return "?";
}

std::optional<KeyMode> parse_key_mode(std::string_view name) {
    for (size_t i = 0; i < kKeyModeNames.size(); ++i) {
        if (kKeyModeNames[i] == name) {
            return static_cast<KeyMode>(i);
        }
    }
    return std::nullopt;
}

InvalidRegistration::InvalidRegistration(std::string descriptor_id, std::string field,
                                         const std::string &reason)
    : std::runtime_error("Invalid registration of '" + descriptor_id + "', field '" + field +
                         "': " + reason),
      descriptor_id_(std::move(descriptor_id)), field_(std::move(field)) {}

void ActionRegistry::validate(const ActionDescriptor &descriptor) {
    if (descriptor.id.empty()) {
        throw InvalidRegistration(descriptor.id, "id", "must not be empty");
    }
    if (descriptor.default_value && descriptor.value_options) {
        const auto &options = *descriptor.value_options;
        if (std::find(options.begin(), options.end(), *descriptor.default_value) ==
            options.end()) {
            throw InvalidRegistration(descriptor.id, "defaultValue",
                                      "'" + *descriptor.default_value +
                                          "' is not one of the value options");
        }
    }
}

RegisteredKey ActionRegistry::validate(const KeyDescriptor &descriptor) {
    if (descriptor.id.empty()) {
        throw InvalidRegistration(descriptor.id, "id", "must not be empty");
    }

    RegisteredKey key{descriptor.id, descriptor.description, std::nullopt};
    if (descriptor.mode) {
        key.mode = parse_key_mode(*descriptor.mode);
        if (!key.mode) {
            std::string allowed;
            for (auto name : kKeyModeNames) {
                if (!allowed.empty()) {
                    allowed += ", ";
                }
                allowed += name;
            }
            throw InvalidRegistration(descriptor.id, "mode",
                                      "'" + *descriptor.mode + "' is not one of: " + allowed);
        }
    }
    return key;
}

void ActionRegistry::register_action(const ActionDescriptor &descriptor) {
    validate(descriptor);
    std::lock_guard lock(mu_);
    actions_[descriptor.id] = descriptor;
}

void ActionRegistry::register_key(const KeyDescriptor &descriptor) {
    RegisteredKey key = validate(descriptor);
    std::lock_guard lock(mu_);
    keys_[key.id] = std::move(key);
}

std::optional<std::string> ActionRegistry::try_register_key(const KeyDescriptor &descriptor) {
    try {
        register_key(descriptor);
    } catch (const InvalidRegistration &e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

std::optional<ActionDescriptor> ActionRegistry::find_action(std::string_view id) const {
    std::lock_guard lock(mu_);
    auto it = actions_.find(id);
    if (it == actions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<RegisteredKey> ActionRegistry::find_key(std::string_view id) const {
    std::lock_guard lock(mu_);
    auto it = keys_.find(id);
    if (it == keys_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ActionRegistry::has_action(std::string_view id) const {
    std::lock_guard lock(mu_);
    return actions_.find(id) != actions_.end();
}

std::vector<ActionDescriptor> ActionRegistry::actions() const {
    std::lock_guard lock(mu_);
    std::vector<ActionDescriptor> out;
    out.reserve(actions_.size());
    for (const auto &entry : actions_) {
        out.push_back(entry.second);
    }
    return out;
}

size_t ActionRegistry::action_count() const {
    std::lock_guard lock(mu_);
    return actions_.size();
}

size_t ActionRegistry::key_count() const {
    std::lock_guard lock(mu_);
    return keys_.size();
}

} // namespace sdrbridge::input
