#include "sdrbridge/input/input_bus.hpp"

#include <algorithm>

namespace sdrbridge::input {

InputBus::ListenerId InputBus::add_trigger_listener(TriggerListener listener) {
    std::lock_guard lock(mu_);
    const ListenerId id = next_id_++;
    trigger_listeners_.emplace_back(id, std::move(listener));
    return id;
}

InputBus::ListenerId InputBus::add_mapped_listener(MappedListener listener) {
    std::lock_guard lock(mu_);
    const ListenerId id = next_id_++;
    mapped_listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool InputBus::remove_listener(ListenerId id) {
    bool removed = false;
    {
        std::lock_guard lock(mu_);
        auto matches = [id](const auto &entry) { return entry.first == id; };
        auto trigger_end =
            std::remove_if(trigger_listeners_.begin(), trigger_listeners_.end(), matches);
        auto mapped_end =
            std::remove_if(mapped_listeners_.begin(), mapped_listeners_.end(), matches);
        removed = trigger_end != trigger_listeners_.end() || mapped_end != mapped_listeners_.end();
        trigger_listeners_.erase(trigger_end, trigger_listeners_.end());
        mapped_listeners_.erase(mapped_end, mapped_listeners_.end());
    }
    // Wait out any emit that copied the list before the erase.
    std::unique_lock drain(emit_mu_);
    return removed;
}

void InputBus::emit_trigger(const std::string &id) {
    std::shared_lock emitting(emit_mu_);
    std::vector<std::pair<ListenerId, TriggerListener>> listeners;
    {
        std::lock_guard lock(mu_);
        listeners = trigger_listeners_;
    }
    for (auto &[listener_id, listener] : listeners) {
        listener(id);
    }
}

void InputBus::emit_mapped(const MappedActionEvent &event) {
    std::shared_lock emitting(emit_mu_);
    std::vector<std::pair<ListenerId, MappedListener>> listeners;
    {
        std::lock_guard lock(mu_);
        listeners = mapped_listeners_;
    }
    for (auto &[listener_id, listener] : listeners) {
        listener(event);
    }
}

size_t InputBus::trigger_listener_count() const {
    std::lock_guard lock(mu_);
    return trigger_listeners_.size();
}

size_t InputBus::mapped_listener_count() const {
    std::lock_guard lock(mu_);
    return mapped_listeners_.size();
}

} // namespace sdrbridge::input
