#include "sdrbridge/input/input_router.hpp"
#include "sdrbridge/input/actions.hpp"

#include <algorithm>
#include <cstdio>

namespace sdrbridge::input {

InputRouter::InputRouter(const ActionRegistry &registry) : registry_(registry) {}

InputRouter::~InputRouter() { unregister_handlers(); }

bool InputRouter::register_handlers(InputBus &bus) {
    std::lock_guard lock(registration_mu_);
    if (handlers_registered_.exchange(true)) {
        return false;
    }

    bus_ = &bus;
    trigger_listener_ =
        bus.add_trigger_listener([this](const std::string &id) { on_direct_trigger(id); });
    mapped_listener_ = bus.add_mapped_listener(
        [this](const MappedActionEvent &event) { on_mapped_action(event); });
    std::printf("[Input] Handlers registered\n");
    return true;
}

void InputRouter::unregister_handlers() {
    std::lock_guard lock(registration_mu_);
    if (!handlers_registered_.exchange(false)) {
        return;
    }

    bus_->remove_listener(trigger_listener_);
    bus_->remove_listener(mapped_listener_);
    bus_ = nullptr;
    std::printf("[Input] Handlers unregistered\n");
}

void InputRouter::attach(ActionHandler *handler) {
    std::lock_guard lock(handler_mu_);
    handler_ = handler;
}

void InputRouter::detach() {
    std::lock_guard lock(handler_mu_);
    handler_ = nullptr;
}

bool InputRouter::is_request_id(const std::string &id) {
    return id == actions::kGetState || actions::screen_from_navigation_id(id).has_value();
}

void InputRouter::on_direct_trigger(const std::string &id) {
    if (!is_request_id(id) && !registry_.has_action(id)) {
        drop(id, "not a registered action");
        return;
    }
    dispatch({id, std::nullopt, InputSource::DirectTrigger});
}

void InputRouter::on_mapped_action(const MappedActionEvent &event) {
    auto descriptor = registry_.find_action(event.id);
    if (!descriptor) {
        drop(event.id, "not a registered action");
        return;
    }

    ActionEvent resolved{event.id, event.value, InputSource::MappedAction};
    if (!resolved.value) {
        resolved.value = descriptor->default_value;
    }
    if (resolved.value && descriptor->value_options) {
        const auto &options = *descriptor->value_options;
        if (std::find(options.begin(), options.end(), *resolved.value) == options.end()) {
            drop(event.id, "value is not one of the declared options");
            return;
        }
    }
    dispatch(resolved);
}

void InputRouter::dispatch(const ActionEvent &event) {
    std::lock_guard lock(handler_mu_);
    if (handler_ == nullptr) {
        drop(event.id, "bridge is not running");
        return;
    }
    handler_->handle(event);
    dispatched_.fetch_add(1, std::memory_order_relaxed);
}

void InputRouter::drop(const std::string &id, const char *reason) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    std::fprintf(stderr, "[Input] Dropped '%s': %s\n", id.c_str(), reason);
}

} // namespace sdrbridge::input
