#pragma once

#include "sdrbridge/input/descriptors.hpp"
#include "sdrbridge/input/input_bus.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace sdrbridge::input {

enum class InputSource { DirectTrigger, MappedAction };

/// A resolved input, whichever class it came from.
struct ActionEvent {
    std::string id;
    std::optional<std::string> value;
    InputSource source = InputSource::DirectTrigger;
};

/// Executes resolved actions. Implemented by the per-session dispatcher.
class ActionHandler {
  public:
    virtual ~ActionHandler() = default;
    virtual void handle(const ActionEvent &event) = 0;
};

/// Routes direct triggers and mapped action events into one dispatch path.
///
/// register_handlers() attaches one listener per input class to the bus the
/// first time it is called and is a no-op afterwards, so restarting the bridge
/// never stacks a second listener. The handler that executes actions is
/// attached per session; events arriving while none is attached are dropped.
/// Destroying the router removes its listeners from the bus.
class InputRouter {
  public:
    explicit InputRouter(const ActionRegistry &registry);
    ~InputRouter();

    InputRouter(const InputRouter &) = delete;
    InputRouter &operator=(const InputRouter &) = delete;

    /// Returns true if listeners were added by this call.
    bool register_handlers(InputBus &bus);
    /// Removes the listeners added by register_handlers(); the next
    /// register_handlers() call adds them again.
    void unregister_handlers();
    [[nodiscard]] bool handlers_registered() const { return handlers_registered_.load(); }

    /// detach() waits for an in-flight dispatch to finish.
    void attach(ActionHandler *handler);
    void detach();

    /// Ingress adapters, one per input class.
    void on_direct_trigger(const std::string &id);
    void on_mapped_action(const MappedActionEvent &event);

    [[nodiscard]] uint64_t dispatched_count() const { return dispatched_.load(); }
    [[nodiscard]] uint64_t dropped_count() const { return dropped_.load(); }

    /// Ids accepted as direct triggers without a registered descriptor.
    static bool is_request_id(const std::string &id);

  private:
    void dispatch(const ActionEvent &event);
    void drop(const std::string &id, const char *reason);

    const ActionRegistry &registry_;
    std::atomic<bool> handlers_registered_{false};
    std::mutex registration_mu_;
    InputBus *bus_ = nullptr;
    InputBus::ListenerId trigger_listener_ = 0;
    InputBus::ListenerId mapped_listener_ = 0;

    std::mutex handler_mu_;
    ActionHandler *handler_ = nullptr;

    std::atomic<uint64_t> dispatched_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace sdrbridge::input
