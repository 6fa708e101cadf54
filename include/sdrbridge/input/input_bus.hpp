#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace sdrbridge::input {

/// Envelope delivered by the external mapping subsystem.
struct MappedActionEvent {
    std::string id;
    std::optional<std::string> value;
};

/// Process-lifetime event source for both input classes.
///
/// The display server emits direct triggers (bare ids from on-screen
/// controls) and mapped action envelopes into it. Every listener added is
/// called for every event; adding the same handler twice makes it fire twice.
/// A listener stays registered until remove_listener() is called with the id
/// returned when it was added.
class InputBus {
  public:
    using ListenerId = uint64_t;
    using TriggerListener = std::function<void(const std::string &id)>;
    using MappedListener = std::function<void(const MappedActionEvent &event)>;

    ListenerId add_trigger_listener(TriggerListener listener);
    ListenerId add_mapped_listener(MappedListener listener);

    /// Blocks until no emit is calling listeners, so the removed listener is
    /// never invoked after this returns. Must not be called from a listener.
    /// Returns false for an unknown id.
    bool remove_listener(ListenerId id);

    void emit_trigger(const std::string &id);
    void emit_mapped(const MappedActionEvent &event);

    [[nodiscard]] size_t trigger_listener_count() const;
    [[nodiscard]] size_t mapped_listener_count() const;

  private:
    mutable std::mutex mu_;
    std::shared_mutex emit_mu_;
    ListenerId next_id_ = 1;
    std::vector<std::pair<ListenerId, TriggerListener>> trigger_listeners_;
    std::vector<std::pair<ListenerId, MappedListener>> mapped_listeners_;
};

} // namespace sdrbridge::input
