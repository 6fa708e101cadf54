#pragma once

#include "sdrbridge/data/device_state.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace sdrbridge::data {

struct MemorySlotUpdate {
    size_t index = 0; // 0-based
    std::optional<MemorySlot> slot;
};

/// Partial update. Unset fields are left untouched.
struct StateUpdate {
    std::optional<bool> connected;
    std::optional<uint64_t> frequency_hz;
    std::optional<Mode> mode;
    std::optional<size_t> tuning_step_index;
    std::optional<bool> tx_active;
    std::optional<bool> nb_enabled;
    std::optional<bool> nr_enabled;
    std::optional<float> s_meter_dbm;
    std::optional<float> power_meter_watts;
    std::optional<float> swr_ratio;
    std::vector<MemorySlotUpdate> memory_slots;
    std::optional<Screen> active_screen;
};

/// Which groups of fields changed in an apply() or since the last flush.
struct StateChange {
    bool connection = false;
    bool frequency = false;
    bool mode = false;
    bool tuning_step = false;
    bool toggles = false; // tx / nb / nr
    bool meters = false;
    bool memory = false;
    bool screen = false;

    /// Fields pushed as soon as they change.
    [[nodiscard]] bool discrete() const {
        return connection || mode || tuning_step || toggles || memory || screen;
    }
    /// Fields coalesced onto the periodic push tick.
    [[nodiscard]] bool continuous() const { return frequency || meters; }
    [[nodiscard]] bool any() const { return discrete() || continuous(); }

    void merge(const StateChange &other);
    static StateChange all();
};

enum class PushReason {
    Immediate, // discrete change
    Periodic,  // flush() of coalesced continuous changes
    Full,      // explicit request for the whole state
};

/// Single owner of the canonical DeviceState.
///
/// Every mutation goes through apply(), which validates the update, folds it
/// into the model and decides whether subscribers hear about it now (discrete
/// fields) or on the next flush() tick (frequency and meters).
///
/// Thread safety: apply(), flush(), publish_full() and snapshot() may be called
/// from any thread. Subscribers run on the calling thread with the notify lock
/// held, in apply order; they must not call back into apply() or subscribe().
class StateSynchronizer {
  public:
    using Subscriber =
        std::function<void(const DeviceState &state, const StateChange &change, PushReason reason)>;

    StateSynchronizer() = default;
    explicit StateSynchronizer(const DeviceState &initial);

    StateSynchronizer(const StateSynchronizer &) = delete;
    StateSynchronizer &operator=(const StateSynchronizer &) = delete;

    /// Returns the set of fields that actually changed. Invalid fields
    /// (out-of-band frequency, bad step or slot index) are logged and dropped;
    /// the rest of the update still applies.
    StateChange apply(const StateUpdate &update);

    [[nodiscard]] DeviceState snapshot() const;

    size_t subscribe(Subscriber subscriber);
    void unsubscribe(size_t id);

    /// Push coalesced continuous changes, if any. Called by the push timer.
    /// Returns true if subscribers were notified.
    bool flush();

    /// Push the whole state regardless of what changed.
    void publish_full();

    [[nodiscard]] uint64_t rejected_count() const {
        return rejected_.load(std::memory_order_relaxed);
    }

  private:
    StateChange merge_locked(const StateUpdate &update);
    void notify(const DeviceState &state, const StateChange &change, PushReason reason);

    mutable std::mutex state_mu_;
    DeviceState state_;
    StateChange pending_;

    // Serializes apply/flush/publish so pushes leave in the order states were produced.
    std::mutex notify_mu_;
    std::vector<std::pair<size_t, Subscriber>> subscribers_;
    size_t next_subscriber_id_ = 1;

    std::atomic<uint64_t> rejected_{0};
};

} // namespace sdrbridge::data
