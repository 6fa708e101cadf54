#include "sdrbridge/data/state_sync.hpp"

#include <algorithm>
#include <cstdio>

namespace sdrbridge::data {

void StateChange::merge(const StateChange &other) {
    connection = connection || other.connection;
    frequency = frequency || other.frequency;
    mode = mode || other.mode;
    tuning_step = tuning_step || other.tuning_step;
    toggles = toggles || other.toggles;
    meters = meters || other.meters;
    memory = memory || other.memory;
    screen = screen || other.screen;
}

StateChange StateChange::all() {
    StateChange change;
    change.connection = true;
    change.frequency = true;
    change.mode = true;
    change.tuning_step = true;
    change.toggles = true;
    change.meters = true;
    change.memory = true;
    change.screen = true;
    return change;
}

StateSynchronizer::StateSynchronizer(const DeviceState &initial) : state_(initial) {}

StateChange StateSynchronizer::apply(const StateUpdate &update) {
    std::lock_guard notify_lock(notify_mu_);

    StateChange change;
    DeviceState copy;
    bool push_now = false;
    {
        std::lock_guard lock(state_mu_);
        change = merge_locked(update);
        if (change.discrete()) {
            // Anything coalesced so far rides along with the immediate push.
            change.merge(pending_);
            pending_ = StateChange{};
            push_now = true;
            copy = state_;
        } else if (change.continuous()) {
            pending_.merge(change);
        }
    }

    if (push_now) {
        notify(copy, change, PushReason::Immediate);
    }
    return change;
}

StateChange StateSynchronizer::merge_locked(const StateUpdate &update) {
    StateChange change;

    if (update.connected && *update.connected != state_.connected) {
        state_.connected = *update.connected;
        change.connection = true;
    }

    if (update.frequency_hz) {
        if (!frequency_in_band(*update.frequency_hz)) {
            std::fprintf(stderr, "[State] Rejected frequency %llu Hz: outside device bands\n",
                         static_cast<unsigned long long>(*update.frequency_hz));
            rejected_.fetch_add(1, std::memory_order_relaxed);
        } else if (*update.frequency_hz != state_.frequency_hz) {
            state_.frequency_hz = *update.frequency_hz;
            change.frequency = true;
        }
    }

    if (update.mode && *update.mode != state_.mode) {
        state_.mode = *update.mode;
        change.mode = true;
    }

    if (update.tuning_step_index) {
        if (*update.tuning_step_index >= kTuningSteps.size()) {
            std::fprintf(stderr, "[State] Rejected tuning step index %zu\n",
                         *update.tuning_step_index);
            rejected_.fetch_add(1, std::memory_order_relaxed);
        } else if (*update.tuning_step_index != state_.tuning_step_index) {
            state_.tuning_step_index = *update.tuning_step_index;
            change.tuning_step = true;
        }
    }

    auto set_toggle = [&change](bool &field, const std::optional<bool> &value) {
        if (value && *value != field) {
            field = *value;
            change.toggles = true;
        }
    };
    set_toggle(state_.tx_active, update.tx_active);
    set_toggle(state_.nb_enabled, update.nb_enabled);
    set_toggle(state_.nr_enabled, update.nr_enabled);

    auto set_meter = [&change](float &field, const std::optional<float> &value) {
        if (value && *value != field) {
            field = *value;
            change.meters = true;
        }
    };
    set_meter(state_.s_meter_dbm, update.s_meter_dbm);
    set_meter(state_.power_meter_watts, update.power_meter_watts);
    set_meter(state_.swr_ratio, update.swr_ratio);

    for (const auto &slot_update : update.memory_slots) {
        if (slot_update.index >= kMemorySlotCount) {
            std::fprintf(stderr, "[State] Rejected memory slot index %zu\n", slot_update.index);
            rejected_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        if (slot_update.slot && !frequency_in_band(slot_update.slot->frequency_hz)) {
            std::fprintf(stderr, "[State] Rejected memory slot %zu: %llu Hz outside device bands\n",
                         slot_update.index + 1,
                         static_cast<unsigned long long>(slot_update.slot->frequency_hz));
            rejected_.fetch_add(1, std::memory_order_relaxed);
            continue;
        }
        auto &slot = state_.memory_slots[slot_update.index];
        if (slot != slot_update.slot) {
            slot = slot_update.slot;
            change.memory = true;
        }
    }

    if (update.active_screen && *update.active_screen != state_.active_screen) {
        state_.active_screen = *update.active_screen;
        change.screen = true;
    }

    return change;
}

DeviceState StateSynchronizer::snapshot() const {
    std::lock_guard lock(state_mu_);
    return state_;
}

size_t StateSynchronizer::subscribe(Subscriber subscriber) {
    std::lock_guard lock(notify_mu_);
    const size_t id = next_subscriber_id_++;
    subscribers_.emplace_back(id, std::move(subscriber));
    return id;
}

void StateSynchronizer::unsubscribe(size_t id) {
    std::lock_guard lock(notify_mu_);
    subscribers_.erase(std::remove_if(subscribers_.begin(), subscribers_.end(),
                                      [id](const auto &entry) { return entry.first == id; }),
                       subscribers_.end());
}

bool StateSynchronizer::flush() {
    std::lock_guard notify_lock(notify_mu_);

    StateChange change;
    DeviceState copy;
    {
        std::lock_guard lock(state_mu_);
        if (!pending_.any()) {
            return false;
        }
        change = pending_;
        pending_ = StateChange{};
        copy = state_;
    }

    notify(copy, change, PushReason::Periodic);
    return true;
}

void StateSynchronizer::publish_full() {
    std::lock_guard notify_lock(notify_mu_);

    DeviceState copy;
    {
        std::lock_guard lock(state_mu_);
        pending_ = StateChange{};
        copy = state_;
    }

    notify(copy, StateChange::all(), PushReason::Full);
}

void StateSynchronizer::notify(const DeviceState &state, const StateChange &change,
                               PushReason reason) {
    for (auto &entry : subscribers_) {
        entry.second(state, change, reason);
    }
}

} // namespace sdrbridge::data
