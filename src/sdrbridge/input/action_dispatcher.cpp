#include "sdrbridge/input/action_dispatcher.hpp"
#include "sdrbridge/input/actions.hpp"
#include "sdrbridge/protocol/wire.hpp"

#include <charconv>
#include <cstdio>

namespace sdrbridge::input {

ActionDispatcher::ActionDispatcher(data::StateSynchronizer &sync, protocol::CommandSink &commands)
    : sync_(sync), commands_(commands) {}

void ActionDispatcher::handle(const ActionEvent &event) {
    const std::string &id = event.id;

    if (id == actions::kGetState) {
        sync_.publish_full();
    } else if (auto screen = actions::screen_from_navigation_id(id)) {
        show_screen(*screen);
    } else if (id == actions::kTuneUp) {
        tune(+1);
    } else if (id == actions::kTuneDown) {
        tune(-1);
    } else if (id == actions::kStepUp) {
        change_step(+1);
    } else if (id == actions::kStepDown) {
        change_step(-1);
    } else if (id == actions::kMode) {
        set_mode(event.value);
    } else if (id == actions::kNoiseBlanker) {
        toggle_noise_blanker();
    } else if (id == actions::kNoiseReduction) {
        toggle_noise_reduction();
    } else if (id == actions::kPtt) {
        toggle_ptt();
    } else if (id == actions::kMemoryRecall) {
        recall_memory(event.value);
    } else if (id == actions::kMemoryStore) {
        store_memory(event.value);
    } else if (id == actions::kMemoryClear) {
        clear_memory(event.value);
    } else if (id == actions::kScreenShow) {
        auto target = event.value ? data::parse_screen(*event.value) : std::nullopt;
        if (!target) {
            std::fprintf(stderr, "[Input] %s needs a screen name\n", id.c_str());
            return;
        }
        show_screen(*target);
    } else {
        // Registered by someone else; nothing on this side acts on it.
        std::printf("[Input] No handler for '%s'\n", id.c_str());
    }
}

bool ActionDispatcher::tune_to(uint64_t frequency_hz) {
    if (!data::frequency_in_band(frequency_hz)) {
        std::fprintf(stderr, "[Input] %llu Hz is outside the device bands\n",
                     static_cast<unsigned long long>(frequency_hz));
        return false;
    }
    if (!commands_.send("slice", "tune 0 " + protocol::format_mhz(frequency_hz))) {
        return false;
    }

    data::StateUpdate update;
    update.frequency_hz = frequency_hz;
    sync_.apply(update);
    return true;
}

void ActionDispatcher::tune(int direction) {
    const data::DeviceState state = sync_.snapshot();
    const uint64_t step = state.tuning_step_hz();

    if (direction < 0 && state.frequency_hz < step) {
        std::fprintf(stderr, "[Input] Cannot tune below 0 Hz\n");
        return;
    }
    tune_to(direction > 0 ? state.frequency_hz + step : state.frequency_hz - step);
}

void ActionDispatcher::change_step(int direction) {
    const size_t index = sync_.snapshot().tuning_step_index;
    if (direction < 0 && index == 0) {
        return;
    }
    if (direction > 0 && index + 1 >= data::kTuningSteps.size()) {
        return;
    }

    data::StateUpdate update;
    update.tuning_step_index = direction > 0 ? index + 1 : index - 1;
    sync_.apply(update);
}

void ActionDispatcher::set_mode(const std::optional<std::string> &value) {
    data::Mode mode;
    if (value) {
        auto parsed = data::parse_mode(*value);
        if (!parsed) {
            std::fprintf(stderr, "[Input] Unknown mode '%s'\n", value->c_str());
            return;
        }
        mode = *parsed;
    } else {
        mode = data::next_mode(sync_.snapshot().mode);
    }

    if (!commands_.send("slice", std::string("set 0 mode=") + data::mode_name(mode))) {
        return;
    }
    data::StateUpdate update;
    update.mode = mode;
    sync_.apply(update);
}

void ActionDispatcher::toggle_noise_blanker() {
    const bool enable = !sync_.snapshot().nb_enabled;
    if (!commands_.send("slice", enable ? "set 0 nb=1" : "set 0 nb=0")) {
        return;
    }
    data::StateUpdate update;
    update.nb_enabled = enable;
    sync_.apply(update);
}

void ActionDispatcher::toggle_noise_reduction() {
    const bool enable = !sync_.snapshot().nr_enabled;
    if (!commands_.send("slice", enable ? "set 0 nr=1" : "set 0 nr=0")) {
        return;
    }
    data::StateUpdate update;
    update.nr_enabled = enable;
    sync_.apply(update);
}

void ActionDispatcher::toggle_ptt() {
    const bool transmit = !sync_.snapshot().tx_active;
    if (!commands_.send("xmit", transmit ? "1" : "0")) {
        return;
    }
    data::StateUpdate update;
    update.tx_active = transmit;
    sync_.apply(update);
}

std::optional<size_t> ActionDispatcher::slot_index(const std::optional<std::string> &value) {
    if (!value) {
        return std::nullopt;
    }
    size_t slot = 0;
    const char *end = value->data() + value->size();
    auto [ptr, ec] = std::from_chars(value->data(), end, slot);
    if (ec != std::errc{} || ptr != end || slot < 1 || slot > data::kMemorySlotCount) {
        return std::nullopt;
    }
    return slot - 1;
}

void ActionDispatcher::recall_memory(const std::optional<std::string> &value) {
    auto index = slot_index(value);
    if (!index) {
        std::fprintf(stderr, "[Input] memory.recall needs a slot 1-%zu\n", data::kMemorySlotCount);
        return;
    }
    const auto slot = sync_.snapshot().memory_slots[*index];
    if (!slot) {
        std::printf("[Input] Memory slot %zu is empty\n", *index + 1);
        return;
    }

    if (!tune_to(slot->frequency_hz)) {
        return;
    }
    if (!commands_.send("slice", std::string("set 0 mode=") + data::mode_name(slot->mode))) {
        return;
    }
    data::StateUpdate update;
    update.mode = slot->mode;
    sync_.apply(update);
}

void ActionDispatcher::store_memory(const std::optional<std::string> &value) {
    auto index = slot_index(value);
    if (!index) {
        std::fprintf(stderr, "[Input] memory.store needs a slot 1-%zu\n", data::kMemorySlotCount);
        return;
    }
    const data::DeviceState state = sync_.snapshot();

    data::StateUpdate update;
    update.memory_slots.push_back({*index, data::MemorySlot{state.frequency_hz, state.mode}});
    sync_.apply(update);
}

void ActionDispatcher::clear_memory(const std::optional<std::string> &value) {
    auto index = slot_index(value);
    if (!index) {
        std::fprintf(stderr, "[Input] memory.clear needs a slot 1-%zu\n", data::kMemorySlotCount);
        return;
    }

    data::StateUpdate update;
    update.memory_slots.push_back({*index, std::nullopt});
    sync_.apply(update);
}

void ActionDispatcher::show_screen(data::Screen screen) {
    data::StateUpdate update;
    update.active_screen = screen;
    sync_.apply(update);
}

} // namespace sdrbridge::input
