#include "sdrbridge/protocol/display.hpp"

#include <stdexcept>

namespace sdrbridge::protocol {

nlohmann::json state_to_json(const data::DeviceState &state) {
    nlohmann::json slots = nlohmann::json::array();
    for (const auto &slot : state.memory_slots) {
        if (slot) {
            slots.push_back(
                {{"frequencyHz", slot->frequency_hz}, {"mode", data::mode_name(slot->mode)}});
        } else {
            slots.push_back(nullptr);
        }
    }

    return {
        {"connected", state.connected},
        {"frequencyHz", state.frequency_hz},
        {"mode", data::mode_name(state.mode)},
        {"tuningStepHz", state.tuning_step_hz()},
        {"tuningStepIndex", state.tuning_step_index},
        {"txActive", state.tx_active},
        {"nbEnabled", state.nb_enabled},
        {"nrEnabled", state.nr_enabled},
        {"sMeterDbm", state.s_meter_dbm},
        {"powerMeterWatts", state.power_meter_watts},
        {"swrRatio", state.swr_ratio},
        {"memorySlots", slots},
        {"activeScreen", data::screen_name(state.active_screen)},
    };
}

nlohmann::json make_push(std::string_view type, nlohmann::json payload) {
    nlohmann::json msg;
    msg["type"] = std::string(type);
    msg["payload"] = std::move(payload);
    return msg;
}

nlohmann::json app_state_message(const data::DeviceState &state) {
    return make_push(kAppState, state_to_json(state));
}

nlohmann::json screen_change_message(data::Screen screen) {
    return make_push(kScreenChange, {{"screen", data::screen_name(screen)}});
}

nlohmann::json meter_update_message(const data::DeviceState &state) {
    return make_push(kMeterUpdate, {{"sMeterDbm", state.s_meter_dbm},
                                    {"powerMeterWatts", state.power_meter_watts},
                                    {"swrRatio", state.swr_ratio}});
}

nlohmann::json memory_list_message(const data::DeviceState &state) {
    nlohmann::json items = nlohmann::json::array();
    for (size_t i = 0; i < state.memory_slots.size(); ++i) {
        const auto &slot = state.memory_slots[i];
        nlohmann::json item = {{"slot", i + 1}, {"empty", !slot.has_value()}};
        if (slot) {
            item["frequencyHz"] = slot->frequency_hz;
            item["mode"] = data::mode_name(slot->mode);
        }
        items.push_back(std::move(item));
    }
    return make_push(kDataList, {{"list", "memory"}, {"items", items}});
}

std::vector<nlohmann::json> messages_for_push(const data::DeviceState &state,
                                              const data::StateChange &change,
                                              data::PushReason reason) {
    std::vector<nlohmann::json> out;

    switch (reason) {
    case data::PushReason::Full:
        out.push_back(app_state_message(state));
        out.push_back(memory_list_message(state));
        break;

    case data::PushReason::Immediate:
        if (change.screen) {
            out.push_back(screen_change_message(state.active_screen));
        }
        out.push_back(app_state_message(state));
        if (change.memory) {
            out.push_back(memory_list_message(state));
        }
        break;

    case data::PushReason::Periodic:
        if (change.frequency) {
            out.push_back(app_state_message(state));
        }
        if (change.meters) {
            out.push_back(meter_update_message(state));
        }
        break;
    }
    return out;
}

DisplayRequest parse_display_request(const nlohmann::json &msg) {
    if (!msg.is_object()) {
        throw std::runtime_error("Display request must be an object");
    }
    if (!msg.contains("type") || !msg["type"].is_string()) {
        throw std::runtime_error("Display request missing 'type'");
    }

    DisplayRequest request;
    request.type = msg["type"].get<std::string>();
    if (request.type.empty()) {
        throw std::runtime_error("Display request has empty 'type'");
    }
    if (msg.contains("payload")) {
        request.payload = msg["payload"];
    }
    return request;
}

} // namespace sdrbridge::protocol
