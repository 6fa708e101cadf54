#pragma once

#include "sdrbridge/data/device_state.hpp"
#include "sdrbridge/data/state_sync.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace sdrbridge::protocol {

/// Push message types sent to the display surface.
inline constexpr std::string_view kAppState = "appState";
inline constexpr std::string_view kScreenChange = "screenChange";
inline constexpr std::string_view kMeterUpdate = "meterUpdate";
inline constexpr std::string_view kDataList = "dataList";

/// Inbound request types that are not action ids.
inline constexpr std::string_view kGetState = "getState";
inline constexpr std::string_view kMappedAction = "mappedAction";

/// Full DeviceState as JSON (camelCase keys).
nlohmann::json state_to_json(const data::DeviceState &state);

/// {"type": type, "payload": payload}
nlohmann::json make_push(std::string_view type, nlohmann::json payload);

nlohmann::json app_state_message(const data::DeviceState &state);
nlohmann::json screen_change_message(data::Screen screen);
nlohmann::json meter_update_message(const data::DeviceState &state);
nlohmann::json memory_list_message(const data::DeviceState &state);

/// Messages the display should receive for one synchronizer push.
std::vector<nlohmann::json> messages_for_push(const data::DeviceState &state,
                                              const data::StateChange &change,
                                              data::PushReason reason);

struct DisplayRequest {
    std::string type;
    nlohmann::json payload; // null when absent
};

/// Parse an inbound display request.
/// Expects: {"type": "...", "payload": {...}?}
/// Throws std::runtime_error on a malformed request.
DisplayRequest parse_display_request(const nlohmann::json &msg);

} // namespace sdrbridge::protocol
