#pragma once

#include "sdrbridge/data/device_state.hpp"
#include "sdrbridge/input/descriptors.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sdrbridge::input::actions {

inline constexpr std::string_view kTuneUp = "vfo.tune_up";
inline constexpr std::string_view kTuneDown = "vfo.tune_down";
inline constexpr std::string_view kStepUp = "vfo.step_up";
inline constexpr std::string_view kStepDown = "vfo.step_down";
inline constexpr std::string_view kMode = "vfo.mode";
inline constexpr std::string_view kNoiseBlanker = "dsp.nb_toggle";
inline constexpr std::string_view kNoiseReduction = "dsp.nr_toggle";
inline constexpr std::string_view kPtt = "tx.ptt_toggle";
inline constexpr std::string_view kMemoryRecall = "memory.recall";
inline constexpr std::string_view kMemoryStore = "memory.store";
inline constexpr std::string_view kMemoryClear = "memory.clear";
inline constexpr std::string_view kScreenShow = "screen.show";

/// Display request that republishes the whole state.
inline constexpr std::string_view kGetState = "getState";

/// Screen navigation ids are "screen.<lowercase screen name>".
inline constexpr std::string_view kScreenPrefix = "screen.";

/// "screen.dsp" -> Screen::DSP. std::nullopt for anything else.
std::optional<data::Screen> screen_from_navigation_id(std::string_view id);
std::string navigation_id(data::Screen screen);

/// The descriptors the bridge registers at start.
std::vector<ActionDescriptor> builtin_actions();

} // namespace sdrbridge::input::actions
