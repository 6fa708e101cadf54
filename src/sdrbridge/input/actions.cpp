#include "sdrbridge/input/actions.hpp"

#include <algorithm>
#include <cctype>

namespace sdrbridge::input::actions {

namespace {

std::string to_lower_ascii(std::string_view input) {
    std::string lowered(input);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::vector<std::string> slot_options() {
    std::vector<std::string> options;
    for (size_t i = 1; i <= data::kMemorySlotCount; ++i) {
        options.push_back(std::to_string(i));
    }
    return options;
}

ActionDescriptor make(std::string_view id, std::string display_name, std::string description,
                      std::string category) {
    ActionDescriptor descriptor;
    descriptor.id = std::string(id);
    descriptor.display_name = std::move(display_name);
    descriptor.description = std::move(description);
    descriptor.category = std::move(category);
    return descriptor;
}

} // namespace

std::optional<data::Screen> screen_from_navigation_id(std::string_view id) {
    if (id.substr(0, kScreenPrefix.size()) != kScreenPrefix) {
        return std::nullopt;
    }
    const std::string_view suffix = id.substr(kScreenPrefix.size());
    for (data::Screen screen : data::kAllScreens) {
        if (suffix == to_lower_ascii(data::screen_name(screen))) {
            return screen;
        }
    }
    return std::nullopt;
}

std::string navigation_id(data::Screen screen) {
    return std::string(kScreenPrefix) + to_lower_ascii(data::screen_name(screen));
}

std::vector<ActionDescriptor> builtin_actions() {
    std::vector<ActionDescriptor> out;

    out.push_back(make(kTuneUp, "Tune Up", "Raise frequency by one tuning step", "VFO"));
    out.push_back(make(kTuneDown, "Tune Down", "Lower frequency by one tuning step", "VFO"));
    out.push_back(make(kStepUp, "Step Up", "Select the next larger tuning step", "VFO"));
    out.push_back(make(kStepDown, "Step Down", "Select the next smaller tuning step", "VFO"));

    auto mode = make(kMode, "Mode", "Set the demodulation mode, or cycle when no value", "VFO");
    mode.value_options.emplace();
    for (data::Mode m : data::kAllModes) {
        mode.value_options->push_back(data::mode_name(m));
    }
    out.push_back(std::move(mode));

    out.push_back(make(kNoiseBlanker, "Noise Blanker", "Toggle the noise blanker", "DSP"));
    out.push_back(make(kNoiseReduction, "Noise Reduction", "Toggle noise reduction", "DSP"));
    out.push_back(make(kPtt, "PTT", "Toggle transmit", "TX"));

    auto recall = make(kMemoryRecall, "Recall Memory", "Tune to a stored memory slot", "Memory");
    recall.value_options = slot_options();
    recall.default_value = "1";
    out.push_back(std::move(recall));

    auto store = make(kMemoryStore, "Store Memory", "Store frequency and mode in a slot", "Memory");
    store.value_options = slot_options();
    store.default_value = "1";
    out.push_back(std::move(store));

    auto clear = make(kMemoryClear, "Clear Memory", "Empty a memory slot", "Memory");
    clear.value_options = slot_options();
    out.push_back(std::move(clear));

    auto screen = make(kScreenShow, "Show Screen", "Switch the display screen", "Display");
    screen.value_options.emplace();
    for (data::Screen s : data::kAllScreens) {
        screen.value_options->push_back(data::screen_name(s));
    }
    screen.default_value = "VFO";
    out.push_back(std::move(screen));

    return out;
}

} // namespace sdrbridge::input::actions
