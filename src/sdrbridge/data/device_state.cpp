#include "sdrbridge/data/device_state.hpp"

namespace sdrbridge::data {

bool frequency_in_band(uint64_t frequency_hz) {
    for (const auto &band : kDeviceBands) {
        if (frequency_hz >= band.min_hz && frequency_hz <= band.max_hz) {
            return true;
        }
    }
    return false;
}

const char *mode_name(Mode mode) {
    switch (mode) {
    case Mode::USB:
        return "USB";
    case Mode::LSB:
        return "LSB";
    case Mode::CW:
        return "CW";
    case Mode::AM:
        return "AM";
    case Mode::FM:
        return "FM";
    case Mode::DIGU:
        return "DIGU";
    case Mode::DIGL:
        return "DIGL";
    case Mode::SAM:
        return "SAM";
    case Mode::NFM:
        return "NFM";
    case Mode::RTTY:
        return "RTTY";
    }
    return "?";
}

const char *screen_name(Screen screen) {
    switch (screen) {
    case Screen::VFO:
        return "VFO";
    case Screen::DSP:
        return "DSP";
    case Screen::MEMORY:
        return "MEMORY";
    case Screen::TX:
        return "TX";
    case Screen::POTA:
        return "POTA";
    }
    return "?";
}

std::optional<Mode> parse_mode(std::string_view name) {
    for (Mode mode : kAllModes) {
        if (name == mode_name(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

std::optional<Screen> parse_screen(std::string_view name) {
    for (Screen screen : kAllScreens) {
        if (name == screen_name(screen)) {
            return screen;
        }
    }
    return std::nullopt;
}

Mode next_mode(Mode mode) {
    for (size_t i = 0; i < kAllModes.size(); ++i) {
        if (kAllModes[i] == mode) {
            return kAllModes[(i + 1) % kAllModes.size()];
        }
    }
    return kAllModes.front();
}

} // namespace sdrbridge::data
