#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sdrbridge::data {

enum class Mode { USB, LSB, CW, AM, FM, DIGU, DIGL, SAM, NFM, RTTY };

enum class Screen { VFO, DSP, MEMORY, TX, POTA };

inline constexpr std::array<Mode, 10> kAllModes = {Mode::USB,  Mode::LSB,  Mode::CW,  Mode::AM,
                                                   Mode::FM,   Mode::DIGU, Mode::DIGL, Mode::SAM,
                                                   Mode::NFM, Mode::RTTY};

inline constexpr std::array<Screen, 5> kAllScreens = {Screen::VFO, Screen::DSP, Screen::MEMORY,
                                                      Screen::TX, Screen::POTA};

/// Ordered tuning step table. DeviceState stores only the index into it,
/// so the step value can never disagree with the index.
inline constexpr std::array<uint32_t, 5> kTuningSteps = {1, 10, 100, 1'000, 10'000};

inline constexpr size_t kMemorySlotCount = 8;

/// Inclusive frequency range the device accepts.
struct BandRange {
    uint64_t min_hz;
    uint64_t max_hz;
};

inline constexpr std::array<BandRange, 1> kDeviceBands = {{{30'000, 54'000'000}}};

[[nodiscard]] bool frequency_in_band(uint64_t frequency_hz);

const char *mode_name(Mode mode);
const char *screen_name(Screen screen);

/// Case-sensitive lookup of the wire/display names ("USB", "DSP", ...).
std::optional<Mode> parse_mode(std::string_view name);
std::optional<Screen> parse_screen(std::string_view name);

/// Next mode in kAllModes order, wrapping at the end.
Mode next_mode(Mode mode);

struct MemorySlot {
    uint64_t frequency_hz = 0;
    Mode mode = Mode::USB;

    bool operator==(const MemorySlot &) const = default;
};

/// Canonical device model. Owned by StateSynchronizer; everyone else sees copies.
struct DeviceState {
    bool connected = false;
    uint64_t frequency_hz = 14'074'000;
    Mode mode = Mode::USB;
    size_t tuning_step_index = 2;
    bool tx_active = false;
    bool nb_enabled = false;
    bool nr_enabled = false;
    float s_meter_dbm = -127.0f;
    float power_meter_watts = 0.0f;
    float swr_ratio = 1.0f;
    std::array<std::optional<MemorySlot>, kMemorySlotCount> memory_slots{};
    Screen active_screen = Screen::VFO;

    [[nodiscard]] uint32_t tuning_step_hz() const { return kTuningSteps[tuning_step_index]; }

    bool operator==(const DeviceState &) const = default;
};

} // namespace sdrbridge::data
