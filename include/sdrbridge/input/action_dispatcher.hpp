#pragma once

#include "sdrbridge/data/state_sync.hpp"
#include "sdrbridge/input/input_router.hpp"
#include "sdrbridge/protocol/command_channel.hpp"

#include <optional>
#include <string>

namespace sdrbridge::input {

/// Executes actions against one running session: issues device commands
/// through the CommandSink and folds the expected result into the
/// StateSynchronizer once the command has been written. Purely local actions
/// (tuning step, screen, memory store/clear) touch only the synchronizer.
class ActionDispatcher : public ActionHandler {
  public:
    ActionDispatcher(data::StateSynchronizer &sync, protocol::CommandSink &commands);

    void handle(const ActionEvent &event) override;

  private:
    void tune(int direction);
    void change_step(int direction);
    void set_mode(const std::optional<std::string> &value);
    void toggle_noise_blanker();
    void toggle_noise_reduction();
    void toggle_ptt();
    void recall_memory(const std::optional<std::string> &value);
    void store_memory(const std::optional<std::string> &value);
    void clear_memory(const std::optional<std::string> &value);
    void show_screen(data::Screen screen);

    bool tune_to(uint64_t frequency_hz);
    static std::optional<size_t> slot_index(const std::optional<std::string> &value);

    data::StateSynchronizer &sync_;
    protocol::CommandSink &commands_;
};

} // namespace sdrbridge::input
