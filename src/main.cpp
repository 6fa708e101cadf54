#include "sdrbridge/bridge.hpp"
#include "sdrbridge/config.hpp"
#include "sdrbridge/display_server.hpp"
#include "sdrbridge/input/input_bus.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void on_signal(int /*signum*/) { g_stop_requested = 1; }

} // namespace

int main(int argc, char *argv[]) {
    sdrbridge::CommandLine cli;
    try {
        cli = sdrbridge::parse_command_line(argc, argv);
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[Bridge] %s\n%s", e.what(), sdrbridge::usage());
        return 2;
    }
    if (cli.show_help) {
        std::printf("%s", sdrbridge::usage());
        return 0;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    sdrbridge::input::InputBus inputs;
    sdrbridge::DisplayServer display(inputs, cli.config.display_host, cli.config.display_port);
    if (!display.start()) {
        return 1;
    }

    sdrbridge::Bridge bridge(cli.config, inputs, &display);
    try {
        if (!bridge.start()) {
            display.stop();
            return 1;
        }
    } catch (const sdrbridge::input::InvalidRegistration &) {
        // Already reported with the descriptor and field.
        display.stop();
        return 3;
    }

    while (g_stop_requested == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::printf("[Bridge] Shutting down\n");
    display.stop();
    bridge.stop();
    return 0;
}
