#pragma once

#include "sdrbridge/config.hpp"
#include "sdrbridge/data/state_sync.hpp"
#include "sdrbridge/display_server.hpp"
#include "sdrbridge/input/descriptors.hpp"
#include "sdrbridge/input/input_bus.hpp"
#include "sdrbridge/input/input_router.hpp"
#include "sdrbridge/protocol/command_channel.hpp"
#include "sdrbridge/protocol/discovery.hpp"
#include "sdrbridge/protocol/transport.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

namespace sdrbridge {

enum class BridgeState { Stopped, Starting, Running, Stopping };

const char *bridge_state_label(BridgeState state);

/// Owns everything the bridge runs and their start/stop order.
///
/// Registrations and the input router live as long as the Bridge. Everything
/// else (synchronizer, command channel, telemetry stream, timers) belongs to
/// a session created by start() and destroyed by stop(), so a restart begins
/// from fresh sockets, a fresh model and no leftover timers.
class Bridge {
  public:
    Bridge(BridgeConfig config, input::InputBus &inputs, DisplaySurface *display = nullptr,
           protocol::TransportFactory transport_factory = protocol::make_tcp_transport);
    ~Bridge();

    Bridge(const Bridge &) = delete;
    Bridge &operator=(const Bridge &) = delete;

    /// Stopped -> Starting -> Running. Returns false if not Stopped.
    /// A device that cannot be found or reached does not fail the start; the
    /// bridge runs disconnected and the reconnect timer keeps trying.
    /// Throws input::InvalidRegistration if a descriptor is rejected. Any other
    /// exception thrown while starting is rethrown too. Either way whatever the
    /// half-built session acquired is released and the bridge is Stopped.
    bool start();

    /// Running -> Stopping -> Stopped. Releases whatever the session acquired.
    void stop();

    /// stop() then start().
    bool restart();

    [[nodiscard]] BridgeState state() const { return state_.load(std::memory_order_acquire); }

    /// Current device state, or std::nullopt when no session is running.
    [[nodiscard]] std::optional<data::DeviceState> snapshot() const;
    [[nodiscard]] protocol::ChannelState channel_state() const;

    [[nodiscard]] const input::ActionRegistry &registry() const { return registry_; }
    [[nodiscard]] const input::InputRouter &router() const { return router_; }

    /// Outcome of the most recent discovery run. NotFound until one has run.
    [[nodiscard]] protocol::DiscoveryOutcome last_discovery() const {
        return last_discovery_.load(std::memory_order_acquire);
    }

  private:
    struct Session;

    void register_descriptors();
    void start_session(Session &session);
    void abandon_start(std::unique_ptr<Session> session);
    void release_session(Session &session);
    std::optional<protocol::DeviceAddress> resolve_address();
    bool connect_session(Session &session);
    void reconnect_tick(Session &session);

    BridgeConfig config_;
    input::InputBus &inputs_;
    DisplaySurface *display_;
    protocol::TransportFactory transport_factory_;

    input::ActionRegistry registry_;
    input::InputRouter router_;

    mutable std::mutex lifecycle_mu_;
    std::atomic<BridgeState> state_{BridgeState::Stopped};
    std::unique_ptr<Session> session_;
    std::atomic<protocol::DiscoveryOutcome> last_discovery_{protocol::DiscoveryOutcome::NotFound};
};

} // namespace sdrbridge
