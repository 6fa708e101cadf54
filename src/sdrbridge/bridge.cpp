#include "sdrbridge/bridge.hpp"
#include "sdrbridge/data/periodic_timer.hpp"
#include "sdrbridge/input/action_dispatcher.hpp"
#include "sdrbridge/input/actions.hpp"
#include "sdrbridge/protocol/discovery.hpp"
#include "sdrbridge/protocol/display.hpp"
#include "sdrbridge/protocol/telemetry_stream.hpp"

#include <cstdio>
#include <exception>
#include <memory>

namespace sdrbridge {

const char *bridge_state_label(BridgeState state) {
    switch (state) {
    case BridgeState::Starting:
        return "Starting";
    case BridgeState::Running:
        return "Running";
    case BridgeState::Stopping:
        return "Stopping";
    case BridgeState::Stopped:
    default:
        return "Stopped";
    }
}

struct Bridge::Session {
    Session(const BridgeConfig &config, protocol::TransportFactory transport_factory)
        : channel(sync, std::move(transport_factory)), telemetry(sync, config.telemetry),
          dispatcher(sync, channel) {}

    data::StateSynchronizer sync;
    protocol::CommandChannel channel;
    protocol::TelemetryStream telemetry;
    input::ActionDispatcher dispatcher;
    data::PeriodicTimer push_timer;
    data::PeriodicTimer reconnect_timer;
    std::optional<protocol::DeviceAddress> address;
    std::optional<size_t> display_subscription;
};

Bridge::Bridge(BridgeConfig config, input::InputBus &inputs, DisplaySurface *display,
               protocol::TransportFactory transport_factory)
    : config_(std::move(config)), inputs_(inputs), display_(display),
      transport_factory_(std::move(transport_factory)), router_(registry_) {}

Bridge::~Bridge() { stop(); }

bool Bridge::start() {
    std::lock_guard lock(lifecycle_mu_);

    if (state() != BridgeState::Stopped) {
        std::fprintf(stderr, "[Bridge] start() ignored: bridge is %s\n",
                     bridge_state_label(state()));
        return false;
    }
    state_.store(BridgeState::Starting, std::memory_order_release);
    std::printf("[Bridge] Starting\n");

    std::unique_ptr<Session> session;
    try {
        register_descriptors();
        router_.register_handlers(inputs_);
        session = std::make_unique<Session>(config_, transport_factory_);
        start_session(*session);
    } catch (const input::InvalidRegistration &e) {
        std::fprintf(stderr,
                     "[Bridge] Registration failed for descriptor '%s' (field '%s'): %s\n",
                     e.descriptor_id().c_str(), e.field().c_str(), e.what());
        abandon_start(std::move(session));
        throw;
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[Bridge] Start failed: %s\n", e.what());
        abandon_start(std::move(session));
        throw;
    }

    session_ = std::move(session);
    state_.store(BridgeState::Running, std::memory_order_release);
    std::printf("[Bridge] Running\n");
    return true;
}

void Bridge::start_session(Session &session) {
    if (display_ != nullptr) {
        DisplaySurface *display = display_;
        session.display_subscription = session.sync.subscribe(
            [display](const data::DeviceState &state, const data::StateChange &change,
                      data::PushReason reason) {
                for (const auto &message : protocol::messages_for_push(state, change, reason)) {
                    display->push(message);
                }
            });
    }

    if (!session.telemetry.start()) {
        std::fprintf(stderr, "[Bridge] Telemetry unavailable; meters will not update\n");
    }

    session.address = resolve_address();
    if (session.address) {
        connect_session(session);
    } else {
        std::fprintf(stderr, "[Bridge] No device address; running disconnected\n");
    }

    Session *raw = &session;
    session.push_timer.start(config_.push_interval, [raw] { raw->sync.flush(); });
    if (config_.reconnect_interval.count() > 0) {
        session.reconnect_timer.start(config_.reconnect_interval,
                                      [this, raw] { reconnect_tick(*raw); });
    }

    router_.attach(&session.dispatcher);
    session.sync.publish_full();
}

void Bridge::abandon_start(std::unique_ptr<Session> session) {
    router_.detach();
    if (session) {
        // The display may be what failed; it gets no teardown pushes.
        if (session->display_subscription) {
            session->sync.unsubscribe(*session->display_subscription);
            session->display_subscription.reset();
        }
        release_session(*session);
    }
    state_.store(BridgeState::Stopped, std::memory_order_release);
    std::printf("[Bridge] Stopped\n");
}

void Bridge::release_session(Session &session) {
    session.reconnect_timer.stop();
    session.push_timer.stop();
    session.channel.close();
    session.telemetry.stop();
    if (session.display_subscription) {
        session.sync.unsubscribe(*session.display_subscription);
    }
}

void Bridge::stop() {
    std::lock_guard lock(lifecycle_mu_);

    if (state() != BridgeState::Running) {
        return;
    }
    state_.store(BridgeState::Stopping, std::memory_order_release);
    std::printf("[Bridge] Stopping\n");

    router_.detach();

    if (session_) {
        release_session(*session_);
        session_.reset();
    }

    state_.store(BridgeState::Stopped, std::memory_order_release);
    std::printf("[Bridge] Stopped\n");
}

bool Bridge::restart() {
    stop();
    return start();
}

std::optional<data::DeviceState> Bridge::snapshot() const {
    std::lock_guard lock(lifecycle_mu_);
    if (!session_) {
        return std::nullopt;
    }
    return session_->sync.snapshot();
}

protocol::ChannelState Bridge::channel_state() const {
    std::lock_guard lock(lifecycle_mu_);
    if (!session_) {
        return protocol::ChannelState::Disconnected;
    }
    return session_->channel.state();
}

void Bridge::register_descriptors() {
    for (const auto &descriptor : input::actions::builtin_actions()) {
        registry_.register_action(descriptor);
    }
    for (const auto &key : config_.keys) {
        registry_.register_key(key);
    }
    std::printf("[Bridge] %zu actions, %zu keys registered\n", registry_.action_count(),
                registry_.key_count());
}

std::optional<protocol::DeviceAddress> Bridge::resolve_address() {
    if (!config_.device_address.empty()) {
        return protocol::DeviceAddress{config_.device_address, config_.device_port};
    }
    protocol::DiscoveryService discovery(config_.discovery);
    auto result = discovery.discover(config_.discovery_timeout);
    last_discovery_.store(result.outcome, std::memory_order_release);
    if (result.outcome == protocol::DiscoveryOutcome::Error) {
        std::fprintf(stderr, "[Bridge] Discovery failed: %s\n", result.error.c_str());
    }
    return result.address;
}

bool Bridge::connect_session(Session &session) {
    if (!session.address || !session.channel.connect(*session.address)) {
        return false;
    }

    // Route telemetry to our socket and ask for the status we model.
    if (uint16_t port = session.telemetry.local_port(); port != 0) {
        if (!session.channel.send("client", "udpport " + std::to_string(port))) {
            return false;
        }
    }
    return session.channel.send("sub", "slice all") && session.channel.send("sub", "tx all");
}

void Bridge::reconnect_tick(Session &session) {
    if (session.channel.state() != protocol::ChannelState::Disconnected) {
        return;
    }
    if (!session.address) {
        session.address = resolve_address();
    }
    if (session.address) {
        std::printf("[Bridge] Reconnecting to %s\n", session.address->to_string().c_str());
        connect_session(session);
    }
}

} // namespace sdrbridge
