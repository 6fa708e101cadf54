#pragma once

#include "sdrbridge/input/input_bus.hpp"

#include <ixwebsocket/IXWebSocketServer.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace sdrbridge {

/// Where state pushes go. Implementations must accept push() from any thread.
class DisplaySurface {
  public:
    virtual ~DisplaySurface() = default;
    virtual void push(const nlohmann::json &message) = 0;
};

/// WebSocket endpoint for the display client.
///
/// Outbound: every push() is broadcast to all connected clients as a JSON
/// text frame. Inbound: each text frame is a {"type", "payload"?} request.
/// "mappedAction" requests become mapped action events on the InputBus; any
/// other type (getState, screen.*, action ids) becomes a direct trigger.
class DisplayServer : public DisplaySurface {
  public:
    DisplayServer(input::InputBus &inputs, std::string host, uint16_t port);
    ~DisplayServer() override;

    DisplayServer(const DisplayServer &) = delete;
    DisplayServer &operator=(const DisplayServer &) = delete;

    /// Listen and start accepting clients. Returns false if the port cannot be bound.
    bool start();
    void stop();

    void push(const nlohmann::json &message) override;

    /// Handle one inbound text frame. Public so tests can drive it without a socket.
    void handle_text(const std::string &text);

    [[nodiscard]] size_t client_count() const;
    [[nodiscard]] uint64_t rejected_count() const { return rejected_.load(); }

  private:
    input::InputBus &inputs_;
    std::string host_;
    uint16_t port_;

    mutable std::mutex mu_;
    std::unique_ptr<ix::WebSocketServer> server_;

    std::atomic<uint64_t> rejected_{0};
};

} // namespace sdrbridge
