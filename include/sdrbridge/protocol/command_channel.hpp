#pragma once

#include "sdrbridge/data/state_sync.hpp"
#include "sdrbridge/protocol/transport.hpp"
#include "sdrbridge/protocol/wire.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace sdrbridge::protocol {

enum class ChannelState { Disconnected, Connecting, Connected };

const char *channel_state_label(ChannelState state);

/// Anything that can issue a device command.
class CommandSink {
  public:
    virtual ~CommandSink() = default;

    /// Returns the sequence id of the transmitted command, or std::nullopt if
    /// nothing was written.
    virtual std::optional<uint32_t> send(std::string_view verb, std::string_view args = {}) = 0;
};

/// Persistent command/response connection to the device.
///
/// Disconnected -> Connecting -> Connected -> Disconnected. The channel never
/// reconnects on its own; the bridge lifecycle owns that policy.
///
/// A reader thread splits inbound bytes into lines and handles them in arrival
/// order: R lines are correlated with the outstanding command table, S lines
/// are folded into the StateSynchronizer. The transition to Disconnected
/// reports connected=false to the synchronizer exactly once, however many
/// times the transport reports the failure.
class CommandChannel : public CommandSink {
  public:
    using ResponseHandler = std::function<void(const CommandResponse &)>;

    explicit CommandChannel(data::StateSynchronizer &sync,
                            TransportFactory transport_factory = make_tcp_transport);
    ~CommandChannel() override;

    CommandChannel(const CommandChannel &) = delete;
    CommandChannel &operator=(const CommandChannel &) = delete;

    /// Open the connection. On success the sequence counter restarts at 1.
    /// Fails if the channel is not Disconnected.
    bool connect(const DeviceAddress &address);

    /// Frame and write "C<seq>|<verb> <args>". Fails fast when not Connected.
    std::optional<uint32_t> send(std::string_view verb, std::string_view args = {}) override;

    /// Close the connection and join the reader. Safe in any state.
    void close();

    /// Called on the reader thread for every R line.
    void set_response_handler(ResponseHandler handler);

    [[nodiscard]] ChannelState state() const { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] std::string last_error() const;
    [[nodiscard]] std::optional<uint32_t> client_handle() const;
    [[nodiscard]] std::string protocol_version() const;
    [[nodiscard]] size_t outstanding() const;
    [[nodiscard]] uint64_t unknown_lines() const {
        return unknown_lines_.load(std::memory_order_relaxed);
    }

    /// Reader-thread ingress. Public so tests can drive the parser directly.
    void handle_data(std::string_view chunk);
    void handle_transport_closed(const std::string &reason);

  private:
    void reader_loop(Transport *transport);
    void dispatch_line(std::string_view line);
    void join_reader();

    data::StateSynchronizer &sync_;
    TransportFactory transport_factory_;

    // connect() and close() are serialized against each other.
    std::mutex lifecycle_mu_;
    std::thread reader_;

    // Guards transport_ and the sequence counter so ids go out in order.
    std::mutex write_mu_;
    std::unique_ptr<Transport> transport_;
    uint32_t next_sequence_ = 1;

    std::atomic<ChannelState> state_{ChannelState::Disconnected};

    mutable std::mutex info_mu_;
    std::unordered_map<uint32_t, std::string> outstanding_;
    std::string last_error_;
    std::optional<uint32_t> client_handle_;
    std::string protocol_version_;
    ResponseHandler response_handler_;

    LineSplitter splitter_; // reader thread only
    std::atomic<uint64_t> unknown_lines_{0};
};

} // namespace sdrbridge::protocol
