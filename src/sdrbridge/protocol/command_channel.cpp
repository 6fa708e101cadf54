#include "sdrbridge/protocol/command_channel.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <memory>

namespace sdrbridge::protocol {

namespace {

constexpr size_t kReadChunk = 4096;

} // namespace

const char *channel_state_label(ChannelState state) {
    switch (state) {
    case ChannelState::Connected:
        return "Connected";
    case ChannelState::Connecting:
        return "Connecting";
    case ChannelState::Disconnected:
    default:
        return "Disconnected";
    }
}

CommandChannel::CommandChannel(data::StateSynchronizer &sync, TransportFactory transport_factory)
    : sync_(sync), transport_factory_(std::move(transport_factory)) {}

CommandChannel::~CommandChannel() { close(); }

bool CommandChannel::connect(const DeviceAddress &address) {
    std::lock_guard life(lifecycle_mu_);

    if (state() != ChannelState::Disconnected) {
        std::fprintf(stderr, "[CommandChannel] connect(%s) ignored: channel is %s\n",
                     address.to_string().c_str(), channel_state_label(state()));
        return false;
    }

    // A reader left over from a dropped connection has already reported the
    // drop; make sure it is gone before its transport is replaced.
    {
        std::lock_guard lock(write_mu_);
        if (transport_) {
            transport_->close();
        }
    }
    join_reader();

    state_.store(ChannelState::Connecting, std::memory_order_release);
    std::printf("[CommandChannel] Connecting to %s\n", address.to_string().c_str());

    std::unique_ptr<Transport> transport;
    std::string error;
    bool opened = false;
    try {
        transport = transport_factory_();
        opened = transport && transport->open(address, error);
    } catch (const std::exception &e) {
        error = e.what();
        transport.reset();
    }
    if (!opened) {
        if (!transport && error.empty()) {
            error = "no transport";
        }
        {
            std::lock_guard lock(info_mu_);
            last_error_ = error;
        }
        state_.store(ChannelState::Disconnected, std::memory_order_release);
        std::fprintf(stderr, "[CommandChannel] Connection failed: %s\n", error.c_str());
        return false;
    }

    {
        std::lock_guard lock(write_mu_);
        transport_ = std::move(transport);
        next_sequence_ = 1;
    }
    {
        std::lock_guard lock(info_mu_);
        outstanding_.clear();
        last_error_.clear();
        client_handle_.reset();
        protocol_version_.clear();
    }
    splitter_.clear();

    state_.store(ChannelState::Connected, std::memory_order_release);
    std::printf("[CommandChannel] Connected to %s\n", address.to_string().c_str());

    data::StateUpdate update;
    update.connected = true;
    sync_.apply(update);

    reader_ = std::thread(&CommandChannel::reader_loop, this, transport_.get());
    return true;
}

std::optional<uint32_t> CommandChannel::send(std::string_view verb, std::string_view args) {
    std::unique_lock lock(write_mu_);
    if (state() != ChannelState::Connected || !transport_) {
        std::fprintf(stderr, "[CommandChannel] Not connected; dropped '%.*s'\n",
                     static_cast<int>(verb.size()), verb.data());
        return std::nullopt;
    }

    const uint32_t sequence_id = next_sequence_++;
    {
        std::lock_guard info(info_mu_);
        outstanding_[sequence_id] = std::string(verb);
    }

    if (!transport_->write(format_command(sequence_id, verb, args))) {
        {
            std::lock_guard info(info_mu_);
            outstanding_.erase(sequence_id);
        }
        lock.unlock();
        handle_transport_closed("write failed");
        return std::nullopt;
    }
    return sequence_id;
}

void CommandChannel::close() {
    std::lock_guard life(lifecycle_mu_);

    handle_transport_closed("closed by bridge");
    {
        std::lock_guard lock(write_mu_);
        if (transport_) {
            transport_->close();
        }
    }
    join_reader();
}

void CommandChannel::set_response_handler(ResponseHandler handler) {
    std::lock_guard lock(info_mu_);
    response_handler_ = std::move(handler);
}

std::string CommandChannel::last_error() const {
    std::lock_guard lock(info_mu_);
    return last_error_;
}

std::optional<uint32_t> CommandChannel::client_handle() const {
    std::lock_guard lock(info_mu_);
    return client_handle_;
}

std::string CommandChannel::protocol_version() const {
    std::lock_guard lock(info_mu_);
    return protocol_version_;
}

size_t CommandChannel::outstanding() const {
    std::lock_guard lock(info_mu_);
    return outstanding_.size();
}

void CommandChannel::handle_data(std::string_view chunk) {
    splitter_.feed(chunk, [this](std::string_view line) { dispatch_line(line); });
}

void CommandChannel::handle_transport_closed(const std::string &reason) {
    ChannelState current = state();
    do {
        if (current == ChannelState::Disconnected) {
            return;
        }
    } while (!state_.compare_exchange_weak(current, ChannelState::Disconnected,
                                           std::memory_order_acq_rel));

    {
        std::lock_guard lock(info_mu_);
        outstanding_.clear();
        last_error_ = reason;
    }
    std::printf("[CommandChannel] Disconnected: %s\n", reason.c_str());

    data::StateUpdate update;
    update.connected = false;
    sync_.apply(update);
}

void CommandChannel::reader_loop(Transport *transport) {
    char buf[kReadChunk];
    while (true) {
        ssize_t n = transport->read(buf, sizeof(buf));
        if (n > 0) {
            handle_data(std::string_view(buf, static_cast<size_t>(n)));
            continue;
        }
        handle_transport_closed(n == 0 ? "connection closed by device"
                                       : std::string("read error: ") + std::strerror(errno));
        break;
    }
}

void CommandChannel::dispatch_line(std::string_view line) {
    InboundLine parsed = parse_line(line);

    switch (parsed.kind) {
    case LineKind::Response: {
        ResponseHandler handler;
        {
            std::lock_guard lock(info_mu_);
            auto it = outstanding_.find(parsed.response.sequence_id);
            if (it != outstanding_.end()) {
                parsed.response.verb = std::move(it->second);
                outstanding_.erase(it);
            }
            handler = response_handler_;
        }
        if (!parsed.response.ok()) {
            std::fprintf(stderr, "[CommandChannel] C%u '%s' failed: status %08X %s\n",
                         parsed.response.sequence_id, parsed.response.verb.c_str(),
                         parsed.response.status, parsed.response.data.c_str());
        }
        if (handler) {
            handler(parsed.response);
        }
        break;
    }
    case LineKind::Status:
        if (auto update = status_to_update(parsed.status)) {
            sync_.apply(*update);
        }
        break;
    case LineKind::Version: {
        std::lock_guard lock(info_mu_);
        protocol_version_ = parsed.text;
        std::printf("[CommandChannel] Device protocol version %s\n", parsed.text.c_str());
        break;
    }
    case LineKind::Handle: {
        std::lock_guard lock(info_mu_);
        client_handle_ = parsed.handle;
        std::printf("[CommandChannel] Client handle 0x%08X\n", parsed.handle);
        break;
    }
    case LineKind::Message:
        std::printf("[CommandChannel] Device message: %s\n", parsed.text.c_str());
        break;
    case LineKind::Unknown:
    default:
        unknown_lines_.fetch_add(1, std::memory_order_relaxed);
        std::fprintf(stderr, "[CommandChannel] Unrecognized line: %s\n", parsed.text.c_str());
        break;
    }
}

void CommandChannel::join_reader() {
    if (reader_.joinable() && reader_.get_id() != std::this_thread::get_id()) {
        reader_.join();
    }
}

} // namespace sdrbridge::protocol
