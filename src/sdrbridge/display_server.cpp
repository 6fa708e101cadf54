#include "sdrbridge/display_server.hpp"
#include "sdrbridge/protocol/display.hpp"

#include <ixwebsocket/IXNetSystem.h>

#include <cstdio>

namespace sdrbridge {

DisplayServer::DisplayServer(input::InputBus &inputs, std::string host, uint16_t port)
    : inputs_(inputs), host_(std::move(host)), port_(port) {}

DisplayServer::~DisplayServer() { stop(); }

bool DisplayServer::start() {
    std::lock_guard lock(mu_);
    if (server_) {
        return false;
    }

    ix::initNetSystem();
    auto server = std::make_unique<ix::WebSocketServer>(port_, host_);
    server->disablePerMessageDeflate();
    server->setOnClientMessageCallback(
        [this](std::shared_ptr<ix::ConnectionState> connection, ix::WebSocket & /*ws*/,
               const ix::WebSocketMessagePtr &msg) {
            switch (msg->type) {
            case ix::WebSocketMessageType::Message:
                if (!msg->binary) {
                    handle_text(msg->str);
                }
                break;
            case ix::WebSocketMessageType::Open:
                std::printf("[Display] Client %s connected\n", connection->getId().c_str());
                break;
            case ix::WebSocketMessageType::Close:
                std::printf("[Display] Client %s disconnected\n", connection->getId().c_str());
                break;
            case ix::WebSocketMessageType::Error:
                std::fprintf(stderr, "[Display] Client error: %s\n",
                             msg->errorInfo.reason.c_str());
                break;
            default:
                break;
            }
        });

    auto result = server->listen();
    if (!result.first) {
        std::fprintf(stderr, "[Display] Cannot listen on %s:%u: %s\n", host_.c_str(), port_,
                     result.second.c_str());
        return false;
    }
    server->start();
    server_ = std::move(server);
    std::printf("[Display] Listening on ws://%s:%u\n", host_.c_str(), port_);
    return true;
}

void DisplayServer::stop() {
    std::unique_ptr<ix::WebSocketServer> server;
    {
        std::lock_guard lock(mu_);
        server = std::move(server_);
    }
    if (server) {
        server->stop();
        std::printf("[Display] Stopped\n");
    }
}

void DisplayServer::push(const nlohmann::json &message) {
    const std::string text = message.dump();
    std::lock_guard lock(mu_);
    if (!server_) {
        return;
    }
    for (const auto &client : server_->getClients()) {
        client->sendText(text);
    }
}

void DisplayServer::handle_text(const std::string &text) {
    try {
        auto request = protocol::parse_display_request(nlohmann::json::parse(text));

        if (request.type == protocol::kMappedAction) {
            const auto &payload = request.payload;
            if (!payload.is_object() || !payload.contains("id") || !payload["id"].is_string()) {
                throw std::runtime_error("mappedAction payload missing 'id'");
            }

            input::MappedActionEvent event;
            event.id = payload["id"].get<std::string>();
            if (payload.contains("value") && !payload["value"].is_null()) {
                const auto &value = payload["value"];
                event.value = value.is_string() ? value.get<std::string>() : value.dump();
            }
            inputs_.emit_mapped(event);
        } else {
            inputs_.emit_trigger(request.type);
        }
    } catch (const std::exception &e) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        std::fprintf(stderr, "[Display] Rejected request: %s\n", e.what());
    }
}

size_t DisplayServer::client_count() const {
    std::lock_guard lock(mu_);
    return server_ ? server_->getClients().size() : 0;
}

} // namespace sdrbridge
