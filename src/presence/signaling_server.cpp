#include "peerdrop/presence/signaling_server.hpp"
#include "peerdrop/core/logger.hpp"

namespace peerdrop::presence {

class SignalingServer::ConnectionEndpoint : public PresenceEndpoint {
public:
    explicit ConnectionEndpoint(std::shared_ptr<network::Connection> connection)
        : connection_(connection)
        , description_(connection->get_remote_endpoint()) {
    }
    
    bool send_presence(const PeerSet& peers) override {
        auto connection = connection_.lock();
        if (!connection || !connection->is_open()) {
            return false;
        }
        
        network::PresenceUpdateMessage update{std::vector<std::string>(peers.begin(), peers.end())};
        return connection->send_message(network::MessageType::PRESENCE_UPDATE, update);
    }
    
    std::string describe() const override { return description_; }

private:
    std::weak_ptr<network::Connection> connection_;
    std::string description_;
};

SignalingServer::SignalingServer(std::uint16_t port, std::string bind_address)
    : server_(port, std::move(bind_address)) {
    
    dispatcher_.register_handler<network::RegisterMessage>(network::MessageType::REGISTER,
        [this](std::shared_ptr<network::Connection> conn, const network::RegisterMessage& msg) {
            handle_register(conn, msg);
        });
    
    dispatcher_.register_handler<network::QueryPeersMessage>(network::MessageType::QUERY_PEERS,
        [this](std::shared_ptr<network::Connection> conn, const network::QueryPeersMessage&) {
            handle_query(conn);
        });
    
    dispatcher_.set_fallback_handler(
        [this](std::shared_ptr<network::Connection> conn, const network::MessageHeader& header) {
            auto code = dispatcher_.has_handler(header.type) ? SignalingError::MALFORMED_MESSAGE
                                                             : SignalingError::UNSUPPORTED_MESSAGE;
            send_error(conn, code, std::string("Cannot process ") + network::to_string(header.type));
        });
    
    server_.set_connection_handler(
        [this](std::shared_ptr<network::Connection> conn) {
            handle_connection(conn);
        });
    
    server_.set_message_handler(
        [this](std::shared_ptr<network::Connection> conn, const network::MessageHeader& header,
               std::vector<std::uint8_t> payload) {
            dispatcher_.handle_message(conn, header, payload);
        });
    
    server_.set_disconnect_handler(
        [this](std::shared_ptr<network::Connection> conn) {
            handle_disconnect(conn);
        });
}

SignalingServer::~SignalingServer() {
    stop();
}

bool SignalingServer::start() {
    if (!server_.start()) {
        LOG_ERROR("Signaling server failed to start");
        return false;
    }
    
    LOG_INFO("Signaling server listening on port {}", server_.get_port());
    return true;
}

void SignalingServer::stop() {
    if (!server_.is_running()) {
        return;
    }
    
    server_.stop();
    
    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    endpoints_.clear();
}

void SignalingServer::handle_connection(std::shared_ptr<network::Connection> connection) {
    auto endpoint = std::make_shared<ConnectionEndpoint>(connection);
    
    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    endpoints_[connection.get()] = endpoint;
}

void SignalingServer::handle_disconnect(std::shared_ptr<network::Connection> connection) {
    std::shared_ptr<ConnectionEndpoint> endpoint;
    {
        std::lock_guard<std::mutex> lock(endpoints_mutex_);
        auto it = endpoints_.find(connection.get());
        if (it == endpoints_.end()) {
            return;
        }
        endpoint = it->second;
        endpoints_.erase(it);
    }
    
    LOG_INFO("Client {} disconnected", connection->get_remote_endpoint());
    registry_.deregister(endpoint);
}

void SignalingServer::handle_register(std::shared_ptr<network::Connection> connection,
                                      const network::RegisterMessage& msg) {
    auto endpoint = endpoint_for(connection);
    if (!endpoint) {
        LOG_WARN("Register from untracked connection {}", connection->get_remote_endpoint());
        return;
    }
    
    if (!registry_.register_peer(msg.identifier, endpoint)) {
        send_error(connection, SignalingError::REGISTRATION_REJECTED, "Identifier must not be empty");
    }
}

void SignalingServer::handle_query(std::shared_ptr<network::Connection> connection) {
    auto peers = registry_.snapshot();
    LOG_DEBUG("Sending {} active peers to {}", peers.size(), connection->get_remote_endpoint());
    
    network::PresenceUpdateMessage update{std::vector<std::string>(peers.begin(), peers.end())};
    connection->send_message(network::MessageType::PRESENCE_UPDATE, update);
}

void SignalingServer::send_error(std::shared_ptr<network::Connection> connection, SignalingError code,
                                 const std::string& message) {
    if (!connection) {
        return;
    }
    
    network::ErrorMessage error{static_cast<std::uint32_t>(code), message};
    connection->send_message(network::MessageType::SIGNAL_ERROR, error);
}

std::shared_ptr<SignalingServer::ConnectionEndpoint> SignalingServer::endpoint_for(
    const std::shared_ptr<network::Connection>& connection) const {
    std::lock_guard<std::mutex> lock(endpoints_mutex_);
    auto it = endpoints_.find(connection.get());
    return it != endpoints_.end() ? it->second : nullptr;
}

}
