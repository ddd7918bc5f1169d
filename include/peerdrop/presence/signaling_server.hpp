#pragma once

#include "peerdrop/presence/presence_registry.hpp"
#include "peerdrop/network/message_handler.hpp"
#include "peerdrop/network/tcp_server.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>

namespace peerdrop::presence {

enum class SignalingError : std::uint32_t {
    MALFORMED_MESSAGE = 1,
    UNSUPPORTED_MESSAGE = 2,
    REGISTRATION_REJECTED = 3
};

// Rendezvous service: exposes the presence registry over framed TCP.
class SignalingServer {
public:
    explicit SignalingServer(std::uint16_t port, std::string bind_address = "0.0.0.0");
    ~SignalingServer();
    
    bool start();
    void stop();
    
    std::uint16_t get_port() const { return server_.get_port(); }
    PresenceRegistry& get_registry() { return registry_; }
    const PresenceRegistry& get_registry() const { return registry_; }

private:
    class ConnectionEndpoint;
    
    void handle_connection(std::shared_ptr<network::Connection> connection);
    void handle_disconnect(std::shared_ptr<network::Connection> connection);
    void handle_register(std::shared_ptr<network::Connection> connection, const network::RegisterMessage& msg);
    void handle_query(std::shared_ptr<network::Connection> connection);
    void send_error(std::shared_ptr<network::Connection> connection, SignalingError code, const std::string& message);
    
    std::shared_ptr<ConnectionEndpoint> endpoint_for(const std::shared_ptr<network::Connection>& connection) const;
    
    PresenceRegistry registry_;
    network::MessageHandler dispatcher_;
    
    std::unordered_map<const network::Connection*, std::shared_ptr<ConnectionEndpoint>> endpoints_;
    mutable std::mutex endpoints_mutex_;
    
    network::TcpServer server_;
};

}
