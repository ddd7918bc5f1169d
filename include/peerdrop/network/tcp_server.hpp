#pragma once

#include "peerdrop/network/connection.hpp"
#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_set>

namespace peerdrop::network {

class TcpServer {
public:
    using ConnectionHandler = std::function<void(std::shared_ptr<Connection>)>;
    using MessageHandler = std::function<void(std::shared_ptr<Connection>, const MessageHeader&, std::vector<std::uint8_t>)>;
    using DisconnectHandler = std::function<void(std::shared_ptr<Connection>)>;
    
    // Port 0 binds an ephemeral port; see get_port() after start().
    explicit TcpServer(std::uint16_t port, std::string bind_address = "0.0.0.0");
    ~TcpServer();
    
    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;
    
    bool start();
    void stop();
    bool is_running() const { return running_; }
    
    std::uint16_t get_port() const { return port_; }
    std::vector<std::shared_ptr<Connection>> get_connections() const;
    std::size_t get_connection_count() const;
    
    void set_connection_handler(ConnectionHandler handler) { connection_handler_ = std::move(handler); }
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }
    void set_max_payload_size(std::uint32_t size) { max_payload_size_ = size; }
    
    boost::asio::io_context& get_io_context() { return io_context_; }

private:
    void do_accept();
    void handle_new_connection(std::shared_ptr<Connection> connection);
    void handle_connection_closed(std::shared_ptr<Connection> connection);
    
    std::uint16_t port_;
    std::string bind_address_;
    std::atomic<bool> running_;
    std::uint32_t max_payload_size_;
    
    boost::asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::thread server_thread_;
    
    std::unordered_set<std::shared_ptr<Connection>> connections_;
    mutable std::mutex connections_mutex_;
    
    ConnectionHandler connection_handler_;
    MessageHandler message_handler_;
    DisconnectHandler disconnect_handler_;
};

}
