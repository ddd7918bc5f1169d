#pragma once

#include "peerdrop/network/connection.hpp"
#include <future>
#include <mutex>
#include <thread>

namespace peerdrop::network {

enum class ClientState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    FAILED
};

// Single outbound connection driven by its own I/O thread.
// Must not be destroyed from inside one of its own handlers.
class TcpClient {
public:
    using MessageHandler = std::function<void(const MessageHeader&, std::vector<std::uint8_t>)>;
    using DisconnectHandler = std::function<void(const std::string&)>;
    
    TcpClient();
    ~TcpClient();
    
    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;
    
    std::future<bool> connect_async(const std::string& host, std::uint16_t port);
    bool connect(const std::string& host, std::uint16_t port,
                 std::chrono::milliseconds timeout = std::chrono::seconds(5));
    void disconnect();
    
    bool send_raw(MessageType type, std::vector<std::uint8_t> payload);
    
    template<MessagePayload T>
    bool send_message(MessageType type, const T& payload) {
        return send_raw(type, payload.serialize());
    }
    
    ClientState get_state() const;
    bool is_connected() const;
    std::string get_remote_endpoint() const;
    
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }

private:
    void run();
    void handle_connect(const boost::system::error_code& error,
                        std::shared_ptr<tcp::socket> socket,
                        std::shared_ptr<std::promise<bool>> promise);
    void handle_disconnect(std::shared_ptr<Connection> connection);
    void set_state(ClientState new_state);
    
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::thread io_thread_;
    
    mutable std::mutex state_mutex_;
    ClientState state_;
    std::string target_host_;
    std::uint16_t target_port_;
    std::shared_ptr<tcp::socket> pending_socket_;
    std::shared_ptr<Connection> connection_;
    
    MessageHandler message_handler_;
    DisconnectHandler disconnect_handler_;
};

}
