#pragma once

#include "peerdrop/network/protocol.hpp"
#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp (Boost 1.74)
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <queue>
#include <string>

namespace peerdrop::network {

using boost::asio::ip::tcp;

enum class ConnectionState {
    DISCONNECTED,
    CONNECTED,
    CLOSING
};

// One framed TCP stream. Reads and writes run on the owning io_context;
// send_message() and close() may be called from any thread.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using MessageHandler = std::function<void(const MessageHeader&, std::vector<std::uint8_t>)>;
    using DisconnectHandler = std::function<void(std::shared_ptr<Connection>)>;
    using WriteHandler = std::function<void(MessageType)>;
    using ErrorHandler = std::function<void(const boost::system::error_code&)>;
    
    Connection(boost::asio::io_context& io_context, tcp::socket socket);
    ~Connection();
    
    void start();
    void close();
    
    bool send_message(const MessageHeader& header, std::vector<std::uint8_t> payload);
    bool send_raw(MessageType type, std::vector<std::uint8_t> payload);
    
    template<MessagePayload T>
    bool send_message(MessageType type, const T& payload) {
        return send_raw(type, payload.serialize());
    }
    
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }
    void set_write_handler(WriteHandler handler) { write_handler_ = std::move(handler); }
    void set_error_handler(ErrorHandler handler) { error_handler_ = std::move(handler); }
    void set_max_payload_size(std::uint32_t size) { max_payload_size_ = size; }
    
    ConnectionState get_state() const { return state_.load(); }
    bool is_open() const { return state_.load() == ConnectionState::CONNECTED; }
    const std::string& get_remote_endpoint() const { return remote_endpoint_; }
    std::chrono::steady_clock::time_point get_last_activity() const { return last_activity_; }
    boost::asio::io_context& get_io_context() { return io_context_; }

private:
    struct OutgoingMessage {
        MessageType type;
        std::vector<std::uint8_t> bytes;
    };
    
    void do_read_header();
    void do_read_payload(const MessageHeader& header);
    void do_write();
    void do_close();
    void handle_message(const MessageHeader& header, std::vector<std::uint8_t> payload);
    void handle_error(const boost::system::error_code& error);
    
    boost::asio::io_context& io_context_;
    tcp::socket socket_;
    std::atomic<ConnectionState> state_;
    std::string remote_endpoint_;
    std::chrono::steady_clock::time_point last_activity_;
    std::uint32_t max_payload_size_;
    
    MessageHandler message_handler_;
    DisconnectHandler disconnect_handler_;
    WriteHandler write_handler_;
    ErrorHandler error_handler_;
    
    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> read_header_buffer_;
    std::vector<std::uint8_t> read_payload_buffer_;
    
    std::queue<OutgoingMessage> write_queue_;
    bool write_in_progress_;
};

}
