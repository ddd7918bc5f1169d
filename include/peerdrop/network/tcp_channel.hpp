#pragma once

#include "peerdrop/network/tcp_server.hpp"
#include "peerdrop/transfer/buffered_channel.hpp"
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace peerdrop::network {

// Parsed form of a channel identifier "<name>@<host>:<port>".
struct ChannelAddress {
    std::string name;
    std::string host;
    std::uint16_t port = 0;
    
    std::string to_identifier() const;
    static std::optional<ChannelAddress> parse(const std::string& identifier);
};

// PeerChannel over one framed TCP connection. TCP gives the ordered, reliable
// delivery transfer sessions require.
class TcpPeerChannel : public transfer::BufferedChannel {
public:
    TcpPeerChannel(boost::asio::io_context& io_context, std::string remote_id);
    
    bool send(const transfer::ChannelMessage& message) override;
    void close() override;
    
    // The following run on the io_context.
    
    // Binds the established connection and raises open. With route_frames the
    // channel also installs the connection's message and disconnect handlers;
    // otherwise the owner forwards them via handle_frame()/handle_disconnect().
    void attach(std::shared_ptr<Connection> connection, bool route_frames);
    void handle_frame(const MessageHeader& header, std::vector<std::uint8_t> payload);
    void handle_disconnect();
    
    // Reports a connection that never came up: error, then close.
    void fail(const std::string& reason);

private:
    std::shared_ptr<TcpPeerChannel> self();
    
    std::shared_ptr<Connection> connection_;
    mutable std::mutex connection_mutex_;
    bool closed_;
};

// Accepts incoming channels. A connection becomes a channel once its first
// frame, CHANNEL_HELLO, has named the remote endpoint.
class TcpChannelListener {
public:
    using AcceptHandler = std::function<void(std::shared_ptr<transfer::PeerChannel>)>;
    
    explicit TcpChannelListener(std::uint16_t port, std::string bind_address = "0.0.0.0",
                                std::uint32_t max_frame_size = DEFAULT_MAX_PAYLOAD_SIZE);
    ~TcpChannelListener();
    
    // Invoked on the listener's I/O thread.
    void set_accept_handler(AcceptHandler handler) { accept_handler_ = std::move(handler); }
    
    bool start();
    void stop();
    
    std::uint16_t get_port() const { return server_.get_port(); }
    std::size_t get_channel_count() const;

private:
    void handle_message(std::shared_ptr<Connection> connection, const MessageHeader& header,
                        std::vector<std::uint8_t> payload);
    void handle_disconnect(std::shared_ptr<Connection> connection);
    
    AcceptHandler accept_handler_;
    std::unordered_map<const Connection*, std::shared_ptr<TcpPeerChannel>> channels_;
    mutable std::mutex channels_mutex_;
    
    TcpServer server_;
};

// Opens outgoing channels. All of them share one I/O thread.
class TcpChannelConnector : public transfer::ChannelConnector {
public:
    explicit TcpChannelConnector(std::string local_id, std::uint32_t max_frame_size = DEFAULT_MAX_PAYLOAD_SIZE);
    ~TcpChannelConnector();
    
    TcpChannelConnector(const TcpChannelConnector&) = delete;
    TcpChannelConnector& operator=(const TcpChannelConnector&) = delete;
    
    // Never returns null; an unparseable or unreachable target yields a
    // channel that reports error and close once started.
    std::shared_ptr<transfer::PeerChannel> open(const std::string& target_id) override;
    
    void stop();
    
    // Channels opened and not yet released; released ones are dropped on the next open().
    std::size_t get_channel_count() const;
    
    const std::string& get_local_id() const { return local_id_; }

private:
    void handle_connect(const boost::system::error_code& error,
                        std::shared_ptr<TcpPeerChannel> channel,
                        std::shared_ptr<tcp::socket> socket);
    
    std::string local_id_;
    std::uint32_t max_frame_size_;
    
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::thread io_thread_;
    bool stopped_;
    
    std::vector<std::weak_ptr<TcpPeerChannel>> channels_;
    mutable std::mutex channels_mutex_;
};

}
