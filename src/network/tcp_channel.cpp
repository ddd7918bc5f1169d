#include "peerdrop/network/tcp_channel.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"

namespace peerdrop::network {

std::string ChannelAddress::to_identifier() const {
    return name + "@" + host + ":" + std::to_string(port);
}

std::optional<ChannelAddress> ChannelAddress::parse(const std::string& identifier) {
    auto at = identifier.rfind('@');
    if (at == std::string::npos || at == 0) {
        return std::nullopt;
    }
    
    auto host_port = core::utils::parse_host_port(identifier.substr(at + 1));
    if (!host_port) {
        return std::nullopt;
    }
    
    return ChannelAddress{identifier.substr(0, at), host_port->host, host_port->port};
}

TcpPeerChannel::TcpPeerChannel(boost::asio::io_context& io_context, std::string remote_id)
    : BufferedChannel(io_context, std::move(remote_id))
    , closed_(false) {
}

bool TcpPeerChannel::send(const transfer::ChannelMessage& message) {
    if (!open_) {
        return false;
    }
    
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        connection = connection_;
    }
    
    if (!connection) {
        return false;
    }
    
    auto [type, payload] = transfer::encode(message);
    return connection->send_raw(type, std::move(payload));
}

void TcpPeerChannel::close() {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        connection = connection_;
    }
    
    open_ = false;
    
    if (connection) {
        // The disconnect handler raises close once the socket is shut.
        connection->close();
    } else {
        boost::asio::post(io_context_, [self = self()]() {
            self->raise_close();
        });
    }
}

void TcpPeerChannel::attach(std::shared_ptr<Connection> connection, bool route_frames) {
    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        if (closed_) {
            connection->close();
            return;
        }
        connection_ = connection;
    }
    
    std::weak_ptr<TcpPeerChannel> weak_self = self();
    
    connection->set_write_handler([weak_self](MessageType type) {
        auto channel = weak_self.lock();
        if (channel && type != MessageType::CHANNEL_HELLO) {
            channel->raise_sent();
        }
    });
    
    connection->set_error_handler([weak_self](const boost::system::error_code& error) {
        if (auto channel = weak_self.lock()) {
            channel->raise_error(error.message());
        }
    });
    
    if (route_frames) {
        connection->set_message_handler([weak_self](const MessageHeader& header, std::vector<std::uint8_t> payload) {
            if (auto channel = weak_self.lock()) {
                channel->handle_frame(header, std::move(payload));
            }
        });
        
        connection->set_disconnect_handler([weak_self](std::shared_ptr<Connection>) {
            if (auto channel = weak_self.lock()) {
                channel->handle_disconnect();
            }
        });
    }
    
    open_ = true;
    raise_open();
}

void TcpPeerChannel::handle_frame(const MessageHeader& header, std::vector<std::uint8_t> payload) {
    if (header.type == MessageType::CHANNEL_HELLO) {
        LOG_WARN("Ignoring repeated hello from {}", remote_id());
        return;
    }
    
    try {
        raise_message(transfer::decode(header.type, std::move(payload)));
    } catch (const std::exception& e) {
        LOG_ERROR("Bad frame from {}: {}", remote_id(), e.what());
        raise_error(std::string("Malformed ") + to_string(header.type) + ": " + e.what());
        close();
    }
}

void TcpPeerChannel::handle_disconnect() {
    open_ = false;
    raise_close();
}

void TcpPeerChannel::fail(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(connection_mutex_);
        closed_ = true;
    }
    open_ = false;
    raise_error(reason);
    raise_close();
}

std::shared_ptr<TcpPeerChannel> TcpPeerChannel::self() {
    return std::static_pointer_cast<TcpPeerChannel>(shared_from_this());
}

TcpChannelListener::TcpChannelListener(std::uint16_t port, std::string bind_address, std::uint32_t max_frame_size)
    : server_(port, std::move(bind_address)) {
    
    server_.set_max_payload_size(max_frame_size);
    
    server_.set_message_handler(
        [this](std::shared_ptr<Connection> conn, const MessageHeader& header, std::vector<std::uint8_t> payload) {
            handle_message(conn, header, std::move(payload));
        });
    
    server_.set_disconnect_handler(
        [this](std::shared_ptr<Connection> conn) {
            handle_disconnect(conn);
        });
}

TcpChannelListener::~TcpChannelListener() {
    stop();
}

bool TcpChannelListener::start() {
    if (!server_.start()) {
        return false;
    }
    LOG_INFO("Accepting channels on port {}", server_.get_port());
    return true;
}

void TcpChannelListener::stop() {
    server_.stop();
    
    std::lock_guard<std::mutex> lock(channels_mutex_);
    channels_.clear();
}

std::size_t TcpChannelListener::get_channel_count() const {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    return channels_.size();
}

void TcpChannelListener::handle_message(std::shared_ptr<Connection> connection, const MessageHeader& header,
                                        std::vector<std::uint8_t> payload) {
    std::shared_ptr<TcpPeerChannel> channel;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        auto it = channels_.find(connection.get());
        if (it != channels_.end()) {
            channel = it->second;
        }
    }
    
    if (channel) {
        channel->handle_frame(header, std::move(payload));
        return;
    }
    
    if (header.type != MessageType::CHANNEL_HELLO) {
        LOG_WARN("Expected hello from {}, got {}", connection->get_remote_endpoint(), to_string(header.type));
        connection->close();
        return;
    }
    
    std::string remote_id;
    try {
        remote_id = ChannelHelloMessage::deserialize(payload).identifier;
    } catch (const std::exception& e) {
        LOG_WARN("Malformed hello from {}: {}", connection->get_remote_endpoint(), e.what());
        connection->close();
        return;
    }
    
    if (remote_id.empty()) {
        remote_id = connection->get_remote_endpoint();
    }
    
    channel = std::make_shared<TcpPeerChannel>(server_.get_io_context(), remote_id);
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        channels_[connection.get()] = channel;
    }
    channel->attach(connection, false);
    
    LOG_INFO("Channel opened by {} ({})", remote_id, connection->get_remote_endpoint());
    
    if (accept_handler_) {
        accept_handler_(channel);
    } else {
        LOG_WARN("No accept handler; closing channel from {}", remote_id);
        channel->close();
    }
}

void TcpChannelListener::handle_disconnect(std::shared_ptr<Connection> connection) {
    std::shared_ptr<TcpPeerChannel> channel;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        auto it = channels_.find(connection.get());
        if (it == channels_.end()) {
            return;
        }
        channel = it->second;
        channels_.erase(it);
    }
    
    channel->handle_disconnect();
}

TcpChannelConnector::TcpChannelConnector(std::string local_id, std::uint32_t max_frame_size)
    : local_id_(std::move(local_id))
    , max_frame_size_(max_frame_size)
    , work_guard_(boost::asio::make_work_guard(io_context_))
    , stopped_(false) {
    
    io_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (const std::exception& e) {
            LOG_ERROR("Channel connector I/O error: {}", e.what());
        }
    });
}

TcpChannelConnector::~TcpChannelConnector() {
    stop();
}

std::shared_ptr<transfer::PeerChannel> TcpChannelConnector::open(const std::string& target_id) {
    auto channel = std::make_shared<TcpPeerChannel>(io_context_, target_id);
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        std::erase_if(channels_, [](const std::weak_ptr<TcpPeerChannel>& weak) { return weak.expired(); });
        channels_.push_back(channel);
    }
    
    auto address = ChannelAddress::parse(target_id);
    if (!address) {
        LOG_ERROR("Cannot open channel: '{}' is not <name>@<host>:<port>", target_id);
        boost::asio::post(io_context_, [channel, target_id]() {
            channel->fail("Unroutable identifier " + target_id);
        });
        return channel;
    }
    
    LOG_DEBUG("Connecting channel to {} at {}:{}", target_id, address->host, address->port);
    
    auto resolver = std::make_shared<tcp::resolver>(io_context_);
    auto socket = std::make_shared<tcp::socket>(io_context_);
    
    resolver->async_resolve(address->host, std::to_string(address->port),
        [this, resolver, socket, channel](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            if (ec) {
                channel->fail("Resolve failed: " + ec.message());
                return;
            }
            
            boost::asio::async_connect(*socket, results,
                [this, socket, channel](const boost::system::error_code& error, const tcp::endpoint&) {
                    handle_connect(error, channel, socket);
                });
        });
    
    return channel;
}

std::size_t TcpChannelConnector::get_channel_count() const {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    return channels_.size();
}

void TcpChannelConnector::stop() {
    std::vector<std::shared_ptr<TcpPeerChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        
        for (auto& weak : channels_) {
            if (auto channel = weak.lock()) {
                channels.push_back(channel);
            }
        }
        channels_.clear();
    }
    
    for (auto& channel : channels) {
        channel->close();
    }
    
    work_guard_.reset();
    boost::asio::post(io_context_, [this]() {
        io_context_.stop();
    });
    
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

void TcpChannelConnector::handle_connect(const boost::system::error_code& error,
                                         std::shared_ptr<TcpPeerChannel> channel,
                                         std::shared_ptr<tcp::socket> socket) {
    if (error) {
        LOG_WARN("Channel to {} failed to connect: {}", channel->remote_id(), error.message());
        channel->fail("Connect failed: " + error.message());
        return;
    }
    
    auto connection = std::make_shared<Connection>(io_context_, std::move(*socket));
    connection->set_max_payload_size(max_frame_size_);
    channel->attach(connection, true);
    connection->start();
    
    if (!connection->send_message(MessageType::CHANNEL_HELLO, ChannelHelloMessage{local_id_})) {
        channel->fail("Could not send hello");
        return;
    }
    
    LOG_INFO("Channel to {} connected", channel->remote_id());
}

}
