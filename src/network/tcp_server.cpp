#include "peerdrop/network/tcp_server.hpp"
#include "peerdrop/core/logger.hpp"

namespace peerdrop::network {

TcpServer::TcpServer(std::uint16_t port, std::string bind_address)
    : port_(port)
    , bind_address_(std::move(bind_address))
    , running_(false)
    , max_payload_size_(DEFAULT_MAX_PAYLOAD_SIZE)
    , io_context_()
    , acceptor_(io_context_) {
}

TcpServer::~TcpServer() {
    stop();
}

bool TcpServer::start() {
    if (running_) {
        LOG_WARN("TCP server already running");
        return false;
    }
    
    try {
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(bind_address_, ec);
        if (ec) {
            LOG_ERROR("Invalid bind address '{}': {}", bind_address_, ec.message());
            return false;
        }
        
        tcp::endpoint endpoint(address, port_);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();
        running_ = true;
        
        do_accept();
        
        server_thread_ = std::thread([this]() {
            LOG_INFO("TCP server started on {}:{}", bind_address_, port_);
            
            while (true) {
                try {
                    io_context_.run();
                    break;
                } catch (const std::exception& e) {
                    LOG_ERROR("IO context error: {}", e.what());
                    if (!running_) break;
                    
                    io_context_.restart();
                }
            }
            
            LOG_INFO("TCP server on port {} stopped", port_);
        });
        
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start TCP server on port {}: {}", port_, e.what());
        boost::system::error_code ec;
        acceptor_.close(ec);
        running_ = false;
        return false;
    }
}

void TcpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    
    LOG_INFO("Stopping TCP server on port {}", port_);
    
    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& connection : connections_) {
            connection->close();
        }
    });
    
    // The loop drains once the acceptor and every connection are closed.
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.clear();
}

std::vector<std::shared_ptr<Connection>> TcpServer::get_connections() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    std::vector<std::shared_ptr<Connection>> result;
    result.reserve(connections_.size());
    
    for (const auto& connection : connections_) {
        if (connection->is_open()) {
            result.push_back(connection);
        }
    }
    
    return result;
}

std::size_t TcpServer::get_connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void TcpServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec && running_) {
                auto connection = std::make_shared<Connection>(io_context_, std::move(socket));
                handle_new_connection(connection);
                do_accept();
            } else if (ec == boost::asio::error::operation_aborted || !running_) {
                LOG_DEBUG("Acceptor on port {} closed", port_);
            } else {
                LOG_ERROR("Accept error: {}", ec.message());
                do_accept();
            }
        });
}

void TcpServer::handle_new_connection(std::shared_ptr<Connection> connection) {
    LOG_INFO("New connection accepted from {}", connection->get_remote_endpoint());
    
    connection->set_max_payload_size(max_payload_size_);
    
    std::weak_ptr<Connection> weak_connection = connection;
    connection->set_message_handler(
        [this, weak_connection](const MessageHeader& header, std::vector<std::uint8_t> payload) {
            auto conn = weak_connection.lock();
            if (conn && message_handler_) {
                message_handler_(conn, header, std::move(payload));
            }
        });
    
    connection->set_disconnect_handler(
        [this](std::shared_ptr<Connection> conn) {
            handle_connection_closed(conn);
        });
    
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.insert(connection);
    }
    
    if (connection_handler_) {
        connection_handler_(connection);
    }
    
    connection->start();
}

void TcpServer::handle_connection_closed(std::shared_ptr<Connection> connection) {
    LOG_INFO("Connection closed: {}", connection->get_remote_endpoint());
    
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(connection);
    }
    
    if (disconnect_handler_) {
        disconnect_handler_(connection);
    }
}

}
