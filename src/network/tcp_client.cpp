#include "peerdrop/network/tcp_client.hpp"
#include "peerdrop/core/logger.hpp"
#include <boost/asio/connect.hpp>

namespace peerdrop::network {

TcpClient::TcpClient()
    : io_context_()
    , work_guard_(boost::asio::make_work_guard(io_context_))
    , state_(ClientState::DISCONNECTED)
    , target_port_(0) {
    io_thread_ = std::thread([this]() { run(); });
}

TcpClient::~TcpClient() {
    boost::asio::post(io_context_, [this]() {
        message_handler_ = nullptr;
        disconnect_handler_ = nullptr;
    });
    disconnect();
    work_guard_.reset();
    
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

std::future<bool> TcpClient::connect_async(const std::string& host, std::uint16_t port) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    
    if (state_ == ClientState::CONNECTING || state_ == ClientState::CONNECTED) {
        std::promise<bool> promise;
        promise.set_value(false);
        return promise.get_future();
    }
    
    target_host_ = host;
    target_port_ = port;
    set_state(ClientState::CONNECTING);
    
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    
    LOG_INFO("Attempting to connect to {}:{}", host, port);
    
    auto resolver = std::make_shared<tcp::resolver>(io_context_);
    auto socket = std::make_shared<tcp::socket>(io_context_);
    pending_socket_ = socket;
    
    resolver->async_resolve(host, std::to_string(port),
        [this, resolver, socket, promise](boost::system::error_code ec, tcp::resolver::results_type endpoints) {
            if (ec) {
                handle_connect(ec, socket, promise);
                return;
            }
            
            boost::asio::async_connect(*socket, endpoints,
                [this, socket, promise](boost::system::error_code ec, const tcp::endpoint&) {
                    handle_connect(ec, socket, promise);
                });
        });
    
    return future;
}

bool TcpClient::connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
    auto future = connect_async(host, port);
    
    if (future.wait_for(timeout) == std::future_status::timeout) {
        LOG_ERROR("Connection to {}:{} timed out", host, port);
        
        std::shared_ptr<tcp::socket> socket;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            socket = pending_socket_;
        }
        if (socket) {
            boost::asio::post(io_context_, [socket]() {
                boost::system::error_code ec;
                socket->close(ec);
            });
        }
        
        future.wait();
    }
    
    return future.get();
}

void TcpClient::disconnect() {
    std::shared_ptr<Connection> connection;
    std::shared_ptr<tcp::socket> pending;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        
        if (state_ == ClientState::DISCONNECTED) {
            return;
        }
        
        LOG_INFO("Disconnecting from {}:{}", target_host_, target_port_);
        connection = std::move(connection_);
        pending = std::move(pending_socket_);
        set_state(ClientState::DISCONNECTED);
    }
    
    if (connection) {
        connection->close();
    }
    if (pending) {
        boost::asio::post(io_context_, [pending]() {
            boost::system::error_code ec;
            pending->close(ec);
        });
    }
}

bool TcpClient::send_raw(MessageType type, std::vector<std::uint8_t> payload) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        connection = connection_;
    }
    
    if (!connection || !connection->is_open()) {
        LOG_WARN("Attempted to send {} while not connected", to_string(type));
        return false;
    }
    
    return connection->send_raw(type, std::move(payload));
}

ClientState TcpClient::get_state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool TcpClient::is_connected() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == ClientState::CONNECTED && connection_ && connection_->is_open();
}

std::string TcpClient::get_remote_endpoint() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (connection_) {
        return connection_->get_remote_endpoint();
    }
    return target_host_ + ":" + std::to_string(target_port_);
}

void TcpClient::run() {
    while (true) {
        try {
            io_context_.run();
            break;
        } catch (const std::exception& e) {
            LOG_ERROR("Client IO context error: {}", e.what());
            io_context_.restart();
        }
    }
}

void TcpClient::handle_connect(const boost::system::error_code& error,
                               std::shared_ptr<tcp::socket> socket,
                               std::shared_ptr<std::promise<bool>> promise) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pending_socket_.reset();
        
        if (error || state_ != ClientState::CONNECTING) {
            LOG_ERROR("Failed to connect to {}:{}: {}", target_host_, target_port_,
                      error ? error.message() : std::string("cancelled"));
            if (state_ == ClientState::CONNECTING) {
                set_state(ClientState::FAILED);
            }
            promise->set_value(false);
            return;
        }
        
        LOG_INFO("Successfully connected to {}:{}", target_host_, target_port_);
        
        connection = std::make_shared<Connection>(io_context_, std::move(*socket));
        connection->set_message_handler(
            [this](const MessageHeader& header, std::vector<std::uint8_t> payload) {
                if (message_handler_) {
                    message_handler_(header, std::move(payload));
                }
            });
        connection->set_disconnect_handler(
            [this](std::shared_ptr<Connection> conn) {
                handle_disconnect(conn);
            });
        
        connection_ = connection;
        set_state(ClientState::CONNECTED);
    }
    
    connection->start();
    promise->set_value(true);
}

void TcpClient::handle_disconnect(std::shared_ptr<Connection> connection) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (connection_ == connection) {
            connection_.reset();
            set_state(ClientState::DISCONNECTED);
        }
    }
    
    LOG_INFO("Disconnected from {}:{}", target_host_, target_port_);
    
    if (disconnect_handler_) {
        disconnect_handler_("Connection closed");
    }
}

void TcpClient::set_state(ClientState new_state) {
    if (state_ != new_state) {
        LOG_DEBUG("Client state changed: {} -> {}", 
                  static_cast<int>(state_), static_cast<int>(new_state));
        state_ = new_state;
    }
}

}
