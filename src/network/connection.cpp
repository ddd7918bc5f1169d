#include "peerdrop/network/connection.hpp"
#include "peerdrop/core/logger.hpp"
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

namespace peerdrop::network {

Connection::Connection(boost::asio::io_context& io_context, tcp::socket socket)
    : io_context_(io_context)
    , socket_(std::move(socket))
    , state_(ConnectionState::CONNECTED)
    , last_activity_(std::chrono::steady_clock::now())
    , max_payload_size_(DEFAULT_MAX_PAYLOAD_SIZE)
    , write_in_progress_(false) {
    
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    } else {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    }
    
    LOG_DEBUG("New connection with {}", remote_endpoint_);
}

Connection::~Connection() {
    LOG_DEBUG("Connection to {} destroyed", remote_endpoint_);
}

void Connection::start() {
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self]() {
        self->do_read_header();
    });
}

void Connection::close() {
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self]() {
        self->do_close();
    });
}

bool Connection::send_message(const MessageHeader& header, std::vector<std::uint8_t> payload) {
    if (!is_open()) {
        LOG_WARN("Attempted to send {} on inactive connection to {}", 
                 to_string(header.type), remote_endpoint_);
        return false;
    }
    
    auto header_data = header.serialize();
    OutgoingMessage message{header.type, std::move(header_data)};
    message.bytes.insert(message.bytes.end(), payload.begin(), payload.end());
    
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self, message = std::move(message)]() mutable {
        if (!self->is_open()) {
            return;
        }
        self->write_queue_.push(std::move(message));
        if (!self->write_in_progress_) {
            self->do_write();
        }
    });
    
    LOG_TRACE("Queued {} ({} bytes) for {}", to_string(header.type), payload.size(), remote_endpoint_);
    return true;
}

bool Connection::send_raw(MessageType type, std::vector<std::uint8_t> payload) {
    MessageHeader header(type, static_cast<std::uint32_t>(payload.size()));
    header.calculate_checksum(payload);
    return send_message(header, std::move(payload));
}

void Connection::do_read_header() {
    if (!is_open()) {
        return;
    }
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_header_buffer_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            last_activity_ = std::chrono::steady_clock::now();
            
            MessageHeader header;
            try {
                header = MessageHeader::deserialize(read_header_buffer_);
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to parse message header from {}: {}", remote_endpoint_, e.what());
                do_close();
                return;
            }
            
            if (!header.is_valid()) {
                LOG_ERROR("Invalid message header from {}", remote_endpoint_);
                do_close();
                return;
            }
            
            if (header.payload_size > 0) {
                do_read_payload(header);
            } else if (header.verify_checksum({})) {
                handle_message(header, {});
                do_read_header();
            } else {
                LOG_ERROR("Checksum mismatch for empty {} from {}", to_string(header.type), remote_endpoint_);
                do_close();
            }
        });
}

void Connection::do_read_payload(const MessageHeader& header) {
    if (header.payload_size > max_payload_size_) {
        LOG_ERROR("Payload too large ({} bytes) from {}", header.payload_size, remote_endpoint_);
        do_close();
        return;
    }
    
    read_payload_buffer_.resize(header.payload_size);
    
    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_payload_buffer_),
        [this, self, header](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }
            
            last_activity_ = std::chrono::steady_clock::now();
            
            if (!header.verify_checksum(read_payload_buffer_)) {
                LOG_ERROR("Checksum mismatch for {} from {}", to_string(header.type), remote_endpoint_);
                do_close();
                return;
            }
            
            handle_message(header, std::move(read_payload_buffer_));
            read_payload_buffer_ = {};
            do_read_header();
        });
}

void Connection::do_write() {
    if (write_queue_.empty() || write_in_progress_ || !is_open()) {
        return;
    }
    
    write_in_progress_ = true;
    auto& message = write_queue_.front();
    
    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(message.bytes),
        [this, self](boost::system::error_code ec, std::size_t) {
            write_in_progress_ = false;
            
            if (ec) {
                handle_error(ec);
                return;
            }
            
            auto type = write_queue_.front().type;
            write_queue_.pop();
            
            if (write_handler_) {
                write_handler_(type);
            }
            
            do_write();
        });
}

void Connection::do_close() {
    auto expected = ConnectionState::CONNECTED;
    if (!state_.compare_exchange_strong(expected, ConnectionState::CLOSING)) {
        return;
    }
    
    LOG_DEBUG("Closing connection to {}", remote_endpoint_);
    
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    
    std::queue<OutgoingMessage> empty;
    write_queue_.swap(empty);
    
    state_ = ConnectionState::DISCONNECTED;
    
    if (disconnect_handler_) {
        auto handler = std::move(disconnect_handler_);
        disconnect_handler_ = nullptr;
        handler(shared_from_this());
    }
}

void Connection::handle_message(const MessageHeader& header, std::vector<std::uint8_t> payload) {
    LOG_TRACE("Received {} ({} bytes) from {}", to_string(header.type), payload.size(), remote_endpoint_);
    
    if (message_handler_) {
        message_handler_(header, std::move(payload));
    }
}

void Connection::handle_error(const boost::system::error_code& error) {
    if (error == boost::asio::error::eof) {
        LOG_INFO("Connection to {} closed by peer", remote_endpoint_);
    } else if (error == boost::asio::error::operation_aborted) {
        LOG_DEBUG("Connection operation aborted for {}", remote_endpoint_);
    } else {
        LOG_ERROR("Connection error with {}: {}", remote_endpoint_, error.message());
        if (error_handler_ && is_open()) {
            error_handler_(error);
        }
    }
    
    do_close();
}

}
