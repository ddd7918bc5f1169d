#pragma once

#include "peerdrop/network/connection.hpp"
#include <functional>
#include <memory>
#include <unordered_map>

namespace peerdrop::network {

// Routes framed messages to typed handlers by MessageType.
class MessageHandler {
public:
    using RawHandler = std::function<void(std::shared_ptr<Connection>, std::span<const std::uint8_t>)>;
    using FallbackHandler = std::function<void(std::shared_ptr<Connection>, const MessageHeader&)>;
    
    template<MessagePayload T>
    void register_handler(MessageType type, std::function<void(std::shared_ptr<Connection>, const T&)> handler) {
        handlers_[type] = [handler = std::move(handler)](std::shared_ptr<Connection> connection,
                                                         std::span<const std::uint8_t> payload) {
            handler(std::move(connection), T::deserialize(payload));
        };
    }
    
    void register_raw_handler(MessageType type, RawHandler handler) {
        handlers_[type] = std::move(handler);
    }
    
    // Invoked for unregistered types and for payloads that fail to decode.
    void set_fallback_handler(FallbackHandler handler) { fallback_ = std::move(handler); }
    
    bool handle_message(std::shared_ptr<Connection> connection, const MessageHeader& header,
                        std::span<const std::uint8_t> payload);
    
    bool has_handler(MessageType type) const { return handlers_.count(type) > 0; }

private:
    std::unordered_map<MessageType, RawHandler> handlers_;
    FallbackHandler fallback_;
};

}
