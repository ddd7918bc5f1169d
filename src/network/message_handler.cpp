#include "peerdrop/network/message_handler.hpp"
#include "peerdrop/core/logger.hpp"

namespace peerdrop::network {

bool MessageHandler::handle_message(std::shared_ptr<Connection> connection, const MessageHeader& header,
                                    std::span<const std::uint8_t> payload) {
    std::string endpoint = connection ? connection->get_remote_endpoint() : std::string("local");
    
    auto it = handlers_.find(header.type);
    if (it == handlers_.end()) {
        LOG_WARN("No handler registered for {} from {}", to_string(header.type), endpoint);
        if (fallback_) {
            fallback_(connection, header);
        }
        return false;
    }
    
    try {
        it->second(connection, payload);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Error handling {} from {}: {}", to_string(header.type), endpoint, e.what());
        if (fallback_) {
            fallback_(connection, header);
        }
        return false;
    }
}

}
