#include "peerdrop/presence/presence_client.hpp"
#include "peerdrop/core/logger.hpp"
#include <algorithm>
#include <iterator>

namespace peerdrop::presence {

PresenceClient::~PresenceClient() {
    disconnect();
}

bool PresenceClient::connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
    client_.set_message_handler(
        [this](const network::MessageHeader& header, std::vector<std::uint8_t> payload) {
            handle_message(header, std::move(payload));
        });
    
    client_.set_disconnect_handler(
        [this](const std::string& endpoint) {
            LOG_INFO("Lost connection to signaling server {}", endpoint);
            update_cv_.notify_all();
            if (disconnect_handler_) {
                disconnect_handler_();
            }
        });
    
    if (!client_.connect(host, port, timeout)) {
        LOG_ERROR("Cannot reach signaling server at {}:{}", host, port);
        return false;
    }
    
    LOG_INFO("Connected to signaling server {}", client_.get_remote_endpoint());
    return true;
}

void PresenceClient::disconnect() {
    client_.disconnect();
}

bool PresenceClient::register_identifier(const std::string& identifier) {
    if (identifier.empty()) {
        LOG_ERROR("Refusing to register an empty identifier");
        return false;
    }
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        identifier_ = identifier;
    }
    
    LOG_INFO("Registering as {}", identifier);
    return client_.send_message(network::MessageType::REGISTER, network::RegisterMessage{identifier});
}

bool PresenceClient::query_peers() {
    return client_.send_message(network::MessageType::QUERY_PEERS, network::QueryPeersMessage{});
}

std::optional<PeerSet> PresenceClient::query_and_wait(std::chrono::milliseconds timeout) {
    std::uint64_t seen = get_update_count();
    
    if (!query_peers()) {
        return std::nullopt;
    }
    
    std::unique_lock<std::mutex> lock(mutex_);
    bool updated = update_cv_.wait_for(lock, timeout, [this, seen]() {
        return update_count_ > seen || !client_.is_connected();
    });
    
    if (!updated || update_count_ <= seen) {
        return std::nullopt;
    }
    return peers_;
}

bool PresenceClient::wait_for_peer(const std::string& identifier, bool present, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return update_cv_.wait_for(lock, timeout, [this, &identifier, present]() {
        return (peers_.count(identifier) > 0) == present;
    });
}

PeerSet PresenceClient::peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_;
}

PeerSet PresenceClient::peers_excluding_self() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PeerSet result = peers_;
    result.erase(identifier_);
    return result;
}

std::string PresenceClient::get_identifier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return identifier_;
}

std::uint64_t PresenceClient::get_update_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return update_count_;
}

void PresenceClient::handle_message(const network::MessageHeader& header, std::vector<std::uint8_t> payload) {
    try {
        switch (header.type) {
            case network::MessageType::PRESENCE_UPDATE:
                handle_update(network::PresenceUpdateMessage::deserialize(payload));
                break;
                
            case network::MessageType::SIGNAL_ERROR: {
                auto error = network::ErrorMessage::deserialize(payload);
                LOG_WARN("Signaling error {}: {}", error.error_code, error.error_message);
                if (error_handler_) {
                    error_handler_(error.error_code, error.error_message);
                }
                break;
            }
            
            default:
                LOG_WARN("Unexpected {} from signaling server", network::to_string(header.type));
                break;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Malformed {} from signaling server: {}", network::to_string(header.type), e.what());
    }
}

void PresenceClient::handle_update(const network::PresenceUpdateMessage& update) {
    PeerSet current(update.identifiers.begin(), update.identifiers.end());
    std::vector<std::string> joined;
    std::vector<std::string> left;
    PeerSet visible;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::set_difference(current.begin(), current.end(), peers_.begin(), peers_.end(),
                            std::back_inserter(joined));
        std::set_difference(peers_.begin(), peers_.end(), current.begin(), current.end(),
                            std::back_inserter(left));
        
        std::erase(joined, identifier_);
        std::erase(left, identifier_);
        
        peers_ = std::move(current);
        ++update_count_;
        
        visible = peers_;
        visible.erase(identifier_);
    }
    update_cv_.notify_all();
    
    LOG_DEBUG("Presence update: {} peer(s), {} joined, {} left", visible.size(), joined.size(), left.size());
    
    for (const auto& id : joined) {
        if (joined_handler_) joined_handler_(id);
    }
    for (const auto& id : left) {
        if (left_handler_) left_handler_(id);
    }
    if (peers_handler_) {
        peers_handler_(visible);
    }
}

}
