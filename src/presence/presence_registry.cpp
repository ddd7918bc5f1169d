#include "peerdrop/presence/presence_registry.hpp"
#include "peerdrop/core/logger.hpp"

namespace peerdrop::presence {

bool PresenceRegistry::register_peer(const std::string& identifier, ConnectionHandle handle) {
    if (identifier.empty() || !handle) {
        LOG_WARN("Rejected registration with empty identifier or handle");
        return false;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto previous = identifiers_by_handle_.find(handle.get());
    if (previous != identifiers_by_handle_.end() && previous->second != identifier) {
        LOG_INFO("{} re-registered: '{}' -> '{}'", handle->describe(), previous->second, identifier);
        records_.erase(previous->second);
    }
    
    auto existing = records_.find(identifier);
    if (existing != records_.end() && existing->second != handle) {
        LOG_INFO("Identifier '{}' taken over by {} (was {})", identifier,
                 handle->describe(), existing->second->describe());
        identifiers_by_handle_.erase(existing->second.get());
    }
    
    records_[identifier] = handle;
    identifiers_by_handle_[handle.get()] = identifier;
    
    LOG_INFO("Registered '{}' for {} ({} online)", identifier, handle->describe(), records_.size());
    broadcast_locked();
    return true;
}

bool PresenceRegistry::deregister(const ConnectionHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    bool removed = false;
    if (handle) {
        auto it = identifiers_by_handle_.find(handle.get());
        if (it != identifiers_by_handle_.end()) {
            LOG_INFO("Deregistered '{}' ({})", it->second, handle->describe());
            records_.erase(it->second);
            identifiers_by_handle_.erase(it);
            removed = true;
        } else {
            LOG_DEBUG("Deregister for unregistered {}", handle->describe());
        }
    }
    
    broadcast_locked();
    return removed;
}

PeerSet PresenceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

std::optional<std::string> PresenceRegistry::identifier_for(const ConnectionHandle& handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = identifiers_by_handle_.find(handle.get());
    if (it == identifiers_by_handle_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t PresenceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

std::uint64_t PresenceRegistry::get_broadcast_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return broadcast_count_;
}

std::uint64_t PresenceRegistry::get_failed_delivery_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_deliveries_;
}

BroadcastReport PresenceRegistry::get_last_broadcast() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_broadcast_;
}

PeerSet PresenceRegistry::snapshot_locked() const {
    PeerSet peers;
    for (const auto& [identifier, handle] : records_) {
        peers.insert(identifier);
    }
    return peers;
}

void PresenceRegistry::broadcast_locked() {
    auto peers = snapshot_locked();
    BroadcastReport report;
    report.recipients = records_.size();
    
    for (const auto& [identifier, handle] : records_) {
        bool delivered = false;
        try {
            delivered = handle->send_presence(peers);
        } catch (const std::exception& e) {
            LOG_WARN("Presence update to '{}' threw: {}", identifier, e.what());
        }
        
        if (delivered) {
            report.delivered++;
        } else {
            report.failed++;
            LOG_WARN("Presence update to '{}' ({}) not delivered", identifier, handle->describe());
        }
    }
    
    broadcast_count_++;
    failed_deliveries_ += report.failed;
    last_broadcast_ = report;
    
    LOG_DEBUG("Broadcast #{}: {} peers to {} connections ({} failed)",
              broadcast_count_, peers.size(), report.recipients, report.failed);
}

}
