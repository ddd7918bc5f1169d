#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace peerdrop::presence {

using PeerSet = std::set<std::string>;

// A registered connection as seen by the registry.
class PresenceEndpoint {
public:
    virtual ~PresenceEndpoint() = default;
    
    // Hands the full membership set to the transport. Returns false (or throws)
    // when the connection can no longer be written to.
    virtual bool send_presence(const PeerSet& peers) = 0;
    virtual std::string describe() const = 0;
};

using ConnectionHandle = std::shared_ptr<PresenceEndpoint>;

struct BroadcastReport {
    std::size_t recipients = 0;
    std::size_t delivered = 0;
    std::size_t failed = 0;
};

// Process-wide map of endpoint identifier -> connection handle.
//
// Every register/deregister call is followed by a broadcast of the complete
// identifier set to every registered connection, performed under the same
// lock as the mutation so no broadcast observes a half-applied change.
// The registry never filters a receiver's own identifier out of the set.
class PresenceRegistry {
public:
    PresenceRegistry() = default;
    
    PresenceRegistry(const PresenceRegistry&) = delete;
    PresenceRegistry& operator=(const PresenceRegistry&) = delete;
    
    // Upserts the record for identifier (last writer wins). A handle holds at
    // most one identifier, so re-registering a handle under a new name drops
    // its previous record. Returns false without broadcasting for an empty
    // identifier or null handle.
    bool register_peer(const std::string& identifier, ConnectionHandle handle);
    
    // Removes the record owned by handle, if any, then broadcasts.
    // Returns true when a record was removed.
    bool deregister(const ConnectionHandle& handle);
    
    PeerSet snapshot() const;
    std::optional<std::string> identifier_for(const ConnectionHandle& handle) const;
    std::size_t size() const;
    
    std::uint64_t get_broadcast_count() const;
    std::uint64_t get_failed_delivery_count() const;
    BroadcastReport get_last_broadcast() const;

private:
    PeerSet snapshot_locked() const;
    void broadcast_locked();
    
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConnectionHandle> records_;
    std::unordered_map<const PresenceEndpoint*, std::string> identifiers_by_handle_;
    
    std::uint64_t broadcast_count_ = 0;
    std::uint64_t failed_deliveries_ = 0;
    BroadcastReport last_broadcast_;
};

}
