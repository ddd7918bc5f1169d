#pragma once

#include "peerdrop/network/tcp_client.hpp"
#include "peerdrop/presence/presence_registry.hpp"
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace peerdrop::presence {

// Client side of the signaling service. Keeps the most recent full presence
// view and derives join/leave events from successive views. Its own
// identifier is removed from everything it reports except peers().
class PresenceClient {
public:
    using PeersHandler = std::function<void(const PeerSet& peers)>;
    using PeerEventHandler = std::function<void(const std::string& identifier)>;
    using ErrorHandler = std::function<void(std::uint32_t code, const std::string& message)>;
    using DisconnectHandler = std::function<void()>;
    
    PresenceClient() = default;
    ~PresenceClient();
    
    PresenceClient(const PresenceClient&) = delete;
    PresenceClient& operator=(const PresenceClient&) = delete;
    
    bool connect(const std::string& host, std::uint16_t port,
                 std::chrono::milliseconds timeout = std::chrono::seconds(5));
    void disconnect();
    bool is_connected() const { return client_.is_connected(); }
    
    bool register_identifier(const std::string& identifier);
    bool query_peers();
    
    // Sends a query and waits for the next presence view.
    std::optional<PeerSet> query_and_wait(std::chrono::milliseconds timeout);
    
    // Waits until the view contains (or no longer contains) identifier.
    bool wait_for_peer(const std::string& identifier, bool present, std::chrono::milliseconds timeout);
    
    PeerSet peers() const;
    PeerSet peers_excluding_self() const;
    std::string get_identifier() const;
    std::uint64_t get_update_count() const;
    
    // Handlers run on the client's I/O thread. Set them before connect().
    void set_peers_handler(PeersHandler handler) { peers_handler_ = std::move(handler); }
    void set_peer_joined_handler(PeerEventHandler handler) { joined_handler_ = std::move(handler); }
    void set_peer_left_handler(PeerEventHandler handler) { left_handler_ = std::move(handler); }
    void set_error_handler(ErrorHandler handler) { error_handler_ = std::move(handler); }
    void set_disconnect_handler(DisconnectHandler handler) { disconnect_handler_ = std::move(handler); }

private:
    void handle_message(const network::MessageHeader& header, std::vector<std::uint8_t> payload);
    void handle_update(const network::PresenceUpdateMessage& update);
    
    mutable std::mutex mutex_;
    std::condition_variable update_cv_;
    PeerSet peers_;
    std::string identifier_;
    std::uint64_t update_count_ = 0;
    
    PeersHandler peers_handler_;
    PeerEventHandler joined_handler_;
    PeerEventHandler left_handler_;
    ErrorHandler error_handler_;
    DisconnectHandler disconnect_handler_;
    
    // Declared last: its I/O thread is joined before the state above goes away.
    network::TcpClient client_;
};

}
