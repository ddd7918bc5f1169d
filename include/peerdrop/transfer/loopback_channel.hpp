#pragma once

#include "peerdrop/transfer/buffered_channel.hpp"
#include <limits>
#include <mutex>
#include <unordered_map>

namespace peerdrop::transfer {

// In-process channel pair. Both ends raise their events on the same
// io_context, so whoever runs that context drives both sessions.
class LoopbackChannel : public BufferedChannel {
public:
    using Pair = std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>;
    
    // first->remote_id() == second_id and second->remote_id() == first_id.
    static Pair create_pair(boost::asio::io_context& io_context,
                            const std::string& first_id, const std::string& second_id);
    
    // An end that never opens and reports error then close once started.
    static std::shared_ptr<LoopbackChannel> create_unreachable(boost::asio::io_context& io_context,
                                                               const std::string& remote_id,
                                                               const std::string& reason);
    
    LoopbackChannel(boost::asio::io_context& io_context, std::string remote_id);
    
    DeliveryGuarantee delivery() const override { return delivery_; }
    
    bool send(const ChannelMessage& message) override;
    void close() override;
    
    // Simulates a transport failure: error on this end, then both ends close.
    void inject_failure(const std::string& reason);
    
    // Rejects sends once this many messages went through.
    void fail_after_sends(std::size_t count) { send_limit_ = count; }
    void set_delivery(DeliveryGuarantee delivery) { delivery_ = delivery; }
    
    std::size_t get_sent_count() const { return sent_count_.load(); }

private:
    std::shared_ptr<LoopbackChannel> self();
    void remote_closed();
    
    DeliveryGuarantee delivery_;
    std::weak_ptr<LoopbackChannel> peer_;
    std::atomic<std::size_t> sent_count_;
    std::atomic<std::size_t> send_limit_;
};

// Connector over LoopbackChannel pairs. Listeners register an accept callback
// under an identifier; open() pairs the caller with that listener.
class LoopbackConnector : public ChannelConnector {
public:
    using AcceptHandler = std::function<void(std::shared_ptr<PeerChannel>)>;
    
    LoopbackConnector(boost::asio::io_context& io_context, std::string local_id);
    
    void add_listener(const std::string& identifier, AcceptHandler handler);
    void remove_listener(const std::string& identifier);
    
    std::shared_ptr<PeerChannel> open(const std::string& target_id) override;
    
    // Most recently opened local end per target.
    std::shared_ptr<LoopbackChannel> get_channel(const std::string& target_id) const;

private:
    boost::asio::io_context& io_context_;
    std::string local_id_;
    
    mutable std::mutex mutex_;
    std::unordered_map<std::string, AcceptHandler> listeners_;
    std::unordered_map<std::string, std::shared_ptr<LoopbackChannel>> channels_;
};

}
