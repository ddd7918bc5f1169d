#pragma once

#include "peerdrop/transfer/peer_channel.hpp"
#include <utility>  // std::exchange, used by boost/asio/awaitable.hpp (Boost 1.74)
#include <boost/asio.hpp>
#include <atomic>
#include <deque>

namespace peerdrop::transfer {

// PeerChannel whose events are raised on a boost::asio::io_context and held
// back until start() so that no event is lost before handlers are attached.
class BufferedChannel : public PeerChannel, public std::enable_shared_from_this<BufferedChannel> {
public:
    BufferedChannel(boost::asio::io_context& io_context, std::string remote_id);
    
    const std::string& remote_id() const override { return remote_id_; }
    DeliveryGuarantee delivery() const override { return DeliveryGuarantee::ORDERED_RELIABLE; }
    bool is_open() const override { return open_.load(); }
    
    void start() override;
    void dispatch(std::function<void()> task) override;
    
    boost::asio::io_context& get_io_context() { return io_context_; }

protected:
    // Must run on the io_context, or before the channel is shared.
    void raise_open();
    void raise_message(ChannelMessage message);
    void raise_sent();
    void raise_error(const std::string& error);
    void raise_close();
    
    boost::asio::io_context& io_context_;
    std::atomic<bool> open_;

private:
    enum class Event { OPEN, MESSAGE, SENT, FAILURE, CLOSE };
    
    struct PendingEvent {
        Event event;
        ChannelMessage message;
        std::string error;
    };
    
    void raise(PendingEvent event);
    void handle_event(PendingEvent& event);
    
    std::string remote_id_;
    bool started_;
    bool close_raised_;
    std::deque<PendingEvent> backlog_;
};

}
