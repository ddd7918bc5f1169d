#include "peerdrop/transfer/loopback_channel.hpp"
#include "peerdrop/core/logger.hpp"

namespace peerdrop::transfer {

LoopbackChannel::Pair LoopbackChannel::create_pair(boost::asio::io_context& io_context,
                                                   const std::string& first_id, const std::string& second_id) {
    auto first = std::make_shared<LoopbackChannel>(io_context, second_id);
    auto second = std::make_shared<LoopbackChannel>(io_context, first_id);
    
    first->peer_ = second;
    second->peer_ = first;
    first->open_ = true;
    second->open_ = true;
    first->raise_open();
    second->raise_open();
    
    return {first, second};
}

std::shared_ptr<LoopbackChannel> LoopbackChannel::create_unreachable(boost::asio::io_context& io_context,
                                                                     const std::string& remote_id,
                                                                     const std::string& reason) {
    auto channel = std::make_shared<LoopbackChannel>(io_context, remote_id);
    channel->raise_error(reason);
    channel->raise_close();
    return channel;
}

LoopbackChannel::LoopbackChannel(boost::asio::io_context& io_context, std::string remote_id)
    : BufferedChannel(io_context, std::move(remote_id))
    , delivery_(DeliveryGuarantee::ORDERED_RELIABLE)
    , sent_count_(0)
    , send_limit_(std::numeric_limits<std::size_t>::max()) {
}

bool LoopbackChannel::send(const ChannelMessage& message) {
    if (!open_ || sent_count_ >= send_limit_) {
        return false;
    }
    ++sent_count_;
    
    boost::asio::post(io_context_, [self = self(), peer = peer_.lock(), message]() {
        if (!self->open_) {
            return;
        }
        if (peer) {
            peer->raise_message(message);
        }
        self->raise_sent();
    });
    return true;
}

void LoopbackChannel::close() {
    if (!open_.exchange(false)) {
        return;
    }
    
    boost::asio::post(io_context_, [self = self(), peer = peer_.lock()]() {
        self->raise_close();
        if (peer) {
            peer->remote_closed();
        }
    });
}

void LoopbackChannel::inject_failure(const std::string& reason) {
    boost::asio::post(io_context_, [self = self(), reason]() {
        LOG_DEBUG("Injected failure on channel to {}: {}", self->remote_id(), reason);
        self->raise_error(reason);
        self->close();
    });
}

std::shared_ptr<LoopbackChannel> LoopbackChannel::self() {
    return std::static_pointer_cast<LoopbackChannel>(shared_from_this());
}

void LoopbackChannel::remote_closed() {
    open_ = false;
    raise_close();
}

LoopbackConnector::LoopbackConnector(boost::asio::io_context& io_context, std::string local_id)
    : io_context_(io_context)
    , local_id_(std::move(local_id)) {
}

void LoopbackConnector::add_listener(const std::string& identifier, AcceptHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_[identifier] = std::move(handler);
}

void LoopbackConnector::remove_listener(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(identifier);
}

std::shared_ptr<PeerChannel> LoopbackConnector::open(const std::string& target_id) {
    AcceptHandler accept;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listeners_.find(target_id);
        if (it != listeners_.end()) {
            accept = it->second;
        }
    }
    
    std::shared_ptr<LoopbackChannel> local;
    if (!accept) {
        local = LoopbackChannel::create_unreachable(io_context_, target_id, "No listener for " + target_id);
    } else {
        auto pair = LoopbackChannel::create_pair(io_context_, local_id_, target_id);
        local = pair.first;
        boost::asio::post(io_context_, [accept, remote = pair.second]() {
            accept(remote);
        });
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    channels_[target_id] = local;
    return local;
}

std::shared_ptr<LoopbackChannel> LoopbackConnector::get_channel(const std::string& target_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(target_id);
    return it != channels_.end() ? it->second : nullptr;
}

}
