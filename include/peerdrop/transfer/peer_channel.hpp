#pragma once

#include "peerdrop/transfer/channel_message.hpp"
#include <functional>
#include <memory>
#include <string>

namespace peerdrop::transfer {

enum class DeliveryGuarantee {
    ORDERED_RELIABLE,
    UNORDERED
};

// Point-to-point message channel between two endpoints.
//
// Handlers are attached first, then start() is called; events that happened
// earlier (open, data, close) are replayed at that point. Handlers are invoked
// from the channel's own event context, one at a time. The sent handler fires
// once per message after it has been handed to the transport, in send order.
class PeerChannel {
public:
    using OpenHandler = std::function<void()>;
    using MessageHandler = std::function<void(ChannelMessage)>;
    using SentHandler = std::function<void()>;
    using CloseHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;
    
    virtual ~PeerChannel() = default;
    
    virtual const std::string& remote_id() const = 0;
    virtual DeliveryGuarantee delivery() const = 0;
    virtual bool is_open() const = 0;
    
    virtual void start() = 0;
    
    // Returns false when the channel is not open; nothing is queued then.
    virtual bool send(const ChannelMessage& message) = 0;
    virtual void close() = 0;
    
    // Runs task on the channel's event context.
    virtual void dispatch(std::function<void()> task) = 0;
    
    void set_open_handler(OpenHandler handler) { open_handler_ = std::move(handler); }
    void set_message_handler(MessageHandler handler) { message_handler_ = std::move(handler); }
    void set_sent_handler(SentHandler handler) { sent_handler_ = std::move(handler); }
    void set_close_handler(CloseHandler handler) { close_handler_ = std::move(handler); }
    void set_error_handler(ErrorHandler handler) { error_handler_ = std::move(handler); }
    
    void clear_handlers() {
        open_handler_ = nullptr;
        message_handler_ = nullptr;
        sent_handler_ = nullptr;
        close_handler_ = nullptr;
        error_handler_ = nullptr;
    }

protected:
    void notify_open() { if (open_handler_) open_handler_(); }
    void notify_message(ChannelMessage message) { if (message_handler_) message_handler_(std::move(message)); }
    void notify_sent() { if (sent_handler_) sent_handler_(); }
    void notify_close() { if (close_handler_) close_handler_(); }
    void notify_error(const std::string& error) { if (error_handler_) error_handler_(error); }

private:
    OpenHandler open_handler_;
    MessageHandler message_handler_;
    SentHandler sent_handler_;
    CloseHandler close_handler_;
    ErrorHandler error_handler_;
};

// Establishes outgoing channels. The returned channel reports open (or
// error/close) asynchronously through its handlers.
class ChannelConnector {
public:
    virtual ~ChannelConnector() = default;
    
    virtual std::shared_ptr<PeerChannel> open(const std::string& target_id) = 0;
};

}
