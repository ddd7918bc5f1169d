#include "peerdrop/transfer/buffered_channel.hpp"

namespace peerdrop::transfer {

BufferedChannel::BufferedChannel(boost::asio::io_context& io_context, std::string remote_id)
    : io_context_(io_context)
    , open_(false)
    , remote_id_(std::move(remote_id))
    , started_(false)
    , close_raised_(false) {
}

void BufferedChannel::start() {
    auto self = shared_from_this();
    boost::asio::post(io_context_, [self]() {
        if (self->started_) {
            return;
        }
        self->started_ = true;
        
        while (!self->backlog_.empty()) {
            auto event = std::move(self->backlog_.front());
            self->backlog_.pop_front();
            self->handle_event(event);
        }
    });
}

void BufferedChannel::dispatch(std::function<void()> task) {
    boost::asio::post(io_context_, std::move(task));
}

void BufferedChannel::raise_open() {
    raise(PendingEvent{Event::OPEN, ReadySignal{}, {}});
}

void BufferedChannel::raise_message(ChannelMessage message) {
    raise(PendingEvent{Event::MESSAGE, std::move(message), {}});
}

void BufferedChannel::raise_sent() {
    raise(PendingEvent{Event::SENT, ReadySignal{}, {}});
}

void BufferedChannel::raise_error(const std::string& error) {
    raise(PendingEvent{Event::FAILURE, ReadySignal{}, error});
}

void BufferedChannel::raise_close() {
    raise(PendingEvent{Event::CLOSE, ReadySignal{}, {}});
}

void BufferedChannel::raise(PendingEvent event) {
    if (!started_) {
        backlog_.push_back(std::move(event));
        return;
    }
    handle_event(event);
}

void BufferedChannel::handle_event(PendingEvent& event) {
    if (close_raised_) {
        return;
    }
    
    switch (event.event) {
        case Event::OPEN:
            if (open_) {
                notify_open();
            }
            break;
        case Event::MESSAGE:
            notify_message(std::move(event.message));
            break;
        case Event::SENT:
            notify_sent();
            break;
        case Event::FAILURE:
            notify_error(event.error);
            break;
        case Event::CLOSE:
            close_raised_ = true;
            notify_close();
            break;
    }
}

}
