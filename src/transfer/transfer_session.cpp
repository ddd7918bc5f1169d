#include "peerdrop/transfer/transfer_session.hpp"
#include "peerdrop/core/logger.hpp"
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>

namespace peerdrop::transfer {

const char* to_string(TransferRole role) {
    switch (role) {
        case TransferRole::SENDER: return "sender";
        case TransferRole::RECEIVER: return "receiver";
    }
    return "unknown";
}

const char* to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::IDLE: return "idle";
        case TransferPhase::AWAITING_READY: return "awaiting-ready";
        case TransferPhase::AWAITING_ACK: return "awaiting-ack";
        case TransferPhase::STREAMING_METADATA: return "streaming-metadata";
        case TransferPhase::STREAMING_CHUNKS: return "streaming-chunks";
        case TransferPhase::COMPLETE: return "complete";
        case TransferPhase::FAILED: return "failed";
    }
    return "unknown";
}

std::shared_ptr<TransferSession> TransferSession::create_receiver(std::shared_ptr<PeerChannel> channel) {
    return std::shared_ptr<TransferSession>(new TransferSession(TransferRole::RECEIVER, std::move(channel)));
}

std::shared_ptr<TransferSession> TransferSession::create_sender(std::shared_ptr<PeerChannel> channel,
                                                                TransferMetadata metadata,
                                                                std::unique_ptr<storage::ByteSource> source,
                                                                std::size_t chunk_size) {
    if (chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE) {
        throw std::invalid_argument("Chunk size must be within 1.." + std::to_string(MAX_CHUNK_SIZE));
    }
    
    std::shared_ptr<TransferSession> session(new TransferSession(TransferRole::SENDER, std::move(channel)));
    session->total_size_ = metadata.total_size;
    session->metadata_ = std::move(metadata);
    session->splitter_ = std::make_unique<ChunkSplitter>(std::move(source), chunk_size);
    return session;
}

TransferSession::TransferSession(TransferRole role, std::shared_ptr<PeerChannel> channel)
    : session_id_(generate_session_id())
    , role_(role)
    , channel_(std::move(channel))
    , phase_(TransferPhase::IDLE)
    , bytes_transferred_(0)
    , total_size_(0)
    , start_time_(std::chrono::steady_clock::now())
    , last_activity_(start_time_)
    , started_(false)
    , frames_in_flight_(0)
    , pending_chunk_bytes_(0) {
    
    if (!channel_) {
        throw std::invalid_argument("Transfer session requires a channel");
    }
    if (channel_->delivery() != DeliveryGuarantee::ORDERED_RELIABLE) {
        throw std::invalid_argument("Transfer session requires an ordered, reliable channel");
    }
    
    peer_id_ = channel_->remote_id();
}

void TransferSession::start() {
    if (started_) {
        return;
    }
    started_ = true;
    
    std::weak_ptr<TransferSession> weak_self = shared_from_this();
    
    channel_->set_open_handler([weak_self]() {
        if (auto self = weak_self.lock()) self->handle_open();
    });
    channel_->set_message_handler([weak_self](ChannelMessage message) {
        if (auto self = weak_self.lock()) self->handle_message(std::move(message));
    });
    channel_->set_sent_handler([weak_self]() {
        if (auto self = weak_self.lock()) self->handle_sent();
    });
    channel_->set_close_handler([weak_self]() {
        if (auto self = weak_self.lock()) self->handle_close();
    });
    channel_->set_error_handler([weak_self](const std::string& error) {
        if (auto self = weak_self.lock()) self->handle_error(error);
    });
    
    LOG_DEBUG("Session {} started as {} with {}", session_id_, to_string(role_), peer_id_);
    channel_->start();
}

void TransferSession::handle_open() {
    last_activity_ = std::chrono::steady_clock::now();
    
    if (phase_ != TransferPhase::IDLE) {
        return;
    }
    
    if (role_ == TransferRole::RECEIVER) {
        if (!send(ReadySignal{})) {
            fail(TransferError::CHANNEL_FAILURE, "Could not send ready");
            return;
        }
        set_phase(TransferPhase::AWAITING_READY);
    } else {
        set_phase(TransferPhase::AWAITING_ACK);
    }
}

TransferResult TransferSession::handle_message(ChannelMessage message) {
    last_activity_ = std::chrono::steady_clock::now();
    
    if (is_finished()) {
        LOG_DEBUG("Session {} ignoring {} after {}", session_id_, message_name(message), to_string(get_phase()));
        return TransferResult(TransferError::INVALID_STATE, "Session already finished");
    }
    
    return role_ == TransferRole::RECEIVER ? handle_receiver_message(message)
                                           : handle_sender_message(message);
}

TransferResult TransferSession::handle_receiver_message(ChannelMessage& message) {
    TransferPhase phase = get_phase();
    
    if (std::holds_alternative<ReadyAckSignal>(message)) {
        if (phase == TransferPhase::AWAITING_READY) {
            set_phase(TransferPhase::STREAMING_METADATA);
            return TransferResult();
        }
        if (phase == TransferPhase::STREAMING_METADATA || phase == TransferPhase::STREAMING_CHUNKS) {
            return TransferResult();
        }
        return violation(message);
    }
    
    if (auto* metadata = std::get_if<TransferMetadata>(&message)) {
        if (phase != TransferPhase::STREAMING_METADATA) {
            return violation(message);
        }
        
        LOG_INFO("Receiving {} ({}, {} bytes) from {}", metadata->file_name, metadata->mime_type,
                 metadata->total_size, peer_id_);
        
        total_size_ = metadata->total_size;
        bytes_transferred_ = 0;
        assembler_.reset();
        metadata_ = std::move(*metadata);
        set_phase(TransferPhase::STREAMING_CHUNKS);
        report_progress();
        
        if (metadata_->total_size == 0) {
            complete({});
        }
        return TransferResult();
    }
    
    if (auto* chunk = std::get_if<RawChunk>(&message)) {
        if (phase != TransferPhase::STREAMING_CHUNKS) {
            return violation(message);
        }
        
        std::uint64_t total = metadata_->total_size;
        std::uint64_t received = bytes_transferred_ + chunk->bytes.size();
        if (received > total) {
            return fail(TransferError::SIZE_MISMATCH,
                        "Chunk overruns declared size: " + std::to_string(received) + " > " +
                        std::to_string(total));
        }
        
        assembler_.append(std::move(chunk->bytes));
        bytes_transferred_ = received;
        report_progress();
        
        if (received >= total) {
            std::vector<std::uint8_t> payload;
            auto result = assembler_.reassemble(total, payload);
            if (!result) {
                return fail(result.error, result.message);
            }
            assembler_.reset();
            complete(std::move(payload));
        }
        return TransferResult();
    }
    
    // A receiver is never sent ready.
    return violation(message);
}

TransferResult TransferSession::handle_sender_message(ChannelMessage& message) {
    if (!std::holds_alternative<ReadySignal>(message)) {
        return violation(message);
    }
    
    TransferPhase phase = get_phase();
    if (phase == TransferPhase::IDLE) {
        // Data implies the channel is open even if the open event was missed.
        handle_open();
        phase = get_phase();
    }
    
    if (phase != TransferPhase::AWAITING_ACK) {
        LOG_DEBUG("Session {} ignoring duplicate ready from {}", session_id_, peer_id_);
        return TransferResult();
    }
    
    begin_stream();
    return TransferResult();
}

void TransferSession::begin_stream() {
    LOG_INFO("Sending {} ({} bytes) to {}", metadata_->file_name, metadata_->total_size, peer_id_);
    
    if (!send(ReadyAckSignal{})) {
        fail(TransferError::CHANNEL_FAILURE, "Could not send ready-ack");
        return;
    }
    if (!send(*metadata_)) {
        fail(TransferError::CHANNEL_FAILURE, "Could not send metadata");
        return;
    }
    
    set_phase(TransferPhase::STREAMING_METADATA);
}

void TransferSession::handle_sent() {
    last_activity_ = std::chrono::steady_clock::now();
    
    if (role_ != TransferRole::SENDER || is_finished()) {
        return;
    }
    
    if (frames_in_flight_ > 0) {
        --frames_in_flight_;
    }
    if (frames_in_flight_ > 0) {
        return;
    }
    
    TransferPhase phase = get_phase();
    if (phase == TransferPhase::STREAMING_METADATA) {
        set_phase(TransferPhase::STREAMING_CHUNKS);
        report_progress();
        send_next_chunk();
    } else if (phase == TransferPhase::STREAMING_CHUNKS) {
        bytes_transferred_ += pending_chunk_bytes_;
        pending_chunk_bytes_ = 0;
        report_progress();
        send_next_chunk();
    }
}

void TransferSession::send_next_chunk() {
    std::optional<std::vector<std::uint8_t>> chunk;
    try {
        chunk = splitter_->next();
    } catch (const std::exception& e) {
        fail(TransferError::SOURCE_READ_ERROR, e.what());
        return;
    }
    
    std::uint64_t total = metadata_->total_size;
    std::uint64_t sent = bytes_transferred_;
    
    if (!chunk) {
        if (sent != total) {
            fail(TransferError::SIZE_MISMATCH,
                 "Source ended after " + std::to_string(sent) + " of " + std::to_string(total) + " bytes");
            return;
        }
        complete({});
        return;
    }
    
    if (sent + chunk->size() > total) {
        fail(TransferError::SIZE_MISMATCH, "Source is longer than the declared " + std::to_string(total) + " bytes");
        return;
    }
    
    pending_chunk_bytes_ = chunk->size();
    if (!send(RawChunk{std::move(*chunk)})) {
        pending_chunk_bytes_ = 0;
        fail(TransferError::CHANNEL_FAILURE, "Channel rejected chunk");
    }
}

void TransferSession::handle_close() {
    last_activity_ = std::chrono::steady_clock::now();
    
    if (is_finished()) {
        return;
    }
    fail(TransferError::CHANNEL_FAILURE, "Channel closed");
}

void TransferSession::handle_error(const std::string& error) {
    last_activity_ = std::chrono::steady_clock::now();
    
    if (is_finished()) {
        return;
    }
    fail(TransferError::CHANNEL_FAILURE, error);
}

bool TransferSession::expire_if_stalled(std::chrono::steady_clock::time_point now,
                                        std::chrono::milliseconds timeout) {
    if (!in_handshake() || now - last_activity_ < timeout) {
        return false;
    }
    
    fail(TransferError::TIMEOUT, std::string("No progress while ") + to_string(get_phase()));
    return true;
}

bool TransferSession::is_finished() const {
    auto phase = get_phase();
    return phase == TransferPhase::COMPLETE || phase == TransferPhase::FAILED;
}

bool TransferSession::in_handshake() const {
    switch (get_phase()) {
        case TransferPhase::IDLE:
        case TransferPhase::AWAITING_READY:
        case TransferPhase::AWAITING_ACK:
        case TransferPhase::STREAMING_METADATA:
            return true;
        default:
            return false;
    }
}

bool TransferSession::send(const ChannelMessage& message) {
    if (!channel_->send(message)) {
        return false;
    }
    ++frames_in_flight_;
    return true;
}

void TransferSession::complete(std::vector<std::uint8_t> payload) {
    set_phase(TransferPhase::COMPLETE);
    
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
    LOG_INFO("Session {} complete: {} {} bytes with {} in {} ms", session_id_,
             role_ == TransferRole::SENDER ? "sent" : "received",
             bytes_transferred_.load(), peer_id_, duration.count());
    
    if (completion_handler_) {
        completion_handler_(TransferCompletion{session_id_, peer_id_, role_, *metadata_, std::move(payload), duration});
    }
    
    if (role_ == TransferRole::SENDER) {
        channel_->close();
    }
}

TransferResult TransferSession::fail(TransferError error, const std::string& message) {
    if (is_finished()) {
        return TransferResult(error, message);
    }
    
    TransferPhase phase = get_phase();
    failure_ = TransferFailure{session_id_, error, peer_id_, role_, phase, bytes_transferred_.load(), message};
    set_phase(TransferPhase::FAILED);
    
    LOG_ERROR("Session {} ({} with {}) failed in {}: {}: {} [{} bytes transferred]", session_id_,
              to_string(role_), peer_id_, to_string(phase), to_string(error), message, failure_->bytes_transferred);
    
    if (failure_handler_) {
        failure_handler_(*failure_);
    }
    
    channel_->close();
    return TransferResult(error, message);
}

TransferResult TransferSession::violation(const ChannelMessage& message) {
    return fail(TransferError::PROTOCOL_VIOLATION,
                std::string("Unexpected ") + message_name(message) + " while " + to_string(get_phase()));
}

void TransferSession::set_phase(TransferPhase phase) {
    LOG_TRACE("Session {}: {} -> {}", session_id_, to_string(get_phase()), to_string(phase));
    phase_ = phase;
}

void TransferSession::report_progress() {
    if (progress_handler_) {
        progress_handler_(TransferProgress{session_id_, peer_id_, role_, bytes_transferred_.load(), total_size_.load()});
    }
}

std::string TransferSession::generate_session_id() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<std::uint32_t> dis(0, UINT32_MAX);
    static std::mutex mutex;
    
    std::lock_guard<std::mutex> lock(mutex);
    std::ostringstream oss;
    oss << "session_" << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
    return oss.str();
}

}
