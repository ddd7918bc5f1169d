#pragma once

#include "peerdrop/transfer/chunk_codec.hpp"
#include "peerdrop/transfer/peer_channel.hpp"
#include "peerdrop/transfer/transfer_result.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace peerdrop::transfer {

enum class TransferRole {
    SENDER,
    RECEIVER
};

enum class TransferPhase {
    IDLE,
    AWAITING_READY,
    AWAITING_ACK,
    STREAMING_METADATA,
    STREAMING_CHUNKS,
    COMPLETE,
    FAILED
};

const char* to_string(TransferRole role);
const char* to_string(TransferPhase phase);

struct TransferProgress {
    std::string session_id;
    std::string peer_id;
    TransferRole role;
    std::uint64_t bytes_transferred;
    std::uint64_t total_size;
    
    // A zero-byte transfer reports 100%.
    double percentage() const {
        return total_size == 0 ? 100.0 : 100.0 * static_cast<double>(bytes_transferred) / total_size;
    }
};

struct TransferCompletion {
    std::string session_id;
    std::string peer_id;
    TransferRole role;
    TransferMetadata metadata;
    std::vector<std::uint8_t> payload; // receiver only
    std::chrono::milliseconds duration;
};

struct TransferFailure {
    std::string session_id;
    TransferError error;
    std::string peer_id;
    TransferRole role;
    TransferPhase phase;
    std::uint64_t bytes_transferred;
    std::string message;
};

// One end of a single file transfer over one PeerChannel.
//
// The session is driven exclusively by its channel's callbacks (and by
// expire_if_stalled(), which must be dispatched onto the same context), so it
// carries no locking of its own. The channel must guarantee ordered, reliable
// delivery: chunks are sequenced purely by arrival order.
class TransferSession : public std::enable_shared_from_this<TransferSession> {
public:
    using ProgressHandler = std::function<void(const TransferProgress&)>;
    using CompletionHandler = std::function<void(const TransferCompletion&)>;
    using FailureHandler = std::function<void(const TransferFailure&)>;
    
    // Both factories throw std::invalid_argument for a null channel or one
    // that does not deliver in order.
    static std::shared_ptr<TransferSession> create_receiver(std::shared_ptr<PeerChannel> channel);
    static std::shared_ptr<TransferSession> create_sender(std::shared_ptr<PeerChannel> channel,
                                                          TransferMetadata metadata,
                                                          std::unique_ptr<storage::ByteSource> source,
                                                          std::size_t chunk_size = MAX_CHUNK_SIZE);
    
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;
    
    void set_progress_handler(ProgressHandler handler) { progress_handler_ = std::move(handler); }
    void set_completion_handler(CompletionHandler handler) { completion_handler_ = std::move(handler); }
    void set_failure_handler(FailureHandler handler) { failure_handler_ = std::move(handler); }
    
    // Attaches to the channel and starts it. Call once, after setting handlers.
    void start();
    
    // Channel events. Illegal messages for the current phase fail the session
    // and are reported back as PROTOCOL_VIOLATION.
    void handle_open();
    TransferResult handle_message(ChannelMessage message);
    void handle_sent();
    void handle_close();
    void handle_error(const std::string& error);
    
    // Fails the session with TIMEOUT when it has been stuck in a handshake
    // phase for longer than timeout. Returns true if it expired.
    bool expire_if_stalled(std::chrono::steady_clock::time_point now, std::chrono::milliseconds timeout);
    
    const std::string& get_session_id() const { return session_id_; }
    TransferRole get_role() const { return role_; }
    TransferPhase get_phase() const { return phase_.load(); }
    const std::string& get_peer_id() const { return peer_id_; }
    std::uint64_t get_bytes_transferred() const { return bytes_transferred_.load(); }
    std::uint64_t get_total_size() const { return total_size_.load(); }
    std::chrono::steady_clock::time_point get_start_time() const { return start_time_; }
    const std::optional<TransferMetadata>& get_metadata() const { return metadata_; }
    const std::optional<TransferFailure>& get_failure() const { return failure_; }
    std::shared_ptr<PeerChannel> get_channel() const { return channel_; }
    
    bool is_finished() const;
    bool in_handshake() const;

private:
    TransferSession(TransferRole role, std::shared_ptr<PeerChannel> channel);
    
    TransferResult handle_receiver_message(ChannelMessage& message);
    TransferResult handle_sender_message(ChannelMessage& message);
    
    void begin_stream();
    void send_next_chunk();
    bool send(const ChannelMessage& message);
    
    void complete(std::vector<std::uint8_t> payload);
    TransferResult fail(TransferError error, const std::string& message);
    TransferResult violation(const ChannelMessage& message);
    
    void set_phase(TransferPhase phase);
    void report_progress();
    
    static std::string generate_session_id();
    
    std::string session_id_;
    TransferRole role_;
    std::shared_ptr<PeerChannel> channel_;
    std::string peer_id_;
    
    std::atomic<TransferPhase> phase_;
    std::atomic<std::uint64_t> bytes_transferred_;
    std::atomic<std::uint64_t> total_size_;
    std::optional<TransferMetadata> metadata_;
    std::optional<TransferFailure> failure_;
    
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_activity_;
    bool started_;
    
    // Receiver
    ChunkAssembler assembler_;
    
    // Sender
    std::unique_ptr<ChunkSplitter> splitter_;
    std::size_t frames_in_flight_;
    std::uint64_t pending_chunk_bytes_;
    
    ProgressHandler progress_handler_;
    CompletionHandler completion_handler_;
    FailureHandler failure_handler_;
};

}
