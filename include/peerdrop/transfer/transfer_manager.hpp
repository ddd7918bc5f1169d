#pragma once

#include "peerdrop/transfer/transfer_session.hpp"
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerdrop::transfer {

struct TransferSessionStats {
    std::string session_id;
    std::string peer_id;
    TransferRole role;
    TransferPhase phase;
    std::uint64_t bytes_transferred;
    std::uint64_t total_size;
    double progress_percentage;
    std::chrono::steady_clock::time_point start_time;
};

struct TransferTotals {
    std::uint64_t completed = 0;
    std::uint64_t failed = 0;
    std::uint64_t bytes_sent = 0;
    std::uint64_t bytes_received = 0;
};

// Owns every live transfer session of this process. Finished sessions are
// dropped as soon as their completion or failure has been reported.
// Channel transports must be stopped before the manager is destroyed.
class TransferManager {
public:
    using SourceFactory = std::function<std::unique_ptr<storage::ByteSource>()>;
    
    explicit TransferManager(std::shared_ptr<ChannelConnector> connector,
                             std::size_t chunk_size = MAX_CHUNK_SIZE,
                             std::chrono::milliseconds handshake_timeout = std::chrono::seconds(30));
    ~TransferManager();
    
    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;
    
    void set_progress_handler(TransferSession::ProgressHandler handler) { progress_handler_ = std::move(handler); }
    void set_completion_handler(TransferSession::CompletionHandler handler) { completion_handler_ = std::move(handler); }
    void set_failure_handler(TransferSession::FailureHandler handler) { failure_handler_ = std::move(handler); }
    
    // Starts a receiving session on an incoming channel.
    std::shared_ptr<TransferSession> accept_channel(std::shared_ptr<PeerChannel> channel);
    
    // Fan-out: one channel, one session and one fresh source per target.
    // A target whose channel or source cannot be created is reported through
    // the failure handler without affecting the others. Returns the ids of
    // the sessions that were started.
    std::vector<std::string> send(const TransferMetadata& metadata, const SourceFactory& source_factory,
                                  const std::vector<std::string>& targets);
    
    TransferResult send_file(const std::filesystem::path& path, const std::vector<std::string>& targets);
    
    // Fails sessions that stayed in a handshake phase past the timeout.
    void check_timeouts();
    
    bool wait_until_idle(std::chrono::milliseconds timeout);
    
    bool has_session(const std::string& session_id) const;
    std::optional<TransferSessionStats> get_session_stats(const std::string& session_id) const;
    std::vector<TransferSessionStats> get_sessions() const;
    std::size_t get_active_count() const;
    TransferTotals get_totals() const;
    
    std::size_t get_chunk_size() const { return chunk_size_; }
    std::chrono::milliseconds get_handshake_timeout() const { return handshake_timeout_; }

private:
    void attach(const std::shared_ptr<TransferSession>& session);
    void finish(const std::string& session_id);
    void report_setup_failure(const std::string& target, TransferError error, const std::string& message);
    static TransferSessionStats create_session_stats(const TransferSession& session);
    
    std::shared_ptr<ChannelConnector> connector_;
    std::size_t chunk_size_;
    std::chrono::milliseconds handshake_timeout_;
    
    std::unordered_map<std::string, std::shared_ptr<TransferSession>> sessions_;
    TransferTotals totals_;
    mutable std::mutex sessions_mutex_;
    std::condition_variable idle_cv_;
    
    TransferSession::ProgressHandler progress_handler_;
    TransferSession::CompletionHandler completion_handler_;
    TransferSession::FailureHandler failure_handler_;
};

}
