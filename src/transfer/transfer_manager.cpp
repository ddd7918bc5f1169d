#include "peerdrop/transfer/transfer_manager.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <algorithm>
#include <stdexcept>

namespace peerdrop::transfer {

TransferManager::TransferManager(std::shared_ptr<ChannelConnector> connector, std::size_t chunk_size,
                                 std::chrono::milliseconds handshake_timeout)
    : connector_(std::move(connector))
    , chunk_size_(std::clamp<std::size_t>(chunk_size, 1, MAX_CHUNK_SIZE))
    , handshake_timeout_(handshake_timeout) {
}

TransferManager::~TransferManager() {
    std::vector<std::shared_ptr<TransferSession>> remaining;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& [id, session] : sessions_) {
            remaining.push_back(session);
        }
        sessions_.clear();
    }
    
    // Late channel events must not reach this manager through the session callbacks.
    for (auto& session : remaining) {
        session->set_progress_handler(nullptr);
        session->set_completion_handler(nullptr);
        session->set_failure_handler(nullptr);
        session->get_channel()->clear_handlers();
        session->get_channel()->close();
    }
}

std::shared_ptr<TransferSession> TransferManager::accept_channel(std::shared_ptr<PeerChannel> channel) {
    auto session = TransferSession::create_receiver(std::move(channel));
    LOG_INFO("Incoming channel from {} (session {})", session->get_peer_id(), session->get_session_id());
    attach(session);
    return session;
}

std::vector<std::string> TransferManager::send(const TransferMetadata& metadata,
                                               const SourceFactory& source_factory,
                                               const std::vector<std::string>& targets) {
    std::vector<std::string> session_ids;
    
    for (const auto& target : targets) {
        std::unique_ptr<storage::ByteSource> source;
        try {
            source = source_factory();
        } catch (const std::exception& e) {
            report_setup_failure(target, TransferError::SOURCE_READ_ERROR, e.what());
            continue;
        }
        
        std::shared_ptr<PeerChannel> channel;
        try {
            channel = connector_->open(target);
        } catch (const std::exception& e) {
            report_setup_failure(target, TransferError::CHANNEL_FAILURE, e.what());
            continue;
        }
        
        if (!channel) {
            report_setup_failure(target, TransferError::CHANNEL_FAILURE, "Cannot open channel");
            continue;
        }
        
        std::shared_ptr<TransferSession> session;
        try {
            session = TransferSession::create_sender(channel, metadata, std::move(source), chunk_size_);
        } catch (const std::invalid_argument& e) {
            channel->close();
            report_setup_failure(target, TransferError::INVALID_STATE, e.what());
            continue;
        }
        
        session_ids.push_back(session->get_session_id());
        attach(session);
    }
    
    return session_ids;
}

TransferResult TransferManager::send_file(const std::filesystem::path& path, const std::vector<std::string>& targets) {
    auto size = core::utils::FileUtils::file_size(path);
    if (!core::utils::FileUtils::is_file(path) || !size) {
        return TransferResult(TransferError::SOURCE_READ_ERROR, "Not a readable file: " + path.string());
    }
    
    if (targets.empty()) {
        return TransferResult(TransferError::INVALID_STATE, "No recipients");
    }
    
    TransferMetadata metadata{path.filename().string(), storage::guess_mime_type(path), *size};
    LOG_INFO("Sending {} ({}) to {} recipient(s)", metadata.file_name,
             core::utils::StringUtils::format_bytes(metadata.total_size), targets.size());
    
    auto started = send(metadata, [path]() {
        return std::make_unique<storage::FileSource>(path);
    }, targets);
    
    if (started.empty()) {
        return TransferResult(TransferError::CHANNEL_FAILURE, "No transfer could be started");
    }
    return TransferResult();
}

void TransferManager::check_timeouts() {
    auto now = std::chrono::steady_clock::now();
    
    std::vector<std::shared_ptr<TransferSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& [id, session] : sessions_) {
            if (session->in_handshake()) {
                sessions.push_back(session);
            }
        }
    }
    
    for (auto& session : sessions) {
        std::weak_ptr<TransferSession> weak = session;
        auto timeout = handshake_timeout_;
        session->get_channel()->dispatch([weak, now, timeout]() {
            if (auto s = weak.lock()) {
                s->expire_if_stalled(now, timeout);
            }
        });
    }
}

bool TransferManager::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(sessions_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return sessions_.empty(); });
}

bool TransferManager::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.find(session_id) != sessions_.end();
}

std::optional<TransferSessionStats> TransferManager::get_session_stats(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return create_session_stats(*it->second);
}

std::vector<TransferSessionStats> TransferManager::get_sessions() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    std::vector<TransferSessionStats> result;
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        result.push_back(create_session_stats(*session));
    }
    return result;
}

std::size_t TransferManager::get_active_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

TransferTotals TransferManager::get_totals() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return totals_;
}

void TransferManager::attach(const std::shared_ptr<TransferSession>& session) {
    auto session_id = session->get_session_id();
    
    session->set_progress_handler([this](const TransferProgress& progress) {
        if (progress_handler_) {
            progress_handler_(progress);
        }
    });
    
    session->set_completion_handler([this, session_id](const TransferCompletion& completion) {
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            ++totals_.completed;
            if (completion.role == TransferRole::SENDER) {
                totals_.bytes_sent += completion.metadata.total_size;
            } else {
                totals_.bytes_received += completion.payload.size();
            }
        }
        if (completion_handler_) {
            completion_handler_(completion);
        }
        finish(session_id);
    });
    
    session->set_failure_handler([this, session_id](const TransferFailure& failure) {
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            ++totals_.failed;
        }
        if (failure_handler_) {
            failure_handler_(failure);
        }
        finish(session_id);
    });
    
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[session_id] = session;
    }
    
    session->start();
}

void TransferManager::finish(const std::string& session_id) {
    std::shared_ptr<TransferSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }
    idle_cv_.notify_all();
}

void TransferManager::report_setup_failure(const std::string& target, TransferError error, const std::string& message) {
    LOG_ERROR("Cannot start transfer to {}: {}", target, message);
    
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        ++totals_.failed;
    }
    
    if (failure_handler_) {
        failure_handler_(TransferFailure{"", error, target, TransferRole::SENDER, TransferPhase::IDLE, 0, message});
    }
}

TransferSessionStats TransferManager::create_session_stats(const TransferSession& session) {
    TransferSessionStats stats;
    stats.session_id = session.get_session_id();
    stats.peer_id = session.get_peer_id();
    stats.role = session.get_role();
    stats.phase = session.get_phase();
    stats.bytes_transferred = session.get_bytes_transferred();
    stats.total_size = session.get_total_size();
    stats.progress_percentage = stats.total_size == 0
        ? (stats.phase == TransferPhase::COMPLETE ? 100.0 : 0.0)
        : 100.0 * static_cast<double>(stats.bytes_transferred) / stats.total_size;
    stats.start_time = session.get_start_time();
    return stats;
}

}
