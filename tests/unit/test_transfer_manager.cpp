#include <gtest/gtest.h>
#include "peerdrop/transfer/transfer_manager.hpp"
#include "peerdrop/transfer/loopback_channel.hpp"
#include <boost/asio/io_context.hpp>
#include <filesystem>
#include <fstream>
#include <set>

using namespace peerdrop::transfer;
using peerdrop::storage::MemorySource;

class TransferManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        connector_ = std::make_shared<LoopbackConnector>(io_, "alice");
        outbox_ = std::make_unique<TransferManager>(connector_, 8);
        inbox_ = std::make_unique<TransferManager>(std::make_shared<LoopbackConnector>(io_, "inbox"));
        
        for (const auto* name : {"bob", "carol"}) {
            connector_->add_listener(name, [this](std::shared_ptr<PeerChannel> channel) {
                inbox_->accept_channel(std::move(channel));
            });
        }
        
        outbox_->set_completion_handler([this](const TransferCompletion& c) { sent_.push_back(c); });
        outbox_->set_failure_handler([this](const TransferFailure& f) { send_failures_.push_back(f); });
        inbox_->set_completion_handler([this](const TransferCompletion& c) { received_.push_back(c); });
        inbox_->set_failure_handler([this](const TransferFailure& f) { receive_failures_.push_back(f); });
    }
    
    static std::vector<std::uint8_t> payload() {
        std::vector<std::uint8_t> data(50);
        for (std::size_t i = 0; i < data.size(); ++i) {
            data[i] = static_cast<std::uint8_t>(i * 3);
        }
        return data;
    }
    
    static TransferManager::SourceFactory memory_factory() {
        return []() { return std::make_unique<MemorySource>(payload()); };
    }
    
    const TransferMetadata metadata_{"report.csv", "text/csv", 50};
    
    boost::asio::io_context io_;
    std::shared_ptr<LoopbackConnector> connector_;
    std::unique_ptr<TransferManager> outbox_;
    std::unique_ptr<TransferManager> inbox_;
    
    std::vector<TransferCompletion> sent_;
    std::vector<TransferCompletion> received_;
    std::vector<TransferFailure> send_failures_;
    std::vector<TransferFailure> receive_failures_;
};

TEST_F(TransferManagerTest, FanOutDeliversToEveryTarget) {
    auto ids = outbox_->send(metadata_, memory_factory(), {"bob", "carol"});
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_NE(ids[0], ids[1]);
    EXPECT_EQ(outbox_->get_active_count(), 2u);
    
    io_.run();
    
    ASSERT_EQ(received_.size(), 2u);
    for (const auto& completion : received_) {
        EXPECT_EQ(completion.payload, payload());
        EXPECT_EQ(completion.metadata, metadata_);
        EXPECT_EQ(completion.peer_id, "alice");
    }
    
    ASSERT_EQ(sent_.size(), 2u);
    std::set<std::string> peers{sent_[0].peer_id, sent_[1].peer_id};
    EXPECT_EQ(peers, (std::set<std::string>{"bob", "carol"}));
    
    EXPECT_EQ(outbox_->get_active_count(), 0u);
    EXPECT_EQ(inbox_->get_active_count(), 0u);
    EXPECT_TRUE(outbox_->wait_until_idle(std::chrono::milliseconds(0)));
    
    auto totals = outbox_->get_totals();
    EXPECT_EQ(totals.completed, 2u);
    EXPECT_EQ(totals.failed, 0u);
    EXPECT_EQ(totals.bytes_sent, 100u);
    EXPECT_EQ(inbox_->get_totals().bytes_received, 100u);
}

TEST_F(TransferManagerTest, FailingTargetDoesNotAffectOthers) {
    auto ids = outbox_->send(metadata_, memory_factory(), {"bob", "carol"});
    ASSERT_EQ(ids.size(), 2u);
    
    connector_->get_channel("bob")->inject_failure("link down");
    io_.run();
    
    ASSERT_EQ(send_failures_.size(), 1u);
    EXPECT_EQ(send_failures_.front().peer_id, "bob");
    EXPECT_EQ(send_failures_.front().error, TransferError::CHANNEL_FAILURE);
    EXPECT_EQ(send_failures_.front().session_id, ids[0]);
    
    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_EQ(sent_.front().peer_id, "carol");
    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(received_.front().payload, payload());
    
    ASSERT_EQ(receive_failures_.size(), 1u);
    EXPECT_EQ(receive_failures_.front().error, TransferError::CHANNEL_FAILURE);
    
    EXPECT_EQ(outbox_->get_totals().completed, 1u);
    EXPECT_EQ(outbox_->get_totals().failed, 1u);
}

TEST_F(TransferManagerTest, DestroyedManagerIgnoresLateEvents) {
    auto ids = outbox_->send(metadata_, memory_factory(), {"bob", "carol"});
    ASSERT_EQ(ids.size(), 2u);
    auto bob_channel = connector_->get_channel("bob");
    
    outbox_.reset();
    EXPECT_FALSE(bob_channel->is_open());
    
    io_.run();
    
    EXPECT_TRUE(sent_.empty());
    EXPECT_TRUE(send_failures_.empty());
    EXPECT_TRUE(received_.empty());
    EXPECT_EQ(inbox_->get_active_count(), 0u);
}

TEST_F(TransferManagerTest, RejectedSendMidStreamIsIsolated) {
    auto ids = outbox_->send(metadata_, memory_factory(), {"bob", "carol"});
    ASSERT_EQ(ids.size(), 2u);
    
    // ack, metadata and two chunks go through
    connector_->get_channel("carol")->fail_after_sends(4);
    io_.run();
    
    ASSERT_EQ(send_failures_.size(), 1u);
    EXPECT_EQ(send_failures_.front().peer_id, "carol");
    EXPECT_EQ(send_failures_.front().phase, TransferPhase::STREAMING_CHUNKS);
    EXPECT_EQ(send_failures_.front().bytes_transferred, 16u);
    
    ASSERT_EQ(sent_.size(), 1u);
    EXPECT_EQ(sent_.front().peer_id, "bob");
    ASSERT_EQ(receive_failures_.size(), 1u);
    EXPECT_EQ(receive_failures_.front().bytes_transferred, 16u);
}

TEST_F(TransferManagerTest, UnreachableTargetFails) {
    auto ids = outbox_->send(metadata_, memory_factory(), {"bob", "nobody"});
    ASSERT_EQ(ids.size(), 2u);
    
    io_.run();
    
    ASSERT_EQ(send_failures_.size(), 1u);
    EXPECT_EQ(send_failures_.front().peer_id, "nobody");
    EXPECT_EQ(send_failures_.front().error, TransferError::CHANNEL_FAILURE);
    EXPECT_EQ(send_failures_.front().phase, TransferPhase::IDLE);
    ASSERT_EQ(received_.size(), 1u);
}

TEST_F(TransferManagerTest, SourceFailureIsReportedPerTarget) {
    int calls = 0;
    auto factory = [&calls]() -> std::unique_ptr<peerdrop::storage::ByteSource> {
        if (++calls == 1) {
            throw std::runtime_error("No such file");
        }
        return std::make_unique<MemorySource>(payload());
    };
    
    auto ids = outbox_->send(metadata_, factory, {"bob", "carol"});
    EXPECT_EQ(ids.size(), 1u);
    
    ASSERT_EQ(send_failures_.size(), 1u);
    EXPECT_TRUE(send_failures_.front().session_id.empty());
    EXPECT_EQ(send_failures_.front().peer_id, "bob");
    EXPECT_EQ(send_failures_.front().error, TransferError::SOURCE_READ_ERROR);
    EXPECT_EQ(send_failures_.front().message, "No such file");
    
    io_.run();
    
    ASSERT_EQ(received_.size(), 1u);
    EXPECT_EQ(sent_.front().peer_id, "carol");
}

TEST_F(TransferManagerTest, SessionStatsWhileActive) {
    auto ids = outbox_->send(metadata_, memory_factory(), {"bob"});
    ASSERT_EQ(ids.size(), 1u);
    
    EXPECT_TRUE(outbox_->has_session(ids[0]));
    auto stats = outbox_->get_session_stats(ids[0]);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->peer_id, "bob");
    EXPECT_EQ(stats->role, TransferRole::SENDER);
    EXPECT_EQ(stats->phase, TransferPhase::IDLE);
    EXPECT_EQ(stats->total_size, 50u);
    EXPECT_EQ(stats->bytes_transferred, 0u);
    EXPECT_DOUBLE_EQ(stats->progress_percentage, 0.0);
    EXPECT_EQ(outbox_->get_sessions().size(), 1u);
    EXPECT_FALSE(outbox_->wait_until_idle(std::chrono::milliseconds(10)));
    
    io_.run();
    
    EXPECT_FALSE(outbox_->has_session(ids[0]));
    EXPECT_FALSE(outbox_->get_session_stats(ids[0]).has_value());
    EXPECT_TRUE(outbox_->get_sessions().empty());
}

TEST_F(TransferManagerTest, SendFileReadsFromDisk) {
    const std::filesystem::path path = "manager_test_notes.txt";
    {
        std::ofstream file(path, std::ios::binary);
        file << "hello peers";
    }
    
    auto result = outbox_->send_file(path, {"bob"});
    ASSERT_TRUE(result) << result.message;
    io_.run();
    std::filesystem::remove(path);
    
    ASSERT_EQ(received_.size(), 1u);
    const auto& completion = received_.front();
    EXPECT_EQ(completion.metadata.file_name, "manager_test_notes.txt");
    EXPECT_EQ(completion.metadata.mime_type, "text/plain");
    EXPECT_EQ(std::string(completion.payload.begin(), completion.payload.end()), "hello peers");
}

TEST_F(TransferManagerTest, SendFileValidatesInput) {
    auto missing = outbox_->send_file("does_not_exist.bin", {"bob"});
    EXPECT_FALSE(missing);
    EXPECT_EQ(missing.error, TransferError::SOURCE_READ_ERROR);
    
    const std::filesystem::path path = "manager_test_empty_targets.bin";
    std::ofstream(path) << "x";
    auto no_targets = outbox_->send_file(path, {});
    std::filesystem::remove(path);
    EXPECT_EQ(no_targets.error, TransferError::INVALID_STATE);
    EXPECT_EQ(outbox_->get_active_count(), 0u);
}

TEST_F(TransferManagerTest, HandshakeTimeout) {
    TransferManager impatient(std::make_shared<LoopbackConnector>(io_, "impatient"), MAX_CHUNK_SIZE,
                              std::chrono::milliseconds(0));
    std::vector<TransferFailure> failures;
    impatient.set_failure_handler([&failures](const TransferFailure& f) { failures.push_back(f); });
    
    // Nobody answers on the other end.
    auto pair = LoopbackChannel::create_pair(io_, "silent", "impatient");
    impatient.accept_channel(pair.second);
    io_.run();
    ASSERT_EQ(impatient.get_active_count(), 1u);
    
    inbox_->accept_channel(LoopbackChannel::create_pair(io_, "quiet", "inbox").second);
    
    impatient.check_timeouts();
    inbox_->check_timeouts();
    io_.restart();
    io_.run();
    
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures.front().error, TransferError::TIMEOUT);
    EXPECT_EQ(failures.front().phase, TransferPhase::AWAITING_READY);
    EXPECT_EQ(impatient.get_active_count(), 0u);
    
    // Default timeout is far away.
    EXPECT_TRUE(receive_failures_.empty());
    EXPECT_EQ(inbox_->get_active_count(), 1u);
}

TEST_F(TransferManagerTest, ChunkSizeIsClamped) {
    TransferManager tiny(connector_, 0);
    TransferManager huge(connector_, 1 << 20);
    
    EXPECT_EQ(tiny.get_chunk_size(), 1u);
    EXPECT_EQ(huge.get_chunk_size(), MAX_CHUNK_SIZE);
    EXPECT_EQ(huge.get_handshake_timeout(), std::chrono::seconds(30));
}
