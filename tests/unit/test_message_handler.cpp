#include <gtest/gtest.h>
#include "peerdrop/network/message_handler.hpp"
#include "peerdrop/network/connection.hpp"
#include <memory>

using namespace peerdrop::network;

class MessageHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        handler = std::make_unique<MessageHandler>();
        handler->set_fallback_handler([this](std::shared_ptr<Connection>, const MessageHeader& header) {
            fallback_types.push_back(header.type);
        });
    }
    
    template<MessagePayload T>
    bool dispatch(MessageType type, const T& message) {
        auto payload = message.serialize();
        MessageHeader header(type, static_cast<std::uint32_t>(payload.size()));
        return handler->handle_message(connection, header, payload);
    }
    
    std::unique_ptr<MessageHandler> handler;
    std::shared_ptr<Connection> connection;
    std::vector<MessageType> fallback_types;
};

TEST_F(MessageHandlerTest, RoutesRegisterMessage) {
    std::string received;
    
    handler->register_handler<RegisterMessage>(MessageType::REGISTER,
        [&](std::shared_ptr<Connection>, const RegisterMessage& msg) {
            received = msg.identifier;
        });
    
    EXPECT_TRUE(dispatch(MessageType::REGISTER, RegisterMessage{"alice"}));
    EXPECT_EQ(received, "alice");
    EXPECT_TRUE(fallback_types.empty());
}

TEST_F(MessageHandlerTest, RoutesByType) {
    int registers = 0;
    int queries = 0;
    
    handler->register_handler<RegisterMessage>(MessageType::REGISTER,
        [&](std::shared_ptr<Connection>, const RegisterMessage&) { ++registers; });
    handler->register_handler<QueryPeersMessage>(MessageType::QUERY_PEERS,
        [&](std::shared_ptr<Connection>, const QueryPeersMessage&) { ++queries; });
    
    dispatch(MessageType::QUERY_PEERS, QueryPeersMessage{});
    dispatch(MessageType::QUERY_PEERS, QueryPeersMessage{});
    dispatch(MessageType::REGISTER, RegisterMessage{"bob"});
    
    EXPECT_EQ(registers, 1);
    EXPECT_EQ(queries, 2);
}

TEST_F(MessageHandlerTest, UnregisteredTypeGoesToFallback) {
    EXPECT_FALSE(handler->has_handler(MessageType::TRANSFER_CHUNK));
    EXPECT_FALSE(dispatch(MessageType::PRESENCE_UPDATE, PresenceUpdateMessage{{"alice"}}));
    
    ASSERT_EQ(fallback_types.size(), 1u);
    EXPECT_EQ(fallback_types[0], MessageType::PRESENCE_UPDATE);
}

TEST_F(MessageHandlerTest, MalformedPayloadGoesToFallback) {
    bool called = false;
    handler->register_handler<RegisterMessage>(MessageType::REGISTER,
        [&](std::shared_ptr<Connection>, const RegisterMessage&) { called = true; });
    
    std::vector<std::uint8_t> truncated = {0x00, 0x00, 0x00, 0x10, 'a'};
    MessageHeader header(MessageType::REGISTER, static_cast<std::uint32_t>(truncated.size()));
    
    EXPECT_FALSE(handler->handle_message(connection, header, truncated));
    EXPECT_FALSE(called);
    ASSERT_EQ(fallback_types.size(), 1u);
    EXPECT_EQ(fallback_types[0], MessageType::REGISTER);
}

TEST_F(MessageHandlerTest, HandlerExceptionIsContained) {
    handler->register_handler<QueryPeersMessage>(MessageType::QUERY_PEERS,
        [](std::shared_ptr<Connection>, const QueryPeersMessage&) {
            throw std::runtime_error("boom");
        });
    
    EXPECT_NO_THROW(dispatch(MessageType::QUERY_PEERS, QueryPeersMessage{}));
    EXPECT_EQ(fallback_types.size(), 1u);
}

TEST_F(MessageHandlerTest, RawHandlerSeesPayloadBytes) {
    std::vector<std::uint8_t> seen;
    handler->register_raw_handler(MessageType::TRANSFER_CHUNK,
        [&](std::shared_ptr<Connection>, std::span<const std::uint8_t> payload) {
            seen.assign(payload.begin(), payload.end());
        });
    
    std::vector<std::uint8_t> chunk = {9, 8, 7};
    MessageHeader header(MessageType::TRANSFER_CHUNK, 3);
    EXPECT_TRUE(handler->handle_message(connection, header, chunk));
    EXPECT_EQ(seen, chunk);
}

TEST_F(MessageHandlerTest, LaterRegistrationReplacesHandler) {
    int first = 0;
    int second = 0;
    
    handler->register_handler<QueryPeersMessage>(MessageType::QUERY_PEERS,
        [&](std::shared_ptr<Connection>, const QueryPeersMessage&) { ++first; });
    handler->register_handler<QueryPeersMessage>(MessageType::QUERY_PEERS,
        [&](std::shared_ptr<Connection>, const QueryPeersMessage&) { ++second; });
    
    dispatch(MessageType::QUERY_PEERS, QueryPeersMessage{});
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}
