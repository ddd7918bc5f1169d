#include <gtest/gtest.h>
#include "peerdrop/network/protocol.hpp"
#include "peerdrop/transfer/channel_message.hpp"

using namespace peerdrop::network;

class ProtocolTest : public ::testing::Test {};

TEST_F(ProtocolTest, MessageHeaderConstruction) {
    MessageHeader header;
    
    EXPECT_EQ(header.magic, PROTOCOL_MAGIC);
    EXPECT_EQ(header.version, PROTOCOL_VERSION);
    EXPECT_TRUE(header.is_valid());
    EXPECT_GT(header.message_id, 0u);
    EXPECT_GT(header.timestamp, 0u);
}

TEST_F(ProtocolTest, MessageHeaderSerialization) {
    MessageHeader original(MessageType::PRESENCE_UPDATE, 50);
    
    auto serialized = original.serialize();
    ASSERT_EQ(serialized.size(), MESSAGE_HEADER_SIZE);
    
    // Big-endian magic "PDRP" leads every frame.
    EXPECT_EQ(serialized[0], 'P');
    EXPECT_EQ(serialized[1], 'D');
    EXPECT_EQ(serialized[2], 'R');
    EXPECT_EQ(serialized[3], 'P');
    
    auto deserialized = MessageHeader::deserialize(serialized);
    EXPECT_EQ(deserialized.magic, original.magic);
    EXPECT_EQ(deserialized.version, original.version);
    EXPECT_EQ(deserialized.type, original.type);
    EXPECT_EQ(deserialized.message_id, original.message_id);
    EXPECT_EQ(deserialized.payload_size, original.payload_size);
    EXPECT_EQ(deserialized.timestamp, original.timestamp);
}

TEST_F(ProtocolTest, TruncatedHeaderThrows) {
    std::vector<std::uint8_t> short_data(MESSAGE_HEADER_SIZE - 1, 0);
    EXPECT_THROW(MessageHeader::deserialize(short_data), std::runtime_error);
}

TEST_F(ProtocolTest, ForeignMagicIsInvalid) {
    auto serialized = MessageHeader(MessageType::REGISTER, 0).serialize();
    serialized[0] = 'H';
    EXPECT_FALSE(MessageHeader::deserialize(serialized).is_valid());
}

TEST_F(ProtocolTest, ChecksumCalculation) {
    std::vector<std::uint8_t> payload = {1, 2, 3, 4, 5};
    MessageHeader header(MessageType::TRANSFER_CHUNK, static_cast<std::uint32_t>(payload.size()));
    
    header.calculate_checksum(payload);
    EXPECT_TRUE(header.verify_checksum(payload));
    
    payload[0] = 99;
    EXPECT_FALSE(header.verify_checksum(payload));
}

TEST_F(ProtocolTest, Crc32KnownValue) {
    const std::string text = "123456789";
    std::vector<std::uint8_t> data(text.begin(), text.end());
    EXPECT_EQ(crc32(data), 0xCBF43926u);
    EXPECT_EQ(crc32({}), 0u);
}

TEST_F(ProtocolTest, RegisterMessageSerialization) {
    RegisterMessage original{"alice@10.0.0.2:9000"};
    auto deserialized = RegisterMessage::deserialize(original.serialize());
    EXPECT_EQ(deserialized.identifier, original.identifier);
}

TEST_F(ProtocolTest, QueryMessageRejectsPayload) {
    EXPECT_NO_THROW(QueryPeersMessage::deserialize({}));
    std::vector<std::uint8_t> junk = {1};
    EXPECT_THROW(QueryPeersMessage::deserialize(junk), std::runtime_error);
}

TEST_F(ProtocolTest, PresenceUpdateSerialization) {
    PresenceUpdateMessage original{{"alice", "bob", ""}};
    auto deserialized = PresenceUpdateMessage::deserialize(original.serialize());
    EXPECT_EQ(deserialized.identifiers, original.identifiers);
    
    PresenceUpdateMessage empty;
    EXPECT_TRUE(PresenceUpdateMessage::deserialize(empty.serialize()).identifiers.empty());
}

TEST_F(ProtocolTest, PresenceUpdateRejectsOversizedCount) {
    // Claims 1000 entries but carries none.
    std::vector<std::uint8_t> data = {0x00, 0x00, 0x03, 0xE8};
    EXPECT_THROW(PresenceUpdateMessage::deserialize(data), std::runtime_error);
}

TEST_F(ProtocolTest, TruncatedStringThrows) {
    auto data = RegisterMessage{"alice"}.serialize();
    data.pop_back();
    EXPECT_THROW(RegisterMessage::deserialize(data), std::runtime_error);
}

TEST_F(ProtocolTest, ErrorMessageSerialization) {
    ErrorMessage original{2, "Cannot process TRANSFER_CHUNK"};
    auto deserialized = ErrorMessage::deserialize(original.serialize());
    EXPECT_EQ(deserialized.error_code, original.error_code);
    EXPECT_EQ(deserialized.error_message, original.error_message);
}

TEST_F(ProtocolTest, TransferMetadataSerialization) {
    TransferMetadataMessage original{"x.txt", "text/plain", 5ULL * 1024 * 1024 * 1024};
    auto deserialized = TransferMetadataMessage::deserialize(original.serialize());
    EXPECT_EQ(deserialized.file_name, "x.txt");
    EXPECT_EQ(deserialized.mime_type, "text/plain");
    EXPECT_EQ(deserialized.total_size, original.total_size);
}

class ChannelMessageTest : public ::testing::Test {};

TEST_F(ChannelMessageTest, ControlMessagesCarryDiscriminator) {
    using namespace peerdrop::transfer;
    
    auto [ready_type, ready_payload] = encode(ReadySignal{});
    EXPECT_EQ(ready_type, MessageType::TRANSFER_READY);
    EXPECT_TRUE(ready_payload.empty());
    
    auto [ack_type, ack_payload] = encode(ReadyAckSignal{});
    EXPECT_EQ(ack_type, MessageType::TRANSFER_READY_ACK);
    
    TransferMetadata metadata{"x.txt", "text/plain", 10};
    auto [meta_type, meta_payload] = encode(metadata);
    EXPECT_EQ(meta_type, MessageType::TRANSFER_METADATA);
    
    auto decoded = decode(meta_type, meta_payload);
    ASSERT_TRUE(std::holds_alternative<TransferMetadata>(decoded));
    EXPECT_EQ(std::get<TransferMetadata>(decoded), metadata);
}

TEST_F(ChannelMessageTest, RawChunkIsNeverParsed) {
    using namespace peerdrop::transfer;
    
    // Bytes that would be a valid metadata record still decode as a raw chunk.
    auto lookalike = TransferMetadataMessage{"x.txt", "text/plain", 10}.serialize();
    auto decoded = decode(MessageType::TRANSFER_CHUNK, lookalike);
    
    ASSERT_TRUE(std::holds_alternative<RawChunk>(decoded));
    EXPECT_EQ(std::get<RawChunk>(decoded).bytes, lookalike);
    
    auto [type, payload] = encode(RawChunk{lookalike});
    EXPECT_EQ(type, MessageType::TRANSFER_CHUNK);
    EXPECT_EQ(payload, lookalike);
}

TEST_F(ChannelMessageTest, RejectsForeignAndMalformedFrames) {
    using namespace peerdrop::transfer;
    
    EXPECT_THROW(decode(MessageType::REGISTER, {}), std::runtime_error);
    EXPECT_THROW(decode(MessageType::TRANSFER_READY, {1, 2}), std::runtime_error);
    EXPECT_THROW(decode(MessageType::TRANSFER_METADATA, {0, 0}), std::runtime_error);
}
