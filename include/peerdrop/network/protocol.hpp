#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace peerdrop::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x50445250; // "PDRP"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t MESSAGE_HEADER_SIZE = 32;
constexpr std::uint32_t DEFAULT_MAX_PAYLOAD_SIZE = 1024 * 1024;

enum class MessageType : std::uint8_t {
    // Signaling (client <-> presence registry)
    REGISTER = 0x01,
    QUERY_PEERS = 0x02,
    PRESENCE_UPDATE = 0x03,
    SIGNAL_ERROR = 0x0F,
    
    // Point-to-point channel
    CHANNEL_HELLO = 0x10,
    TRANSFER_READY = 0x11,
    TRANSFER_READY_ACK = 0x12,
    TRANSFER_METADATA = 0x13,
    TRANSFER_CHUNK = 0x14
};

enum class MessageFlags : std::uint8_t {
    NONE = 0x00
};

const char* to_string(MessageType type);

struct MessageHeader {
    std::uint32_t magic;
    std::uint16_t version;
    MessageType type;
    MessageFlags flags;
    std::uint64_t message_id;
    std::uint32_t payload_size;
    std::uint64_t timestamp;
    std::array<std::uint8_t, 4> checksum;
    
    MessageHeader();
    MessageHeader(MessageType msg_type, std::uint32_t payload_len);
    
    bool is_valid() const;
    void calculate_checksum(std::span<const std::uint8_t> payload);
    bool verify_checksum(std::span<const std::uint8_t> payload) const;
    
    std::vector<std::uint8_t> serialize() const;
    static MessageHeader deserialize(std::span<const std::uint8_t> data);
};

template<typename T>
concept MessagePayload = requires(const T& message, std::span<const std::uint8_t> data) {
    { message.serialize() } -> std::same_as<std::vector<std::uint8_t>>;
    { T::deserialize(data) } -> std::same_as<T>;
};

struct RegisterMessage {
    std::string identifier;
    
    std::vector<std::uint8_t> serialize() const;
    static RegisterMessage deserialize(std::span<const std::uint8_t> data);
};

struct QueryPeersMessage {
    std::vector<std::uint8_t> serialize() const;
    static QueryPeersMessage deserialize(std::span<const std::uint8_t> data);
};

struct PresenceUpdateMessage {
    std::vector<std::string> identifiers;
    
    std::vector<std::uint8_t> serialize() const;
    static PresenceUpdateMessage deserialize(std::span<const std::uint8_t> data);
};

struct ErrorMessage {
    std::uint32_t error_code;
    std::string error_message;
    
    std::vector<std::uint8_t> serialize() const;
    static ErrorMessage deserialize(std::span<const std::uint8_t> data);
};

// First frame on a freshly connected channel; names the connecting endpoint.
struct ChannelHelloMessage {
    std::string identifier;
    
    std::vector<std::uint8_t> serialize() const;
    static ChannelHelloMessage deserialize(std::span<const std::uint8_t> data);
};

struct TransferMetadataMessage {
    std::string file_name;
    std::string mime_type;
    std::uint64_t total_size;
    
    std::vector<std::uint8_t> serialize() const;
    static TransferMetadataMessage deserialize(std::span<const std::uint8_t> data);
};

std::uint32_t crc32(std::span<const std::uint8_t> data);

}
