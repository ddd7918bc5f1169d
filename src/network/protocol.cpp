#include "peerdrop/network/protocol.hpp"
#include <algorithm>
#include <chrono>
#include <random>
#include <stdexcept>

namespace peerdrop::network {

namespace {
    std::uint64_t generate_message_id() {
        static thread_local std::mt19937_64 gen(std::random_device{}());
        std::uint64_t id = 0;
        while (id == 0) {
            id = gen();
        }
        return id;
    }
    
    std::uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()).count());
    }
    
    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
        write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    }
    
    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }
    
    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
        std::uint16_t value = static_cast<std::uint16_t>((data[0] << 8) | data[1]);
        data = data.subspan(2);
        return value;
    }
    
    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }
    
    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        std::uint64_t high = read_uint32(data);
        std::uint64_t low = read_uint32(data);
        return (high << 32) | low;
    }
    
    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw std::runtime_error("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }
    
    void expect_consumed(std::span<const std::uint8_t> remaining, const char* what) {
        if (!remaining.empty()) {
            throw std::runtime_error(std::string("Trailing bytes after ") + what);
        }
    }
}

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::REGISTER: return "REGISTER";
        case MessageType::QUERY_PEERS: return "QUERY_PEERS";
        case MessageType::PRESENCE_UPDATE: return "PRESENCE_UPDATE";
        case MessageType::SIGNAL_ERROR: return "SIGNAL_ERROR";
        case MessageType::CHANNEL_HELLO: return "CHANNEL_HELLO";
        case MessageType::TRANSFER_READY: return "TRANSFER_READY";
        case MessageType::TRANSFER_READY_ACK: return "TRANSFER_READY_ACK";
        case MessageType::TRANSFER_METADATA: return "TRANSFER_METADATA";
        case MessageType::TRANSFER_CHUNK: return "TRANSFER_CHUNK";
    }
    return "UNKNOWN";
}

std::uint32_t crc32(std::span<const std::uint8_t> data) {
    std::uint32_t crc = 0xFFFFFFFF;
    constexpr std::uint32_t polynomial = 0xEDB88320;
    
    for (std::uint8_t byte : data) {
        crc ^= byte;
        for (int i = 0; i < 8; ++i) {
            if (crc & 1) {
                crc = (crc >> 1) ^ polynomial;
            } else {
                crc >>= 1;
            }
        }
    }
    return ~crc;
}

MessageHeader::MessageHeader() 
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(MessageType::QUERY_PEERS)
    , flags(MessageFlags::NONE)
    , message_id(generate_message_id())
    , payload_size(0)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

MessageHeader::MessageHeader(MessageType msg_type, std::uint32_t payload_len)
    : magic(PROTOCOL_MAGIC)
    , version(PROTOCOL_VERSION)
    , type(msg_type)
    , flags(MessageFlags::NONE)
    , message_id(generate_message_id())
    , payload_size(payload_len)
    , timestamp(get_timestamp_ns())
    , checksum{0, 0, 0, 0} {
}

bool MessageHeader::is_valid() const {
    return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION;
}

void MessageHeader::calculate_checksum(std::span<const std::uint8_t> payload) {
    auto crc = crc32(payload);
    checksum[0] = (crc >> 24) & 0xFF;
    checksum[1] = (crc >> 16) & 0xFF;
    checksum[2] = (crc >> 8) & 0xFF;
    checksum[3] = crc & 0xFF;
}

bool MessageHeader::verify_checksum(std::span<const std::uint8_t> payload) const {
    auto expected_crc = crc32(payload);
    auto actual_crc = (static_cast<std::uint32_t>(checksum[0]) << 24) |
                     (static_cast<std::uint32_t>(checksum[1]) << 16) |
                     (static_cast<std::uint32_t>(checksum[2]) << 8) |
                     static_cast<std::uint32_t>(checksum[3]);
    return expected_crc == actual_crc;
}

std::vector<std::uint8_t> MessageHeader::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(MESSAGE_HEADER_SIZE);
    
    write_uint32(buffer, magic);
    write_uint16(buffer, version);
    buffer.push_back(static_cast<std::uint8_t>(type));
    buffer.push_back(static_cast<std::uint8_t>(flags));
    write_uint64(buffer, message_id);
    write_uint32(buffer, payload_size);
    write_uint64(buffer, timestamp);
    buffer.insert(buffer.end(), checksum.begin(), checksum.end());
    
    return buffer;
}

MessageHeader MessageHeader::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < MESSAGE_HEADER_SIZE) {
        throw std::runtime_error("Insufficient data for message header");
    }
    
    MessageHeader header;
    auto span = data;
    
    header.magic = read_uint32(span);
    header.version = read_uint16(span);
    header.type = static_cast<MessageType>(span[0]);
    header.flags = static_cast<MessageFlags>(span[1]);
    span = span.subspan(2);
    header.message_id = read_uint64(span);
    header.payload_size = read_uint32(span);
    header.timestamp = read_uint64(span);
    std::copy(span.begin(), span.begin() + 4, header.checksum.begin());
    
    return header;
}

std::vector<std::uint8_t> RegisterMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, identifier);
    return buffer;
}

RegisterMessage RegisterMessage::deserialize(std::span<const std::uint8_t> data) {
    RegisterMessage msg;
    auto span = data;
    msg.identifier = read_string(span);
    expect_consumed(span, "register message");
    return msg;
}

std::vector<std::uint8_t> QueryPeersMessage::serialize() const {
    return {};
}

QueryPeersMessage QueryPeersMessage::deserialize(std::span<const std::uint8_t> data) {
    expect_consumed(data, "query message");
    return {};
}

std::vector<std::uint8_t> PresenceUpdateMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, static_cast<std::uint32_t>(identifiers.size()));
    for (const auto& identifier : identifiers) {
        write_string(buffer, identifier);
    }
    return buffer;
}

PresenceUpdateMessage PresenceUpdateMessage::deserialize(std::span<const std::uint8_t> data) {
    PresenceUpdateMessage msg;
    auto span = data;
    auto count = read_uint32(span);
    // Every entry needs at least its 4-byte length prefix.
    if (count > span.size() / 4) {
        throw std::runtime_error("Presence update count exceeds payload");
    }
    msg.identifiers.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        msg.identifiers.push_back(read_string(span));
    }
    expect_consumed(span, "presence update");
    return msg;
}

std::vector<std::uint8_t> ErrorMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, error_code);
    write_string(buffer, error_message);
    return buffer;
}

ErrorMessage ErrorMessage::deserialize(std::span<const std::uint8_t> data) {
    ErrorMessage msg;
    auto span = data;
    msg.error_code = read_uint32(span);
    msg.error_message = read_string(span);
    return msg;
}

std::vector<std::uint8_t> ChannelHelloMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, identifier);
    return buffer;
}

ChannelHelloMessage ChannelHelloMessage::deserialize(std::span<const std::uint8_t> data) {
    ChannelHelloMessage msg;
    auto span = data;
    msg.identifier = read_string(span);
    expect_consumed(span, "channel hello");
    return msg;
}

std::vector<std::uint8_t> TransferMetadataMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_name);
    write_string(buffer, mime_type);
    write_uint64(buffer, total_size);
    return buffer;
}

TransferMetadataMessage TransferMetadataMessage::deserialize(std::span<const std::uint8_t> data) {
    TransferMetadataMessage msg;
    auto span = data;
    msg.file_name = read_string(span);
    msg.mime_type = read_string(span);
    msg.total_size = read_uint64(span);
    expect_consumed(span, "transfer metadata");
    return msg;
}

}
