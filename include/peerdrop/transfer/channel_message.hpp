#pragma once

#include "peerdrop/network/protocol.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace peerdrop::transfer {

// receiver -> sender: the receiving end is attached and listening.
struct ReadySignal {};

// sender -> receiver: handshake accepted, metadata follows.
struct ReadyAckSignal {};

struct TransferMetadata {
    std::string file_name;
    std::string mime_type;
    std::uint64_t total_size = 0;
    
    bool operator==(const TransferMetadata&) const = default;
};

// Opaque payload bytes. Never carries a discriminator of its own.
struct RawChunk {
    std::vector<std::uint8_t> bytes;
};

using ChannelMessage = std::variant<ReadySignal, ReadyAckSignal, TransferMetadata, RawChunk>;

const char* message_name(const ChannelMessage& message);

std::pair<network::MessageType, std::vector<std::uint8_t>> encode(const ChannelMessage& message);

// Raw chunk frames are recognised before any structured decoding is attempted.
// Throws std::runtime_error for non-channel types or malformed control records.
ChannelMessage decode(network::MessageType type, std::vector<std::uint8_t> payload);

}
