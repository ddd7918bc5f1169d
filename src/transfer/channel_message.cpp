#include "peerdrop/transfer/channel_message.hpp"
#include <stdexcept>

namespace peerdrop::transfer {

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

void require_empty(network::MessageType type, const std::vector<std::uint8_t>& payload) {
    if (!payload.empty()) {
        throw std::runtime_error(std::string("Unexpected payload on ") + network::to_string(type));
    }
}

}

const char* message_name(const ChannelMessage& message) {
    return std::visit(overloaded{
        [](const ReadySignal&) { return "ready"; },
        [](const ReadyAckSignal&) { return "ready-ack"; },
        [](const TransferMetadata&) { return "metadata"; },
        [](const RawChunk&) { return "chunk"; }
    }, message);
}

std::pair<network::MessageType, std::vector<std::uint8_t>> encode(const ChannelMessage& message) {
    return std::visit(overloaded{
        [](const ReadySignal&) {
            return std::make_pair(network::MessageType::TRANSFER_READY, std::vector<std::uint8_t>{});
        },
        [](const ReadyAckSignal&) {
            return std::make_pair(network::MessageType::TRANSFER_READY_ACK, std::vector<std::uint8_t>{});
        },
        [](const TransferMetadata& metadata) {
            network::TransferMetadataMessage wire{metadata.file_name, metadata.mime_type, metadata.total_size};
            return std::make_pair(network::MessageType::TRANSFER_METADATA, wire.serialize());
        },
        [](const RawChunk& chunk) {
            return std::make_pair(network::MessageType::TRANSFER_CHUNK, chunk.bytes);
        }
    }, message);
}

ChannelMessage decode(network::MessageType type, std::vector<std::uint8_t> payload) {
    if (type == network::MessageType::TRANSFER_CHUNK) {
        return RawChunk{std::move(payload)};
    }
    
    switch (type) {
        case network::MessageType::TRANSFER_READY:
            require_empty(type, payload);
            return ReadySignal{};
            
        case network::MessageType::TRANSFER_READY_ACK:
            require_empty(type, payload);
            return ReadyAckSignal{};
            
        case network::MessageType::TRANSFER_METADATA: {
            auto wire = network::TransferMetadataMessage::deserialize(payload);
            return TransferMetadata{std::move(wire.file_name), std::move(wire.mime_type), wire.total_size};
        }
        
        default:
            throw std::runtime_error(std::string("Not a channel message: ") + network::to_string(type));
    }
}

}
