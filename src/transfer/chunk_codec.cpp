#include "peerdrop/transfer/chunk_codec.hpp"
#include <algorithm>
#include <stdexcept>

namespace peerdrop::transfer {

ChunkSplitter::ChunkSplitter(std::unique_ptr<storage::ByteSource> source, std::size_t max_chunk_size)
    : source_(std::move(source))
    , max_chunk_size_(max_chunk_size)
    , bytes_read_(0)
    , chunks_read_(0)
    , exhausted_(false) {
    
    if (!source_) {
        throw std::invalid_argument("ChunkSplitter requires a source");
    }
    if (max_chunk_size_ == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
}

std::optional<std::vector<std::uint8_t>> ChunkSplitter::next() {
    if (exhausted_) {
        return std::nullopt;
    }
    
    std::vector<std::uint8_t> chunk(max_chunk_size_);
    std::size_t filled = 0;
    
    // Short reads are allowed, so keep reading until the chunk is full or the
    // source reports end of data.
    while (filled < chunk.size()) {
        std::size_t count = source_->read(std::span<std::uint8_t>(chunk).subspan(filled));
        if (count == 0) {
            exhausted_ = true;
            break;
        }
        filled += count;
    }
    
    if (filled == 0) {
        return std::nullopt;
    }
    
    chunk.resize(filled);
    bytes_read_ += filled;
    ++chunks_read_;
    return chunk;
}

std::vector<std::vector<std::uint8_t>> split(std::span<const std::uint8_t> data, std::size_t max_chunk_size) {
    if (max_chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    
    std::vector<std::vector<std::uint8_t>> chunks;
    chunks.reserve((data.size() + max_chunk_size - 1) / max_chunk_size);
    
    for (std::size_t offset = 0; offset < data.size(); offset += max_chunk_size) {
        auto slice = data.subspan(offset, std::min(max_chunk_size, data.size() - offset));
        chunks.emplace_back(slice.begin(), slice.end());
    }
    
    return chunks;
}

void ChunkAssembler::append(std::vector<std::uint8_t> chunk) {
    bytes_received_ += chunk.size();
    chunks_.push_back(std::move(chunk));
}

TransferResult ChunkAssembler::reassemble(std::uint64_t expected_size, std::vector<std::uint8_t>& out) const {
    return transfer::reassemble(chunks_, expected_size, out);
}

void ChunkAssembler::reset() {
    chunks_.clear();
    bytes_received_ = 0;
}

TransferResult reassemble(const std::vector<std::vector<std::uint8_t>>& chunks, std::uint64_t expected_size,
                          std::vector<std::uint8_t>& out) {
    std::uint64_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.size();
    }
    
    if (total != expected_size) {
        return TransferResult(TransferError::SIZE_MISMATCH,
                              "Received " + std::to_string(total) + " bytes, expected " +
                              std::to_string(expected_size));
    }
    
    out.clear();
    out.reserve(total);
    for (const auto& chunk : chunks) {
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    
    return TransferResult();
}

}
