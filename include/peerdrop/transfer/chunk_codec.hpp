#pragma once

#include "peerdrop/storage/byte_source.hpp"
#include "peerdrop/transfer/transfer_result.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace peerdrop::transfer {

constexpr std::size_t MAX_CHUNK_SIZE = 64 * 1024;

// Lazily slices a byte source into chunks of at most max_chunk_size bytes.
// Every chunk except the last is full; an empty source yields no chunks.
class ChunkSplitter {
public:
    // Throws std::invalid_argument for a null source or a zero chunk size.
    ChunkSplitter(std::unique_ptr<storage::ByteSource> source, std::size_t max_chunk_size = MAX_CHUNK_SIZE);
    
    // Next chunk, or nullopt once the source is exhausted. Source read errors
    // propagate as exceptions.
    std::optional<std::vector<std::uint8_t>> next();
    
    bool exhausted() const { return exhausted_; }
    std::size_t get_max_chunk_size() const { return max_chunk_size_; }
    std::uint64_t get_bytes_read() const { return bytes_read_; }
    std::uint64_t get_chunks_read() const { return chunks_read_; }

private:
    std::unique_ptr<storage::ByteSource> source_;
    std::size_t max_chunk_size_;
    std::uint64_t bytes_read_;
    std::uint64_t chunks_read_;
    bool exhausted_;
};

// Eager convenience form of ChunkSplitter over an in-memory buffer.
std::vector<std::vector<std::uint8_t>> split(std::span<const std::uint8_t> data,
                                             std::size_t max_chunk_size = MAX_CHUNK_SIZE);

// Collects chunks in arrival order.
class ChunkAssembler {
public:
    void append(std::vector<std::uint8_t> chunk);
    
    std::uint64_t bytes_received() const { return bytes_received_; }
    std::size_t chunk_count() const { return chunks_.size(); }
    
    // Concatenates everything received so far. Fails with SIZE_MISMATCH
    // unless the total equals expected_size exactly.
    TransferResult reassemble(std::uint64_t expected_size, std::vector<std::uint8_t>& out) const;
    
    void reset();

private:
    std::vector<std::vector<std::uint8_t>> chunks_;
    std::uint64_t bytes_received_ = 0;
};

TransferResult reassemble(const std::vector<std::vector<std::uint8_t>>& chunks, std::uint64_t expected_size,
                          std::vector<std::uint8_t>& out);

}
