#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace peerdrop::storage {

// Forward-only byte stream read by the transfer sender.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    
    // Fills up to buffer.size() bytes and returns the count; 0 means end of
    // data. Throws std::runtime_error on an unreadable source.
    virtual std::size_t read(std::span<std::uint8_t> buffer) = 0;
};

class FileSource : public ByteSource {
public:
    // Throws std::runtime_error when the file cannot be opened.
    explicit FileSource(const std::filesystem::path& path);
    
    std::size_t read(std::span<std::uint8_t> buffer) override;
    
    const std::filesystem::path& get_path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream file_;
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::vector<std::uint8_t> data);
    
    std::size_t read(std::span<std::uint8_t> buffer) override;
    
    std::size_t remaining() const { return data_.size() - offset_; }

private:
    std::vector<std::uint8_t> data_;
    std::size_t offset_;
};

// Lower-cased extension lookup; unknown extensions map to application/octet-stream.
std::string guess_mime_type(const std::filesystem::path& path);

}
