#include "peerdrop/storage/byte_source.hpp"
#include "peerdrop/core/utils.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <unordered_map>

namespace peerdrop::storage {

FileSource::FileSource(const std::filesystem::path& path)
    : path_(path)
    , file_(path, std::ios::binary) {
    
    if (!file_.is_open()) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }
}

std::size_t FileSource::read(std::span<std::uint8_t> buffer) {
    if (buffer.empty() || file_.eof()) {
        return 0;
    }
    
    file_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (file_.bad()) {
        throw std::runtime_error("Read error on " + path_.string());
    }
    
    return static_cast<std::size_t>(file_.gcount());
}

MemorySource::MemorySource(std::vector<std::uint8_t> data)
    : data_(std::move(data))
    , offset_(0) {
}

std::size_t MemorySource::read(std::span<std::uint8_t> buffer) {
    std::size_t count = std::min(buffer.size(), remaining());
    if (count > 0) {
        std::memcpy(buffer.data(), data_.data() + offset_, count);
        offset_ += count;
    }
    return count;
}

std::string guess_mime_type(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"}
    };
    
    auto extension = core::utils::StringUtils::to_lower(path.extension().string());
    auto it = types.find(extension);
    return it != types.end() ? it->second : "application/octet-stream";
}

}
