#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>

namespace peerdrop::storage {

// Writes completed transfers into a download directory without ever
// overwriting an existing file.
class DownloadStore {
public:
    explicit DownloadStore(std::filesystem::path directory);
    
    // Returns the written path, or nullopt when the file could not be created.
    std::optional<std::filesystem::path> save(const std::string& file_name,
                                              std::span<const std::uint8_t> payload);
    
    // Strips directory components and characters that are unsafe in a file
    // name. Never returns an empty string.
    static std::string sanitize_file_name(const std::string& file_name);
    
    const std::filesystem::path& get_directory() const { return directory_; }

private:
    std::filesystem::path unique_path(const std::string& file_name) const;
    
    std::filesystem::path directory_;
};

}
