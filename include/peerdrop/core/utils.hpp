#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace peerdrop::core::utils {

class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static std::string format_bytes(std::uint64_t bytes);
    static std::string format_duration(std::chrono::milliseconds duration);
};

class FileUtils {
public:
    static bool exists(const std::filesystem::path& path);
    static bool is_file(const std::filesystem::path& path);
    static std::optional<std::uint64_t> file_size(const std::filesystem::path& path);
    static bool create_directories(const std::filesystem::path& path);
    static std::filesystem::path expand_home(const std::string& path);
    static std::filesystem::path get_home_dir();
};

struct HostPort {
    std::string host;
    std::uint16_t port = 0;
};

// Parses "host:port"; the port must be within 1..65535.
std::optional<HostPort> parse_host_port(const std::string& value);

}
