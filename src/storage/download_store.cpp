#include "peerdrop/storage/download_store.hpp"
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/utils.hpp"
#include <fstream>

namespace peerdrop::storage {

namespace {
constexpr const char* DEFAULT_FILE_NAME = "download";
constexpr int MAX_NAME_ATTEMPTS = 10000;
}

DownloadStore::DownloadStore(std::filesystem::path directory)
    : directory_(std::move(directory)) {
}

std::optional<std::filesystem::path> DownloadStore::save(const std::string& file_name,
                                                         std::span<const std::uint8_t> payload) {
    if (!core::utils::FileUtils::create_directories(directory_)) {
        LOG_ERROR("Cannot create download directory {}", directory_.string());
        return std::nullopt;
    }
    
    auto path = unique_path(sanitize_file_name(file_name));
    if (path.empty()) {
        LOG_ERROR("No free file name for {} in {}", file_name, directory_.string());
        return std::nullopt;
    }
    
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LOG_ERROR("Cannot create {}", path.string());
        return std::nullopt;
    }
    
    file.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    file.close();
    if (!file) {
        LOG_ERROR("Write failed for {}", path.string());
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return std::nullopt;
    }
    
    LOG_INFO("Saved {} ({})", path.string(), core::utils::StringUtils::format_bytes(payload.size()));
    return path;
}

std::string DownloadStore::sanitize_file_name(const std::string& file_name) {
    auto slash = file_name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? file_name : file_name.substr(slash + 1);
    
    std::string result;
    result.reserve(base.size());
    for (char c : base) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|') {
            result.push_back('_');
        } else {
            result.push_back(c);
        }
    }
    
    result = core::utils::StringUtils::trim(result);
    if (result.empty() || result == "." || result == "..") {
        return DEFAULT_FILE_NAME;
    }
    return result;
}

std::filesystem::path DownloadStore::unique_path(const std::string& file_name) const {
    auto candidate = directory_ / file_name;
    if (!std::filesystem::exists(candidate)) {
        return candidate;
    }
    
    std::filesystem::path name(file_name);
    auto stem = name.stem().string();
    auto extension = name.extension().string();
    
    for (int n = 1; n < MAX_NAME_ATTEMPTS; ++n) {
        candidate = directory_ / (stem + " (" + std::to_string(n) + ")" + extension);
        if (!std::filesystem::exists(candidate)) {
            return candidate;
        }
    }
    
    return {};
}

}
