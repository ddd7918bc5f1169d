#pragma once

#include "peerdrop/core/utils.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace peerdrop::core {

// Process-wide key=value settings. Lines starting with '#' are comments.
class Config {
public:
    static Config& instance();
    
    // Returns false only when the file cannot be opened. Malformed lines and
    // unknown keys are skipped and reported through get_warnings().
    bool load_from_file(const std::string& filename);
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;
        
        std::istringstream stream(*value);
        T result{};
        stream >> result;
        if (stream.fail() || !stream.eof()) {
            return std::nullopt;
        }
        return result;
    }
    
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    
    // nullopt when the key is missing or not within 1..65535.
    std::optional<std::uint16_t> get_port(const std::string& key) const;
    
    std::optional<utils::HostPort> get_signaling_address() const;
    std::filesystem::path get_download_dir() const;
    
    static bool is_known_key(const std::string& key);
    
    const std::vector<std::string>& get_warnings() const { return warnings_; }
    
    void set_defaults();
    void clear();

private:
    Config() = default;
    
    std::map<std::string, std::string> values_;
    std::vector<std::string> warnings_;
};

}
