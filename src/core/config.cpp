#include "peerdrop/core/config.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <utility>

namespace peerdrop::core {

namespace {

constexpr std::array<std::pair<const char*, const char*>, 11> DEFAULT_SETTINGS{{
    {"signaling.host", "127.0.0.1"},
    {"signaling.port", "3000"},
    {"channel.host", "127.0.0.1"},
    {"channel.port", "9000"},
    {"transfer.chunk_size", "65536"},
    {"transfer.handshake_timeout_ms", "30000"},
    {"transfer.max_frame_size", "1048576"},
    {"download.dir", "./downloads"},
    {"log.level", "info"},
    {"log.file", "peerdrop.log"},
    {"identity.name", "peerdrop"},
}};

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = utils::StringUtils::trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        auto key = eq_pos == std::string::npos ? std::string() : utils::StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            warnings_.push_back(filename + ":" + std::to_string(line_number) + ": expected key=value");
            continue;
        }
        
        if (!is_known_key(key)) {
            warnings_.push_back(filename + ":" + std::to_string(line_number) + ": unknown setting '" + key + "'");
            continue;
        }
        
        values_[key] = utils::StringUtils::trim(line.substr(eq_pos + 1));
    }
    
    return true;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::optional<std::uint16_t> Config::get_port(const std::string& key) const {
    auto value = get_as<int>(key);
    if (!value || *value <= 0 || *value > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(*value);
}

std::optional<utils::HostPort> Config::get_signaling_address() const {
    auto host = get_string("signaling.host");
    auto port = get_port("signaling.port");
    if (host.empty() || !port) {
        return std::nullopt;
    }
    return utils::HostPort{host, *port};
}

std::filesystem::path Config::get_download_dir() const {
    return utils::FileUtils::expand_home(get_string("download.dir", "./downloads"));
}

bool Config::is_known_key(const std::string& key) {
    return std::any_of(DEFAULT_SETTINGS.begin(), DEFAULT_SETTINGS.end(),
                       [&key](const auto& setting) { return key == setting.first; });
}

void Config::set_defaults() {
    for (const auto& [key, value] : DEFAULT_SETTINGS) {
        values_[key] = value;
    }
}

void Config::clear() {
    values_.clear();
    warnings_.clear();
}

}
