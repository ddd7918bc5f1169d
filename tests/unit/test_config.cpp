#include <gtest/gtest.h>
#include "peerdrop/core/config.hpp"
#include <fstream>
#include <filesystem>

using namespace peerdrop::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_peerdrop_config.txt";
    }
    
    void TearDown() override {
        Config::instance().clear();
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }
    
    void write_settings(const std::string& text) {
        std::ofstream file(test_file);
        file << text;
    }
    
    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();
    config.set("identity.name", "laptop");
    
    auto value = config.get("identity.name");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "laptop");
    EXPECT_FALSE(config.get("channel.host").has_value());
    EXPECT_EQ(config.get_string("channel.host", "0.0.0.0"), "0.0.0.0");
}

TEST_F(ConfigTest, MalformedIntegerFallsBackToDefault) {
    auto& config = Config::instance();
    config.set("transfer.chunk_size", "64k");
    config.set("transfer.max_frame_size", "");
    
    EXPECT_EQ(config.get_int("transfer.chunk_size", 4096), 4096);
    EXPECT_EQ(config.get_int("transfer.max_frame_size", 7), 7);
    EXPECT_FALSE(config.get_as<int>("transfer.chunk_size").has_value());
}

TEST_F(ConfigTest, BuiltInDefaults) {
    auto& config = Config::instance();
    config.set_defaults();
    
    EXPECT_EQ(config.get_int("transfer.chunk_size"), 65536);
    EXPECT_EQ(config.get_int("transfer.handshake_timeout_ms"), 30000);
    EXPECT_EQ(config.get_int("transfer.max_frame_size"), 1048576);
    EXPECT_EQ(config.get_string("log.level"), "info");
    EXPECT_EQ(config.get_string("identity.name"), "peerdrop");
    EXPECT_EQ(config.get_port("channel.port").value_or(0), 9000);
    EXPECT_EQ(config.get_download_dir(), std::filesystem::path("./downloads"));
    
    auto signaling = config.get_signaling_address();
    ASSERT_TRUE(signaling.has_value());
    EXPECT_EQ(signaling->host, "127.0.0.1");
    EXPECT_EQ(signaling->port, 3000);
}

TEST_F(ConfigTest, PortsMustBeInRange) {
    auto& config = Config::instance();
    config.set_defaults();
    
    config.set("channel.port", "0");
    EXPECT_FALSE(config.get_port("channel.port").has_value());
    config.set("channel.port", "65536");
    EXPECT_FALSE(config.get_port("channel.port").has_value());
    config.set("channel.port", "65535");
    EXPECT_EQ(config.get_port("channel.port").value_or(0), 65535);
    
    config.set("signaling.port", "-1");
    EXPECT_FALSE(config.get_signaling_address().has_value());
    config.set("signaling.port", "4000");
    config.set("signaling.host", "");
    EXPECT_FALSE(config.get_signaling_address().has_value());
}

TEST_F(ConfigTest, DownloadDirExpandsHome) {
    auto& config = Config::instance();
    config.set("download.dir", "~/Downloads/peerdrop");
    
    EXPECT_EQ(config.get_download_dir(), utils::FileUtils::get_home_dir() / "Downloads" / "peerdrop");
}

TEST_F(ConfigTest, FileOverridesDefaults) {
    write_settings("# local overrides\n"
                   "signaling.port = 4000 \n"
                   "\n"
                   "download.dir=/srv/incoming\n");
    
    auto& config = Config::instance();
    config.set_defaults();
    ASSERT_TRUE(config.load_from_file(test_file));
    
    EXPECT_EQ(config.get_signaling_address()->port, 4000);
    EXPECT_EQ(config.get_string("signaling.host"), "127.0.0.1");
    EXPECT_EQ(config.get_download_dir(), std::filesystem::path("/srv/incoming"));
    EXPECT_TRUE(config.get_warnings().empty());
}

TEST_F(ConfigTest, BadLinesAreReportedAndSkipped) {
    write_settings("channel.port=9100\n"
                   "not a setting\n"
                   "= 12\n"
                   "transfer.chunksize=4096\n");
    
    auto& config = Config::instance();
    ASSERT_TRUE(config.load_from_file(test_file));
    
    EXPECT_EQ(config.get_port("channel.port").value_or(0), 9100);
    EXPECT_FALSE(config.get("transfer.chunksize").has_value());
    
    const auto& warnings = config.get_warnings();
    ASSERT_EQ(warnings.size(), 3u);
    EXPECT_EQ(warnings[0], test_file + ":2: expected key=value");
    EXPECT_EQ(warnings[1], test_file + ":3: expected key=value");
    EXPECT_EQ(warnings[2], test_file + ":4: unknown setting 'transfer.chunksize'");
    
    config.clear();
    EXPECT_TRUE(config.get_warnings().empty());
}

TEST_F(ConfigTest, KnownKeys) {
    EXPECT_TRUE(Config::is_known_key("signaling.host"));
    EXPECT_TRUE(Config::is_known_key("transfer.handshake_timeout_ms"));
    EXPECT_FALSE(Config::is_known_key("ipc.socket"));
    EXPECT_FALSE(Config::is_known_key(""));
}

TEST_F(ConfigTest, LoadMissingFile) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
    EXPECT_TRUE(Config::instance().get_warnings().empty());
}
