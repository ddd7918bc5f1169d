#include <gtest/gtest.h>
#include "peerdrop/core/utils.hpp"
#include <filesystem>
#include <fstream>

using namespace peerdrop::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("\t\n"), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("Hello World"), "hello world");
    EXPECT_EQ(StringUtils::to_lower(".PNG"), ".png");
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(1048576), "1.00 MB");
}

TEST_F(StringUtilsTest, FormatDuration) {
    using std::chrono::milliseconds;
    EXPECT_EQ(StringUtils::format_duration(milliseconds(250)), "250ms");
    EXPECT_EQ(StringUtils::format_duration(milliseconds(42000)), "42s");
    EXPECT_EQ(StringUtils::format_duration(milliseconds(125000)), "2m 5s");
    EXPECT_EQ(StringUtils::format_duration(milliseconds(3720000)), "1h 2m");
}

class HostPortTest : public ::testing::Test {};

TEST_F(HostPortTest, ParsesHostAndPort) {
    auto parsed = parse_host_port("127.0.0.1:3000");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->host, "127.0.0.1");
    EXPECT_EQ(parsed->port, 3000);
}

TEST_F(HostPortTest, UsesLastColon) {
    auto parsed = parse_host_port("::1:9000");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->host, "::1");
    EXPECT_EQ(parsed->port, 9000);
}

TEST_F(HostPortTest, RejectsBadInput) {
    EXPECT_FALSE(parse_host_port("localhost").has_value());
    EXPECT_FALSE(parse_host_port(":3000").has_value());
    EXPECT_FALSE(parse_host_port("localhost:").has_value());
    EXPECT_FALSE(parse_host_port("localhost:0").has_value());
    EXPECT_FALSE(parse_host_port("localhost:65536").has_value());
    EXPECT_FALSE(parse_host_port("localhost:12a").has_value());
    EXPECT_FALSE(parse_host_port("localhost:-1").has_value());
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = "test_file.txt";
        test_dir = "test_dir";
    }
    
    void TearDown() override {
        std::filesystem::remove(test_file);
        std::filesystem::remove_all(test_dir);
    }
    
    std::string test_file;
    std::string test_dir;
};

TEST_F(FileUtilsTest, Exists) {
    EXPECT_FALSE(FileUtils::exists(test_file));
    
    std::ofstream file(test_file);
    file << "test";
    file.close();
    
    EXPECT_TRUE(FileUtils::exists(test_file));
    EXPECT_TRUE(FileUtils::is_file(test_file));
}

TEST_F(FileUtilsTest, CreateDirectories) {
    EXPECT_TRUE(FileUtils::create_directories(std::filesystem::path(test_dir) / "nested"));
    EXPECT_TRUE(FileUtils::exists(test_dir));
    EXPECT_FALSE(FileUtils::is_file(test_dir));
}

TEST_F(FileUtilsTest, FileSize) {
    std::ofstream file(test_file);
    file << "Hello, World!";
    file.close();
    
    auto size = FileUtils::file_size(test_file);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 13u);
    EXPECT_FALSE(FileUtils::file_size("missing.bin").has_value());
}

TEST_F(FileUtilsTest, ExpandHome) {
    EXPECT_EQ(FileUtils::expand_home("~/downloads"), FileUtils::get_home_dir() / "downloads");
    EXPECT_EQ(FileUtils::expand_home("~"), FileUtils::get_home_dir());
    EXPECT_EQ(FileUtils::expand_home("./downloads"), std::filesystem::path("./downloads"));
    EXPECT_EQ(FileUtils::expand_home("~user/downloads"), std::filesystem::path("~user/downloads"));
}
