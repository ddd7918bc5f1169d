#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "peerdrop/core/cli.hpp"
#include "peerdrop/core/command_registry.hpp"
#include <sstream>
#include <stdexcept>

using namespace peerdrop::core;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockCommandHandler : public CommandHandler {
public:
    MOCK_METHOD(CommandResult, execute, (const std::vector<std::string>&), (override));
    MOCK_METHOD(std::string, get_description, (), (const, override));
    MOCK_METHOD(std::string, get_usage, (), (const, override));
};

}

class CommandLineParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "peerdrop");
        storage_ = std::move(args);
        argv_.clear();
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
        return parser_.parse(static_cast<int>(argv_.size()), argv_.data());
    }
    
    CommandLineParser parser_{"peerdrop"};
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

TEST_F(CommandLineParserTest, GlobalOptionsBeforeCommand) {
    ASSERT_TRUE(parse({"--verbose", "-c", "peers.conf", "--signaling=10.0.0.5:3000", "peers"}));
    
    EXPECT_TRUE(parser_.has_option("verbose"));
    EXPECT_EQ(parser_.get_option("config"), "peers.conf");
    EXPECT_EQ(parser_.get_option("signaling"), "10.0.0.5:3000");
    EXPECT_THAT(parser_.get_positional_args(), ElementsAre("peers"));
}

TEST_F(CommandLineParserTest, CommandArgumentsPassThrough) {
    ASSERT_TRUE(parse({"-s", "hub:3000", "send", "-notes.txt", "--help", "bob@10.0.0.2:9000"}));
    
    EXPECT_EQ(parser_.get_option("signaling"), "hub:3000");
    EXPECT_FALSE(parser_.has_option("help"));
    EXPECT_THAT(parser_.get_positional_args(),
                ElementsAre("send", "-notes.txt", "--help", "bob@10.0.0.2:9000"));
}

TEST_F(CommandLineParserTest, ShortFlagsCluster) {
    ASSERT_TRUE(parse({"-hv"}));
    EXPECT_TRUE(parser_.has_option("help"));
    EXPECT_TRUE(parser_.has_option("version"));
    
    ASSERT_TRUE(parse({"-cpeerdrop.conf", "serve"}));
    EXPECT_EQ(parser_.get_option("config"), "peerdrop.conf");
    EXPECT_FALSE(parser_.has_option("help"));
    EXPECT_THAT(parser_.get_positional_args(), ElementsAre("serve"));
}

TEST_F(CommandLineParserTest, DoubleDashEndsOptions) {
    ASSERT_TRUE(parse({"--", "-weird-command"}));
    EXPECT_THAT(parser_.get_positional_args(), ElementsAre("-weird-command"));
}

TEST_F(CommandLineParserTest, MissingOptionFallsBackToDefault) {
    ASSERT_TRUE(parse({"peers"}));
    EXPECT_FALSE(parser_.has_option("config"));
    EXPECT_EQ(parser_.get_option("config", "~/.peerdrop.conf"), "~/.peerdrop.conf");
}

TEST_F(CommandLineParserTest, RejectsBadOptions) {
    EXPECT_FALSE(parse({"--port", "9000"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: --port");
    
    EXPECT_FALSE(parse({"-x"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: -x");
    
    EXPECT_FALSE(parse({"--signaling"}));
    EXPECT_EQ(parser_.get_error(), "Option --signaling requires a <host:port>");
    
    EXPECT_FALSE(parse({"-c"}));
    EXPECT_EQ(parser_.get_error(), "Option -c requires a <file>");
    
    EXPECT_FALSE(parse({"--verbose=yes"}));
    EXPECT_EQ(parser_.get_error(), "Option --verbose takes no value");
}

TEST_F(CommandLineParserTest, HelpListsOptionsAndCommands) {
    CommandRegistry registry;
    std::ostringstream out;
    parser_.print_help(registry, out);
    auto help = out.str();
    
    EXPECT_THAT(help, HasSubstr("Usage: peerdrop [options] <command> [args...]"));
    EXPECT_THAT(help, HasSubstr("-s, --signaling <host:port>"));
    EXPECT_THAT(help, HasSubstr("    --verbose"));
    EXPECT_THAT(help, HasSubstr("Commands:"));
    
    for (const auto& command : registry.get_commands()) {
        EXPECT_THAT(help, HasSubstr(command.description));
        EXPECT_THAT(help, HasSubstr(command.usage));
    }
    
    // Registration order, not alphabetical.
    EXPECT_LT(help.find("  serve"), help.find("  peers"));
    EXPECT_LT(help.find("  peers"), help.find("  receive"));
    EXPECT_LT(help.find("  receive"), help.find("  send"));
}

TEST_F(CommandLineParserTest, Version) {
    std::ostringstream out;
    parser_.print_version(out);
    EXPECT_EQ(out.str(), "peerdrop version 0.1.0\n");
}

class CommandRegistryTest : public ::testing::Test {
protected:
    CommandRegistry registry_;
};

TEST_F(CommandRegistryTest, BuiltInCommands) {
    std::vector<std::string> names;
    for (const auto& command : registry_.get_commands()) {
        names.push_back(command.name);
        EXPECT_FALSE(command.description.empty());
        EXPECT_THAT(command.usage, HasSubstr("peerdrop " + command.name));
    }
    EXPECT_THAT(names, ElementsAre("serve", "peers", "receive", "send"));
    EXPECT_TRUE(registry_.has_command("send"));
    EXPECT_FALSE(registry_.has_command("daemon"));
}

TEST_F(CommandRegistryTest, DispatchesWithFullArguments) {
    auto handler = std::make_unique<MockCommandHandler>();
    EXPECT_CALL(*handler, execute(ElementsAre("ping", "bob@10.0.0.2:9000")))
        .WillOnce(Return(CommandResult::ok("pong")));
    registry_.register_command("ping", std::move(handler));
    
    auto result = registry_.execute_command({"ping", "bob@10.0.0.2:9000"});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "pong");
    EXPECT_EQ(result.exit_code, 0);
}

TEST_F(CommandRegistryTest, ReplacingKeepsPosition) {
    auto handler = std::make_unique<MockCommandHandler>();
    EXPECT_CALL(*handler, get_description()).WillRepeatedly(Return("Replacement"));
    EXPECT_CALL(*handler, get_usage()).WillRepeatedly(Return("peerdrop peers"));
    EXPECT_CALL(*handler, execute(_)).WillOnce(Return(CommandResult::error("offline", 3)));
    registry_.register_command("peers", std::move(handler));
    
    auto commands = registry_.get_commands();
    ASSERT_EQ(commands.size(), 4u);
    EXPECT_EQ(commands[1].name, "peers");
    EXPECT_EQ(commands[1].description, "Replacement");
    
    auto result = registry_.execute_command({"peers"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 3);
}

TEST_F(CommandRegistryTest, UnknownOrMissingCommand) {
    auto unknown = registry_.execute_command({"daemon"});
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.message, "Unknown command: daemon");
    
    auto missing = registry_.execute_command({});
    EXPECT_FALSE(missing.success);
    EXPECT_EQ(missing.exit_code, 1);
}

TEST_F(CommandRegistryTest, ThrowingHandlerBecomesError) {
    auto handler = std::make_unique<MockCommandHandler>();
    EXPECT_CALL(*handler, execute(_)).WillOnce(Throw(std::runtime_error("address in use")));
    registry_.register_command("serve", std::move(handler));
    
    auto result = registry_.execute_command({"serve", "3000"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "serve failed: address in use");
}
