#include <iostream>
#include <string>
#include <vector>
#include "peerdrop/core/logger.hpp"
#include "peerdrop/core/config.hpp"
#include "peerdrop/core/cli.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    peerdrop::core::CommandLineParser parser("peerdrop");
    peerdrop::core::CommandRegistry command_registry;
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help(command_registry, std::cerr);
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help(command_registry);
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = peerdrop::core::Config::instance();
    config.set_defaults();
    
    auto config_file = peerdrop::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.peerdrop.conf"));
    if (peerdrop::core::utils::FileUtils::exists(config_file) && !config.load_from_file(config_file.string())) {
        std::cerr << "Warning: could not read " << config_file.string() << "\n";
    }
    for (const auto& warning : config.get_warnings()) {
        std::cerr << "Warning: " << warning << "\n";
    }
    
    if (parser.has_option("signaling")) {
        auto address = peerdrop::core::utils::parse_host_port(parser.get_option("signaling"));
        if (!address) {
            std::cerr << "Error: --signaling expects host:port\n";
            return 1;
        }
        config.set("signaling.host", address->host);
        config.set("signaling.port", std::to_string(address->port));
    }
    
    auto log_level = peerdrop::core::Logger::parse_level(config.get_string("log.level", "info"))
        .value_or(peerdrop::core::LogLevel::Info);
    if (parser.has_option("verbose")) {
        log_level = peerdrop::core::LogLevel::Debug;
    }
    peerdrop::core::Logger::initialize(config.get_string("log.file", "peerdrop.log"), log_level);
    
    LOG_INFO("PeerDrop starting up");
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help(command_registry);
        peerdrop::core::Logger::shutdown();
        return 0;
    }
    
    auto result = command_registry.execute_command(args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(args[0])) {
            std::cerr << "\n";
            parser.print_help(command_registry, std::cerr);
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }
    
    peerdrop::core::Logger::shutdown();
    return result.exit_code;
}
