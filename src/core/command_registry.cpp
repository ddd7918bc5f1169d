#include "peerdrop/core/command_registry.hpp"
#include "peerdrop/core/logger.hpp"
#include <algorithm>

namespace peerdrop::core {

CommandRegistry::CommandRegistry() {
    register_command("serve", std::make_unique<ServeCommandHandler>());
    register_command("peers", std::make_unique<PeersCommandHandler>());
    register_command("receive", std::make_unique<ReceiveCommandHandler>());
    register_command("send", std::make_unique<SendCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    auto it = std::find_if(handlers_.begin(), handlers_.end(),
                           [&name](const auto& entry) { return entry.first == name; });
    if (it != handlers_.end()) {
        it->second = std::move(handler);
        return;
    }
    handlers_.emplace_back(name, std::move(handler));
}

CommandResult CommandRegistry::execute_command(const std::vector<std::string>& args) {
    if (args.empty()) {
        return CommandResult::error("No command given");
    }
    
    auto* handler = find(args[0]);
    if (!handler) {
        return CommandResult::error("Unknown command: " + args[0]);
    }
    
    try {
        return handler->execute(args);
    } catch (const std::exception& e) {
        LOG_ERROR("Command '{}' failed: {}", args[0], e.what());
        return CommandResult::error(args[0] + " failed: " + e.what());
    }
}

bool CommandRegistry::has_command(const std::string& command) const {
    return find(command) != nullptr;
}

std::vector<CommandInfo> CommandRegistry::get_commands() const {
    std::vector<CommandInfo> commands;
    commands.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        commands.push_back(CommandInfo{name, handler->get_description(), handler->get_usage()});
    }
    return commands;
}

CommandHandler* CommandRegistry::find(const std::string& command) const {
    for (const auto& [name, handler] : handlers_) {
        if (name == command) {
            return handler.get();
        }
    }
    return nullptr;
}

}
