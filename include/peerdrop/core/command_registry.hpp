#pragma once

#include "peerdrop/core/command_handler.hpp"
#include <memory>
#include <utility>

namespace peerdrop::core {

struct CommandInfo {
    std::string name;
    std::string description;
    std::string usage;
};

class CommandRegistry {
public:
    // Registers serve, peers, receive and send.
    CommandRegistry();
    
    // Replaces a handler already registered under the same name.
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    
    // args[0] names the command. A handler that throws is reported as an error result.
    CommandResult execute_command(const std::vector<std::string>& args);
    
    bool has_command(const std::string& command) const;
    
    // In registration order.
    std::vector<CommandInfo> get_commands() const;

private:
    CommandHandler* find(const std::string& command) const;
    
    std::vector<std::pair<std::string, std::unique_ptr<CommandHandler>>> handlers_;
};

}
