#pragma once

#include <string>
#include <vector>

namespace peerdrop::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name itself.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class ServeCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run the signaling server"; }
    std::string get_usage() const override { return "peerdrop serve [port]"; }
};

class PeersCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List endpoints currently online"; }
    std::string get_usage() const override { return "peerdrop peers [identifier]"; }
};

class ReceiveCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Go online and save incoming files"; }
    std::string get_usage() const override { return "peerdrop receive <name> [port]"; }
};

class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send a file to one or more endpoints"; }
    std::string get_usage() const override { return "peerdrop send <file> <identifier>..."; }
};

}
