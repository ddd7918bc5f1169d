#pragma once

#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace peerdrop::core {

class CommandRegistry;

// Global options come before the command. The first positional argument
// names the command and every argument after it is passed through unparsed,
// so "send -x.bin bob@host:7002" reaches the send command intact.
class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name);
    
    bool parse(int argc, char* argv[]);
    
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }
    
    void print_help(const CommandRegistry& commands, std::ostream& out = std::cout) const;
    void print_version(std::ostream& out = std::cout) const;

private:
    struct Option {
        char short_name;
        std::string long_name;
        std::string value_name;
        std::string description;
    };
    
    const Option* find_option(const std::string& long_name) const;
    const Option* find_option(char short_name) const;
    bool take_value(const Option& option, int& index, int argc, char* argv[], const std::string& spelled);
    
    std::string program_name_;
    std::vector<Option> options_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
