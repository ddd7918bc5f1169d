#include "peerdrop/core/cli.hpp"
#include "peerdrop/core/command_registry.hpp"
#include <iomanip>

namespace peerdrop::core {

namespace {
constexpr const char* VERSION = "0.1.0";
constexpr int OPTION_COLUMN = 28;
constexpr int COMMAND_COLUMN = 10;
}

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name))
    , options_{
        {'h', "help", "", "Show this help message"},
        {'v', "version", "", "Show version information"},
        {'c', "config", "file", "Settings file (default ~/.peerdrop.conf)"},
        {'s', "signaling", "host:port", "Signaling server, overrides signaling.host/port"},
        {'\0', "verbose", "", "Log at debug level"},
    } {
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();
    
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (options_done || !positional_args_.empty() || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
            continue;
        }
        
        if (arg == "--") {
            options_done = true;
            continue;
        }
        
        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
            const auto* option = find_option(name);
            if (!option) {
                error_ = "Unknown option: --" + name;
                return false;
            }
            
            if (option->value_name.empty()) {
                if (eq_pos != std::string::npos) {
                    error_ = "Option --" + name + " takes no value";
                    return false;
                }
                parsed_options_[name] = "true";
            } else if (eq_pos != std::string::npos) {
                parsed_options_[name] = arg.substr(eq_pos + 1);
            } else if (!take_value(*option, i, argc, argv, "--" + name)) {
                return false;
            }
            continue;
        }
        
        // Clustered short flags: -hv, or -cFILE / -c FILE for a valued option.
        for (std::size_t j = 1; j < arg.size(); ++j) {
            const auto* option = find_option(arg[j]);
            if (!option) {
                error_ = std::string("Unknown option: -") + arg[j];
                return false;
            }
            
            if (option->value_name.empty()) {
                parsed_options_[option->long_name] = "true";
                continue;
            }
            
            if (j + 1 < arg.size()) {
                parsed_options_[option->long_name] = arg.substr(j + 1);
            } else if (!take_value(*option, i, argc, argv, std::string("-") + arg[j])) {
                return false;
            }
            break;
        }
    }
    
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(name) != 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto it = parsed_options_.find(name);
    return it != parsed_options_.end() ? it->second : default_value;
}

void CommandLineParser::print_help(const CommandRegistry& commands, std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";
    
    for (const auto& option : options_) {
        std::string flags = option.short_name ? std::string("-") + option.short_name + ", " : "    ";
        flags += "--" + option.long_name;
        if (!option.value_name.empty()) {
            flags += " <" + option.value_name + ">";
        }
        out << "  " << std::left << std::setw(OPTION_COLUMN) << flags << option.description << "\n";
    }
    
    out << "\nCommands:\n";
    for (const auto& command : commands.get_commands()) {
        out << "  " << std::left << std::setw(COMMAND_COLUMN) << command.name << command.description << "\n";
        out << "  " << std::setw(COMMAND_COLUMN) << "" << command.usage << "\n";
    }
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " version " << VERSION << "\n";
}

const CommandLineParser::Option* CommandLineParser::find_option(const std::string& long_name) const {
    for (const auto& option : options_) {
        if (option.long_name == long_name) {
            return &option;
        }
    }
    return nullptr;
}

const CommandLineParser::Option* CommandLineParser::find_option(char short_name) const {
    if (short_name == '\0') {
        return nullptr;
    }
    for (const auto& option : options_) {
        if (option.short_name == short_name) {
            return &option;
        }
    }
    return nullptr;
}

bool CommandLineParser::take_value(const Option& option, int& index, int argc, char* argv[],
                                   const std::string& spelled) {
    if (index + 1 >= argc) {
        error_ = "Option " + spelled + " requires a <" + option.value_name + ">";
        return false;
    }
    parsed_options_[option.long_name] = argv[++index];
    return true;
}

}
