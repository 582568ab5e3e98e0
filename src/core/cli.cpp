#include "relaydrop/core/cli.hpp"
#include "relaydrop/core/utils.hpp"
#include "relaydrop/core/version.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace relaydrop::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.relaydrop.conf");
    add_option("", "verbose", "Enable verbose logging");
    add_option("m", "mode", "Transfer mode for send: relay or lan", true);
    add_option("", "lan", "Receive directly from a LAN sender at host:port", true);
    add_option("", "relay-url", "Relay server URL", true);
    add_option("", "signal-url", "Signaling server URL", true);
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    OptionSpec spec;
    spec.short_name = short_name.empty() ? '\0' : short_name.front();
    spec.long_name = long_name.empty() ? short_name : long_name;
    spec.description = description;
    spec.takes_value = has_value;
    spec.default_value = default_value;
    specs_.push_back(std::move(spec));
}

const CommandLineParser::OptionSpec* CommandLineParser::find_long(const std::string& name) const {
    for (const auto& spec : specs_) {
        if (spec.long_name == name) {
            return &spec;
        }
    }
    return nullptr;
}

const CommandLineParser::OptionSpec* CommandLineParser::find_short(char name) const {
    for (const auto& spec : specs_) {
        if (spec.short_name != '\0' && spec.short_name == name) {
            return &spec;
        }
    }
    return nullptr;
}

std::optional<std::string> CommandLineParser::next_value(int argc, char* argv[], int& index,
                                                         const std::string& shown_name) {
    if (index + 1 >= argc) {
        error_ = "Option " + shown_name + " requires a value";
        return std::nullopt;
    }
    return std::string(argv[++index]);
}

bool CommandLineParser::parse_long(const std::string& arg, int argc, char* argv[], int& index) {
    auto eq_pos = arg.find('=');
    auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

    const auto* spec = find_long(name);
    if (!spec) {
        error_ = "Unknown option: --" + name;
        return false;
    }

    if (!spec->takes_value) {
        if (eq_pos != std::string::npos) {
            error_ = "Option --" + name + " does not take a value";
            return false;
        }
        values_[spec->long_name] = "true";
        return true;
    }

    if (eq_pos != std::string::npos) {
        values_[spec->long_name] = arg.substr(eq_pos + 1);
        return true;
    }

    auto value = next_value(argc, argv, index, "--" + name);
    if (!value) {
        return false;
    }
    values_[spec->long_name] = *value;
    return true;
}

bool CommandLineParser::parse_short_cluster(const std::string& arg, int argc, char* argv[], int& index) {
    for (std::size_t pos = 1; pos < arg.size(); ++pos) {
        const auto* spec = find_short(arg[pos]);
        if (!spec) {
            error_ = std::string("Unknown option: -") + arg[pos];
            return false;
        }

        if (!spec->takes_value) {
            values_[spec->long_name] = "true";
            continue;
        }

        // "-mlan" carries its value inline; "-m lan" takes the next argument.
        if (pos + 1 < arg.size()) {
            values_[spec->long_name] = arg.substr(pos + 1);
            return true;
        }
        auto value = next_value(argc, argv, index, std::string("-") + arg[pos]);
        if (!value) {
            return false;
        }
        values_[spec->long_name] = *value;
        return true;
    }
    return true;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    values_.clear();
    positional_args_.clear();
    error_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(std::move(arg));
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        bool ok = arg.starts_with("--")
            ? parse_long(arg, argc, argv, i)
            : parse_short_cluster(arg, argc, argv, i);
        if (!ok) {
            return false;
        }
    }

    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const auto* spec = name.size() == 1 ? find_short(name.front()) : nullptr;
    return values_.count(spec ? spec->long_name : name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const auto* spec = name.size() == 1 ? find_short(name.front()) : nullptr;
    if (!spec) {
        spec = find_long(name);
    }
    const auto& key = spec ? spec->long_name : name;

    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    if (spec && !spec->default_value.empty()) {
        return spec->default_value;
    }
    return default_value;
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) return default_value;

    auto value = utils::StringUtils::to_lower(get_option(name));
    return value == "true" || value == "1" || value == "yes" || value.empty();
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& spec : specs_) {
        std::ostringstream flags;
        if (spec.short_name != '\0') {
            flags << '-' << spec.short_name << ", ";
        }
        flags << "--" << spec.long_name;
        if (spec.takes_value) {
            flags << " <value>";
        }

        std::cout << "  " << std::left << std::setw(26) << flags.str() << spec.description;
        if (!spec.default_value.empty()) {
            std::cout << " (default: " << spec.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " " << VERSION << "\n";
}

}
