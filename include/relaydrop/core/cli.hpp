#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relaydrop::core {

// Global options shared by every relaydrop command. Accepts "--name value",
// "--name=value", "-x value", "-xvalue" and clusters of short flags; a bare
// "--" ends option parsing.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "");

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    bool get_bool_option(const std::string& name, bool default_value = false) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct OptionSpec {
        char short_name = '\0';
        std::string long_name;
        std::string description;
        bool takes_value = false;
        std::string default_value;
    };

    const OptionSpec* find_long(const std::string& name) const;
    const OptionSpec* find_short(char name) const;
    std::optional<std::string> next_value(int argc, char* argv[], int& index, const std::string& shown_name);
    bool parse_long(const std::string& arg, int argc, char* argv[], int& index);
    bool parse_short_cluster(const std::string& arg, int argc, char* argv[], int& index);

    std::string program_name_;
    std::vector<OptionSpec> specs_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
