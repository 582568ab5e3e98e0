#include <iostream>
#include <string>
#include <vector>
#include "relaydrop/core/logger.hpp"
#include "relaydrop/core/config.hpp"
#include "relaydrop/core/cli.hpp"
#include "relaydrop/core/utils.hpp"
#include "relaydrop/core/command_registry.hpp"
#include "relaydrop/crypto/random.hpp"

int main(int argc, char* argv[]) {
    relaydrop::core::CommandLineParser parser("relaydrop");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        relaydrop::core::CommandRegistry().print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = relaydrop::core::Config::instance();
    config.set_defaults();

    auto config_file = relaydrop::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.relaydrop.conf"));
    if (relaydrop::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Error: cannot read configuration file " << config_file.string() << "\n";
            return 1;
        }
    }

    // Command line options take precedence over the configuration file.
    if (parser.has_option("mode")) config.set("transfer.mode", parser.get_option("mode"));
    if (parser.has_option("lan")) config.set("lan.peer", parser.get_option("lan"));
    if (parser.has_option("relay-url")) config.set("relay.url", parser.get_option("relay-url"));
    if (parser.has_option("signal-url")) config.set("signaling.url", parser.get_option("signal-url"));

    auto log_level = parser.has_option("verbose")
        ? relaydrop::core::LogLevel::Debug
        : relaydrop::core::parse_log_level(config.get_string("log.level", "info"));
    relaydrop::core::Logger::initialize(config.get_string("log.file", "relaydrop.log"), log_level);

    if (!relaydrop::crypto::SecureRandom::initialize()) {
        LOG_CRITICAL("libsodium initialization failed");
        return 1;
    }

    relaydrop::core::CommandRegistry command_registry;

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }

    relaydrop::core::Logger::shutdown();
    return result.exit_code;
}
