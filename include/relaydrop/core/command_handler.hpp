#pragma once

#include "relaydrop/core/result.hpp"
#include <string>
#include <vector>

namespace relaydrop::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }

    static CommandResult from(const Result& result, const std::string& context) {
        if (result) {
            return ok();
        }
        return error(context + ": " + result.message + " [" + to_string(result.error) + "]");
    }
};

// args[0] is the command name itself.
class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class RelayCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run the relay chunk store server"; }
    std::string get_usage() const override { return "relaydrop relay"; }
};

class SignalCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run the pairing code signaling server"; }
    std::string get_usage() const override { return "relaydrop signal"; }
};

class ManifestCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print the manifest of a file or folder"; }
    std::string get_usage() const override { return "relaydrop manifest <path>"; }
};

class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Share a file or folder behind a pairing code"; }
    std::string get_usage() const override { return "relaydrop send <path> [--mode relay|lan]"; }
};

class ReceiveCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download the transfer behind a pairing code"; }
    std::string get_usage() const override { return "relaydrop receive <code> <output> [--lan host:port]"; }
};

}
