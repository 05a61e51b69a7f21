#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ferry::core {

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
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
    
protected:
    static std::filesystem::path database_path();
};

class SettingsCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show or change transfer settings"; }
    std::string get_usage() const override { return "ferry settings [<key> <value>]"; }
};

class HistoryCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List finished transfers, newest first"; }
    std::string get_usage() const override { return "ferry history [limit]"; }
};

class StatsCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show transfer statistics"; }
    std::string get_usage() const override { return "ferry stats"; }
};

class ClearHistoryCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Delete all transfer history"; }
    std::string get_usage() const override { return "ferry clear-history"; }
};

class HashCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print the content hash of a file"; }
    std::string get_usage() const override { return "ferry hash <file>"; }
};

}
