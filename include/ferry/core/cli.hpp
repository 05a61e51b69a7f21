#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ferry::core {

struct CliOptions {
    std::filesystem::path config_path = "~/.ferry.conf";
    std::optional<std::filesystem::path> database_path;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;

    // Command name first, then its arguments
    std::vector<std::string> command_args;
};

// Parses `ferry [options] <command> [args...]`. Options may appear anywhere
// before a bare `--`; everything after it is passed to the command.
class CommandLineParser {
public:
    explicit CommandLineParser(std::string program_name);

    bool parse(int argc, char* argv[]);
    bool parse(const std::vector<std::string>& args);

    const CliOptions& options() const { return options_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    enum class OptionId { HELP, VERSION, CONFIG, DATABASE, VERBOSE };

    struct OptionSpec {
        OptionId id;
        char short_name;
        const char* long_name;
        const char* description;
        bool takes_value;
    };

    static const std::vector<OptionSpec>& option_specs();
    static const OptionSpec* find_long(const std::string& name);
    static const OptionSpec* find_short(char name);

    bool apply(const OptionSpec& spec, const std::string& value);
    bool fail(std::string message);

    std::string program_name_;
    CliOptions options_;
    std::string error_;
};

}
