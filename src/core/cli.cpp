#include "ferry/core/cli.hpp"
#include "ferry/core/utils.hpp"
#include <iostream>
#include <iomanip>
#include <utility>

namespace ferry::core {

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {
}

const std::vector<CommandLineParser::OptionSpec>& CommandLineParser::option_specs() {
    static const std::vector<OptionSpec> specs = {
        {OptionId::HELP, 'h', "help", "Show this help message", false},
        {OptionId::VERSION, 'v', "version", "Show version information", false},
        {OptionId::CONFIG, 'c', "config", "Configuration file (default: ~/.ferry.conf)", true},
        {OptionId::DATABASE, 'd', "db", "SQLite database holding settings and history", true},
        {OptionId::VERBOSE, '\0', "verbose", "Log at debug level", false},
    };
    return specs;
}

const CommandLineParser::OptionSpec* CommandLineParser::find_long(const std::string& name) {
    for (const auto& spec : option_specs()) {
        if (name == spec.long_name) return &spec;
    }
    return nullptr;
}

const CommandLineParser::OptionSpec* CommandLineParser::find_short(char name) {
    for (const auto& spec : option_specs()) {
        if (spec.short_name != '\0' && spec.short_name == name) return &spec;
    }
    return nullptr;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

bool CommandLineParser::parse(const std::vector<std::string>& args) {
    options_ = CliOptions();
    error_.clear();

    bool options_done = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            options_.command_args.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);

            const auto* spec = find_long(name);
            if (!spec) {
                return fail("Unknown option: --" + name);
            }

            if (!spec->takes_value) {
                if (eq_pos != std::string::npos) {
                    return fail("Option --" + name + " does not take a value");
                }
                if (!apply(*spec, "")) return false;
            } else if (eq_pos != std::string::npos) {
                if (!apply(*spec, arg.substr(eq_pos + 1))) return false;
            } else if (i + 1 < args.size()) {
                if (!apply(*spec, args[++i])) return false;
            } else {
                return fail("Option --" + name + " requires a value");
            }
            continue;
        }

        // Short flags may be grouped; a value-taking flag consumes the rest or the next argument
        for (std::size_t j = 1; j < arg.size(); ++j) {
            const auto* spec = find_short(arg[j]);
            if (!spec) {
                return fail(std::string("Unknown option: -") + arg[j]);
            }

            if (!spec->takes_value) {
                if (!apply(*spec, "")) return false;
                continue;
            }

            if (j + 1 < arg.size()) {
                if (!apply(*spec, arg.substr(j + 1))) return false;
            } else if (i + 1 < args.size()) {
                if (!apply(*spec, args[++i])) return false;
            } else {
                return fail(std::string("Option -") + arg[j] + " requires a value");
            }
            break;
        }
    }

    return true;
}

bool CommandLineParser::apply(const OptionSpec& spec, const std::string& value) {
    switch (spec.id) {
        case OptionId::HELP:
            options_.show_help = true;
            return true;
        case OptionId::VERSION:
            options_.show_version = true;
            return true;
        case OptionId::VERBOSE:
            options_.verbose = true;
            return true;
        case OptionId::CONFIG:
            if (utils::StringUtils::trim(value).empty()) {
                return fail("Option --config requires a file path");
            }
            options_.config_path = value;
            return true;
        case OptionId::DATABASE: {
            if (utils::StringUtils::trim(value).empty()) {
                return fail("Option --db requires a file path");
            }
            auto path = utils::FileUtils::expand_home(value);
            std::error_code ec;
            if (std::filesystem::is_directory(path, ec)) {
                return fail("Database path is a directory: " + path.string());
            }
            options_.database_path = path;
            return true;
        }
    }
    return fail("Unhandled option --" + std::string(spec.long_name));
}

bool CommandLineParser::fail(std::string message) {
    error_ = std::move(message);
    return false;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& spec : option_specs()) {
        std::string flags = spec.short_name != '\0'
            ? std::string("-") + spec.short_name + ", --" + spec.long_name
            : std::string("    --") + spec.long_name;
        if (spec.takes_value) {
            flags += " <path>";
        }
        std::cout << "  " << std::left << std::setw(24) << flags << spec.description << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 0.4.0\n";
}

}
