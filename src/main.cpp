#include <iostream>
#include <string>
#include <vector>
#include "ferry/core/logger.hpp"
#include "ferry/core/config.hpp"
#include "ferry/core/cli.hpp"
#include "ferry/core/utils.hpp"
#include "ferry/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    ferry::core::CommandLineParser parser("ferry");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    const auto& options = parser.options();
    
    if (options.show_help) {
        parser.print_help();
        return 0;
    }
    
    if (options.show_version) {
        parser.print_version();
        return 0;
    }
    
    auto& config = ferry::core::Config::instance();
    config.set_defaults();
    
    auto config_file = ferry::core::utils::FileUtils::expand_home(options.config_path.string());
    if (ferry::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Warning: failed to read " << config_file.string() << "\n";
        }
    }
    
    if (options.database_path) {
        config.set("storage.database", options.database_path->string());
    }
    
    auto log_level = options.verbose ?
        ferry::core::LogLevel::Debug :
        ferry::core::Logger::parse_level(config.get_string("log.level", "info"));
    ferry::core::Logger::initialize(config.get_string("log.file", "ferry.log"), log_level);
    
    LOG_DEBUG("ferry starting up");
    
    ferry::core::CommandRegistry command_registry;
    
    const auto& args = options.command_args;
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
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }
    
    ferry::core::Logger::shutdown();
    return result.exit_code;
}
