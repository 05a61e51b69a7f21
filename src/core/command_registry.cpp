#include "ferry/core/command_registry.hpp"
#include <iostream>
#include <iomanip>

namespace ferry::core {

CommandRegistry::CommandRegistry() {
    register_command("settings", std::make_unique<SettingsCommandHandler>());
    register_command("history", std::make_unique<HistoryCommandHandler>());
    register_command("stats", std::make_unique<StatsCommandHandler>());
    register_command("clear-history", std::make_unique<ClearHistoryCommandHandler>());
    register_command("hash", std::make_unique<HashCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command, 2);
    }
    
    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(15) << name 
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(15) << " " 
                  << "Usage: " << handler->get_usage() << "\n\n";
    }
}

}