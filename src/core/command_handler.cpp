#include "ferry/core/command_handler.hpp"
#include "ferry/core/logger.hpp"
#include "ferry/core/config.hpp"
#include "ferry/core/utils.hpp"
#include "ferry/crypto/content_hasher.hpp"
#include "ferry/storage/history_store.hpp"
#include "ferry/storage/settings_store.hpp"
#include "ferry/transfer/transfer_history.hpp"
#include "ferry/transfer/transfer_settings.hpp"
#include <charconv>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace ferry::core {

using utils::FileUtils;
using utils::StringUtils;
using utils::TimeUtils;

std::filesystem::path CommandHandler::database_path() {
    return FileUtils::expand_home(Config::instance().get_string("storage.database", "ferry.db"));
}

CommandResult SettingsCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 1 && args.size() != 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    storage::SettingsStore store(database_path());
    if (!store.initialize()) {
        return CommandResult::error("Failed to open settings database");
    }
    
    transfer::TransferSettings settings;
    auto loaded = store.load(settings);
    if (!loaded) {
        return CommandResult::error("Failed to load settings: " + loaded.message);
    }
    
    if (args.size() == 3) {
        auto applied = settings.apply(args[1], args[2]);
        if (!applied) {
            return CommandResult::error(applied.message);
        }
        auto valid = settings.validate();
        if (!valid) {
            return CommandResult::error(valid.message);
        }
        auto saved = store.save(settings);
        if (!saved) {
            return CommandResult::error("Failed to save settings: " + saved.message);
        }
        LOG_INFO("Setting {} changed to {}", args[1], args[2]);
        return CommandResult::ok(args[1] + " = " + args[2]);
    }
    
    Config view;
    settings.store(view);
    for (const auto& key : transfer::TransferSettings::keys()) {
        std::cout << std::left << std::setw(34) << key << view.get_string(key) << "\n";
    }
    return CommandResult::ok();
}

CommandResult HistoryCommandHandler::execute(const std::vector<std::string>& args) {
    std::size_t limit = 20;
    if (args.size() > 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    if (args.size() == 2) {
        const auto& text = args[1];
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), limit);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            return CommandResult::error("Invalid limit: " + text);
        }
    }
    
    storage::HistoryStore store(database_path());
    if (!store.initialize()) {
        return CommandResult::error("Failed to open history database");
    }
    
    std::vector<transfer::TransferHistoryEntry> entries;
    auto loaded = store.load(entries, limit);
    if (!loaded) {
        return CommandResult::error("Failed to load history: " + loaded.message);
    }
    
    if (entries.empty()) {
        std::cout << "No transfers recorded\n";
        return CommandResult::ok();
    }
    
    for (const auto& entry : entries) {
        const auto& t = entry.transfer;
        std::cout << TimeUtils::format_timestamp(entry.timestamp) << "  "
                  << std::left << std::setw(10) << transfer::to_string(t.status) << " "
                  << std::setw(9) << transfer::to_string(t.direction) << " "
                  << std::setw(6) << transfer::to_string(t.protocol) << " "
                  << t.file_name << " (" << StringUtils::format_bytes(t.transferred_bytes) << ", "
                  << StringUtils::format_duration(entry.duration) << ")";
        if (t.error) {
            std::cout << " - " << *t.error;
        }
        std::cout << "\n";
    }
    return CommandResult::ok();
}

CommandResult StatsCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;
    
    storage::HistoryStore store(database_path());
    if (!store.initialize()) {
        return CommandResult::error("Failed to open history database");
    }
    
    transfer::HistoryLog history;
    history.attach_store(&store);
    auto loaded = history.load_from_store();
    if (!loaded) {
        return CommandResult::error("Failed to load history: " + loaded.message);
    }
    
    auto stats = history.stats(std::chrono::system_clock::now());
    
    std::cout << "Transferred today:      " << StringUtils::format_bytes(stats.today_transferred) << "\n";
    std::cout << "Transferred this week:  " << StringUtils::format_bytes(stats.week_transferred) << "\n";
    std::cout << "Transferred this month: " << StringUtils::format_bytes(stats.month_transferred) << "\n";
    std::cout << "Transferred all time:   " << StringUtils::format_bytes(stats.all_time_transferred) << "\n";
    std::cout << "Uploads:   " << stats.uploads_count << "\n";
    std::cout << "Downloads: " << stats.downloads_count << "\n";
    std::cout << "Failed:    " << stats.failed_count << "\n";
    std::cout << "Average speed: " << StringUtils::format_speed(stats.average_speed) << "\n";
    std::cout << "Peak speed:    " << StringUtils::format_speed(stats.peak_speed) << "\n";
    
    if (!stats.top_destinations.empty()) {
        std::cout << "\nTop destinations:\n";
        for (const auto& item : stats.top_destinations) {
            std::cout << "  " << std::left << std::setw(30) << item.name << item.count << " transfers, "
                      << StringUtils::format_bytes(item.bytes) << "\n";
        }
    }
    if (!stats.file_types.empty()) {
        std::cout << "\nFile types:\n";
        for (const auto& item : stats.file_types) {
            std::cout << "  " << std::left << std::setw(30) << item.name << item.count << " files, "
                      << StringUtils::format_bytes(item.bytes) << "\n";
        }
    }
    return CommandResult::ok();
}

CommandResult ClearHistoryCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;
    
    storage::HistoryStore store(database_path());
    if (!store.initialize()) {
        return CommandResult::error("Failed to open history database");
    }
    
    auto removed = store.count();
    auto cleared = store.clear();
    if (!cleared) {
        return CommandResult::error("Failed to clear history: " + cleared.message);
    }
    return CommandResult::ok("Removed " + std::to_string(removed) + " history entries");
}

CommandResult HashCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path file_path = args[1];
    if (!FileUtils::is_file(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }
    
    crypto::ContentHash digest{};
    auto hashed = crypto::ContentHasher::hash_file(file_path, digest);
    if (!hashed) {
        return CommandResult::error(hashed.message);
    }
    
    std::cout << crypto::ContentHasher::hash_to_hex(digest) << "  " << file_path.string() << "\n";
    return CommandResult::ok();
}

}
