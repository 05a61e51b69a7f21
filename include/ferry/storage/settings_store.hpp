#pragma once

#include "ferry/transfer/transfer_settings.hpp"
#include "ferry/core/result.hpp"
#include <filesystem>
#include <string>

struct sqlite3;

namespace ferry::storage {

// Key/value table. Transfer settings live under one key as key=value text.
class SettingsStore {
public:
    static constexpr const char* SETTINGS_KEY = "ferry.transfer_settings";
    
    explicit SettingsStore(const std::filesystem::path& db_path);
    ~SettingsStore();
    
    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;
    
    bool initialize();
    
    // Defaults merged with whatever was stored
    core::Result load(transfer::TransferSettings& settings);
    core::Result save(const transfer::TransferSettings& settings);
    
    core::Result get_raw(const std::string& key, std::string& value);
    core::Result put_raw(const std::string& key, const std::string& value);
    
private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    
    bool create_tables();
};

} // namespace ferry::storage
