#include "ferry/storage/settings_store.hpp"
#include "ferry/core/config.hpp"
#include "ferry/core/logger.hpp"
#include <sqlite3.h>

namespace ferry::storage {

SettingsStore::SettingsStore(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

SettingsStore::~SettingsStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SettingsStore::initialize() {
    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open settings database {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        return false;
    }
    
    return create_tables();
}

bool SettingsStore::create_tables() {
    const char* create_settings_table = R"(
        CREATE TABLE IF NOT EXISTS settings (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now'))
        );
    )";
    
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, create_settings_table, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create settings table: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }
    
    return true;
}

core::Result SettingsStore::load(transfer::TransferSettings& settings) {
    std::string text;
    auto result = get_raw(SETTINGS_KEY, text);
    if (result.error == core::ErrorCode::NOT_FOUND) {
        settings = transfer::TransferSettings();
        return core::Result::ok();
    }
    if (!result) {
        return result;
    }
    
    core::Config config;
    config.load_from_string(text);
    settings = transfer::TransferSettings::from_config(config);
    return core::Result::ok();
}

core::Result SettingsStore::save(const transfer::TransferSettings& settings) {
    core::Config config;
    settings.store(config);
    return put_raw(SETTINGS_KEY, config.to_string());
}

core::Result SettingsStore::get_raw(const std::string& key, std::string& value) {
    if (!db_) {
        return core::Result(core::ErrorCode::STORAGE_ERROR, "Settings store not initialized");
    }
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM settings WHERE key = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        return core::Result(core::ErrorCode::STORAGE_ERROR,
                            std::string("Failed to prepare settings query: ") + sqlite3_errmsg(db_));
    }
    
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    
    int result = sqlite3_step(stmt);
    if (result == SQLITE_ROW) {
        auto text = sqlite3_column_text(stmt, 0);
        value = text ? reinterpret_cast<const char*>(text) : "";
        sqlite3_finalize(stmt);
        return core::Result::ok();
    }
    
    sqlite3_finalize(stmt);
    if (result == SQLITE_DONE) {
        return core::Result(core::ErrorCode::NOT_FOUND, "No stored value for " + key);
    }
    return core::Result(core::ErrorCode::STORAGE_ERROR,
                        std::string("Failed to read setting: ") + sqlite3_errmsg(db_));
}

core::Result SettingsStore::put_raw(const std::string& key, const std::string& value) {
    if (!db_) {
        return core::Result(core::ErrorCode::STORAGE_ERROR, "Settings store not initialized");
    }
    
    const char* upsert_sql = R"(
        INSERT OR REPLACE INTO settings (key, value, updated_at)
        VALUES (?, ?, strftime('%s', 'now'));
    )";
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, upsert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return core::Result(core::ErrorCode::STORAGE_ERROR,
                            std::string("Failed to prepare settings update: ") + sqlite3_errmsg(db_));
    }
    
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
    
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return core::Result(core::ErrorCode::STORAGE_ERROR,
                            std::string("Failed to write setting: ") + sqlite3_errmsg(db_));
    }
    
    LOG_DEBUG("Persisted {}", key);
    return core::Result::ok();
}

} // namespace ferry::storage
