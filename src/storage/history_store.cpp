#include "ferry/storage/history_store.hpp"
#include "ferry/core/logger.hpp"
#include "ferry/core/utils.hpp"
#include <sqlite3.h>

namespace ferry::storage {

namespace {

using ferry::core::utils::TimeUtils;

void bind_optional_text(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bind_optional_time(sqlite3_stmt* stmt, int index, const std::optional<transfer::TimePoint>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, index, TimeUtils::to_millis(*value));
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::string column_text(sqlite3_stmt* stmt, int index) {
    auto text = sqlite3_column_text(stmt, index);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> column_optional_text(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_text(stmt, index);
}

std::optional<transfer::TimePoint> column_optional_time(sqlite3_stmt* stmt, int index) {
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return TimeUtils::from_millis(sqlite3_column_int64(stmt, index));
}

} // namespace

HistoryStore::HistoryStore(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

HistoryStore::~HistoryStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool HistoryStore::initialize() {
    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open history database {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        return false;
    }
    
    return create_tables();
}

bool HistoryStore::create_tables() {
    const char* create_history_table = R"(
        CREATE TABLE IF NOT EXISTS transfer_history (
            entry_id TEXT PRIMARY KEY,
            timestamp INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            transfer_id TEXT NOT NULL,
            protocol TEXT NOT NULL,
            direction TEXT NOT NULL,
            status TEXT NOT NULL,
            source_path TEXT NOT NULL,
            destination_path TEXT NOT NULL,
            file_name TEXT NOT NULL,
            total_size INTEGER NOT NULL,
            transferred_bytes INTEGER NOT NULL,
            average_speed REAL NOT NULL,
            peak_speed REAL NOT NULL,
            created_at INTEGER NOT NULL,
            started_at INTEGER,
            completed_at INTEGER,
            error TEXT,
            retry_count INTEGER NOT NULL,
            site_id TEXT,
            device_id TEXT,
            content_hash TEXT,
            verified INTEGER NOT NULL,
            priority INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_history_timestamp ON transfer_history(timestamp);
    )";
    
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, create_history_table, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create history table: {}", error_msg ? error_msg : "unknown error");
        sqlite3_free(error_msg);
        return false;
    }
    
    return true;
}

core::Result HistoryStore::append(const transfer::TransferHistoryEntry& entry) {
    if (!db_) {
        return core::Result(core::ErrorCode::STORAGE_ERROR, "History store not initialized");
    }
    
    const char* insert_sql = R"(
        INSERT OR REPLACE INTO transfer_history
        (entry_id, timestamp, duration_ms, success, transfer_id, protocol, direction, status,
         source_path, destination_path, file_name, total_size, transferred_bytes,
         average_speed, peak_speed, created_at, started_at, completed_at, error,
         retry_count, site_id, device_id, content_hash, verified, priority)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return error("prepare history insert");
    }
    
    const auto& t = entry.transfer;
    std::string protocol(transfer::to_string(t.protocol));
    std::string direction(transfer::to_string(t.direction));
    std::string status(transfer::to_string(t.status));
    
    sqlite3_bind_text(stmt, 1, entry.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, TimeUtils::to_millis(entry.timestamp));
    sqlite3_bind_int64(stmt, 3, entry.duration.count());
    sqlite3_bind_int(stmt, 4, entry.success ? 1 : 0);
    sqlite3_bind_text(stmt, 5, t.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, protocol.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 7, direction.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 8, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 9, t.source_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 10, t.destination_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 11, t.file_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 12, static_cast<sqlite3_int64>(t.total_size));
    sqlite3_bind_int64(stmt, 13, static_cast<sqlite3_int64>(t.transferred_bytes));
    sqlite3_bind_double(stmt, 14, t.average_speed);
    sqlite3_bind_double(stmt, 15, t.peak_speed);
    sqlite3_bind_int64(stmt, 16, TimeUtils::to_millis(t.created_at));
    bind_optional_time(stmt, 17, t.started_at);
    bind_optional_time(stmt, 18, t.completed_at);
    bind_optional_text(stmt, 19, t.error);
    sqlite3_bind_int64(stmt, 20, t.retry_count);
    bind_optional_text(stmt, 21, t.site_id);
    bind_optional_text(stmt, 22, t.device_id);
    bind_optional_text(stmt, 23, t.content_hash);
    sqlite3_bind_int(stmt, 24, t.verified ? 1 : 0);
    sqlite3_bind_int(stmt, 25, t.priority);
    
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return error("insert history entry");
    }
    return core::Result::ok();
}

core::Result HistoryStore::load(std::vector<transfer::TransferHistoryEntry>& entries, std::size_t limit) {
    if (!db_) {
        return core::Result(core::ErrorCode::STORAGE_ERROR, "History store not initialized");
    }
    
    const char* select_sql = R"(
        SELECT entry_id, timestamp, duration_ms, success, transfer_id, protocol, direction, status,
               source_path, destination_path, file_name, total_size, transferred_bytes,
               average_speed, peak_speed, created_at, started_at, completed_at, error,
               retry_count, site_id, device_id, content_hash, verified, priority
        FROM transfer_history
        ORDER BY timestamp DESC, rowid DESC
        LIMIT ?;
    )";
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return error("prepare history select");
    }
    
    sqlite3_bind_int64(stmt, 1, limit > 0 ? static_cast<sqlite3_int64>(limit) : -1);
    
    entries.clear();
    int result;
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        entries.push_back(read_row(stmt));
    }
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return error("read history");
    }
    return core::Result::ok();
}

core::Result HistoryStore::clear() {
    if (!db_) {
        return core::Result(core::ErrorCode::STORAGE_ERROR, "History store not initialized");
    }
    
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, "DELETE FROM transfer_history;", nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        std::string message = error_msg ? error_msg : "unknown error";
        sqlite3_free(error_msg);
        return core::Result(core::ErrorCode::STORAGE_ERROR, "Failed to clear history: " + message);
    }
    return core::Result::ok();
}

core::Result HistoryStore::trim(std::size_t keep) {
    if (!db_) {
        return core::Result(core::ErrorCode::STORAGE_ERROR, "History store not initialized");
    }
    if (keep == 0) {
        return core::Result::ok();
    }
    
    const char* trim_sql = R"(
        DELETE FROM transfer_history WHERE entry_id NOT IN (
            SELECT entry_id FROM transfer_history ORDER BY timestamp DESC, rowid DESC LIMIT ?
        );
    )";
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, trim_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return error("prepare history trim");
    }
    
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(keep));
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return error("trim history");
    }
    return core::Result::ok();
}

std::size_t HistoryStore::count() {
    if (!db_) {
        return 0;
    }
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM transfer_history;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    
    std::size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}

core::Result HistoryStore::error(const std::string& context) const {
    return core::Result(core::ErrorCode::STORAGE_ERROR,
                        "Failed to " + context + ": " + sqlite3_errmsg(db_));
}

transfer::TransferHistoryEntry HistoryStore::read_row(sqlite3_stmt* stmt) {
    transfer::TransferHistoryEntry entry;
    entry.id = column_text(stmt, 0);
    entry.timestamp = TimeUtils::from_millis(sqlite3_column_int64(stmt, 1));
    entry.duration = std::chrono::milliseconds(sqlite3_column_int64(stmt, 2));
    entry.success = sqlite3_column_int(stmt, 3) != 0;
    
    auto& t = entry.transfer;
    t.id = column_text(stmt, 4);
    t.protocol = transfer::parse_protocol(column_text(stmt, 5)).value_or(transfer::Protocol::SFTP);
    t.direction = transfer::parse_direction(column_text(stmt, 6)).value_or(transfer::Direction::DOWNLOAD);
    t.status = transfer::parse_status(column_text(stmt, 7)).value_or(
        entry.success ? transfer::TransferStatus::COMPLETED : transfer::TransferStatus::FAILED);
    t.source_path = column_text(stmt, 8);
    t.destination_path = column_text(stmt, 9);
    t.file_name = column_text(stmt, 10);
    t.total_size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 11));
    t.transferred_bytes = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 12));
    t.average_speed = sqlite3_column_double(stmt, 13);
    t.peak_speed = sqlite3_column_double(stmt, 14);
    t.created_at = TimeUtils::from_millis(sqlite3_column_int64(stmt, 15));
    t.started_at = column_optional_time(stmt, 16);
    t.completed_at = column_optional_time(stmt, 17);
    t.error = column_optional_text(stmt, 18);
    t.retry_count = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 19));
    t.site_id = column_optional_text(stmt, 20);
    t.device_id = column_optional_text(stmt, 21);
    t.content_hash = column_optional_text(stmt, 22);
    t.verified = sqlite3_column_int(stmt, 23) != 0;
    t.priority = sqlite3_column_int(stmt, 24);
    t.update_progress();
    
    return entry;
}

} // namespace ferry::storage
