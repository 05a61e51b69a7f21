#pragma once

#include "ferry/transfer/transfer_history.hpp"
#include "ferry/core/result.hpp"
#include <filesystem>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace ferry::storage {

// SQLite table of history snapshots, one flattened row per entry
class HistoryStore {
public:
    explicit HistoryStore(const std::filesystem::path& db_path);
    ~HistoryStore();
    
    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;
    
    bool initialize();
    
    core::Result append(const transfer::TransferHistoryEntry& entry);
    
    // Newest first; limit 0 loads everything
    core::Result load(std::vector<transfer::TransferHistoryEntry>& entries, std::size_t limit = 0);
    
    core::Result clear();
    core::Result trim(std::size_t keep);
    std::size_t count();
    
private:
    std::filesystem::path db_path_;
    sqlite3* db_;
    
    bool create_tables();
    core::Result error(const std::string& context) const;
    static transfer::TransferHistoryEntry read_row(sqlite3_stmt* stmt);
};

} // namespace ferry::storage
