#pragma once

#include "transfer_types.hpp"
#include "ferry/core/result.hpp"
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>

namespace ferry::storage {
class HistoryStore;
}

namespace ferry::transfer {

// Snapshot of a record at a terminal transition
struct TransferHistoryEntry {
    std::string id;
    TransferRecord transfer;
    TimePoint timestamp{};
    std::chrono::milliseconds duration{0};
    bool success = false;
};

struct BreakdownItem {
    std::string name;
    std::uint64_t count = 0;
    std::uint64_t bytes = 0;
};

struct TransferStats {
    std::uint64_t today_transferred = 0;
    std::uint64_t week_transferred = 0;
    std::uint64_t month_transferred = 0;
    std::uint64_t all_time_transferred = 0;
    std::uint64_t uploads_count = 0;
    std::uint64_t downloads_count = 0;
    std::uint64_t failed_count = 0;
    double average_speed = 0.0;
    double peak_speed = 0.0;
    std::vector<BreakdownItem> top_destinations;
    std::vector<BreakdownItem> file_types;
};

// Append-only outcome log, newest first. Optionally bounded and written
// through to a HistoryStore.
class HistoryLog {
public:
    static constexpr std::size_t TOP_DESTINATIONS = 5;
    
    explicit HistoryLog(std::uint64_t limit = 0);
    
    void attach_store(storage::HistoryStore* store);
    core::Result load_from_store();
    
    // Builds the entry from a record that just entered a finished state
    TransferHistoryEntry record(const TransferRecord& transfer, TimePoint now);
    void append(TransferHistoryEntry entry);
    
    std::vector<TransferHistoryEntry> entries(std::size_t limit = 0) const;
    std::size_t size() const;
    core::Result clear();
    
    void set_limit(std::uint64_t limit);
    std::uint64_t limit() const;
    
    TransferStats stats(TimePoint now) const;
    
    static std::string file_category(const std::string& file_name);
    static std::string destination_name(const TransferRecord& transfer);
    
private:
    std::deque<TransferHistoryEntry> entries_;
    std::uint64_t limit_;
    storage::HistoryStore* store_ = nullptr;
    mutable std::mutex mutex_;
    
    void enforce_limit();
    std::string generate_entry_id();
};

} // namespace ferry::transfer
