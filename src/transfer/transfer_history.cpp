#include "ferry/transfer/transfer_history.hpp"
#include "ferry/storage/history_store.hpp"
#include "ferry/core/logger.hpp"
#include "ferry/core/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <map>
#include <random>
#include <sstream>
#include <unordered_map>

namespace ferry::transfer {

namespace {

std::vector<BreakdownItem> sorted_breakdown(const std::map<std::string, BreakdownItem>& items) {
    std::vector<BreakdownItem> result;
    result.reserve(items.size());
    for (const auto& [name, item] : items) {
        result.push_back(item);
    }
    std::stable_sort(result.begin(), result.end(), [](const BreakdownItem& a, const BreakdownItem& b) {
        if (a.count != b.count) return a.count > b.count;
        return a.bytes > b.bytes;
    });
    return result;
}

} // namespace

HistoryLog::HistoryLog(std::uint64_t limit)
    : limit_(limit)
{
}

void HistoryLog::attach_store(storage::HistoryStore* store) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_ = store;
}

core::Result HistoryLog::load_from_store() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!store_) {
        return core::Result(core::ErrorCode::STORAGE_ERROR, "No history store attached");
    }
    
    std::vector<TransferHistoryEntry> loaded;
    auto result = store_->load(loaded, static_cast<std::size_t>(limit_));
    if (!result) {
        return result;
    }
    
    entries_.assign(loaded.begin(), loaded.end());
    LOG_DEBUG("Loaded {} history entries", entries_.size());
    return core::Result::ok();
}

TransferHistoryEntry HistoryLog::record(const TransferRecord& transfer, TimePoint now) {
    TransferHistoryEntry entry;
    entry.id = generate_entry_id();
    entry.transfer = transfer;
    entry.transfer.chunks.reset();
    entry.timestamp = now;
    entry.success = transfer.status == TransferStatus::COMPLETED;
    
    if (transfer.started_at) {
        auto end = transfer.completed_at.value_or(now);
        if (end > *transfer.started_at) {
            entry.duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - *transfer.started_at);
        }
    }
    
    append(entry);
    return entry;
}

void HistoryLog::append(TransferHistoryEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (store_) {
        auto result = store_->append(entry);
        if (!result) {
            LOG_ERROR("Failed to persist history entry {}: {}", entry.id, result.message);
        }
    }
    
    entries_.push_front(std::move(entry));
    enforce_limit();
}

std::vector<TransferHistoryEntry> HistoryLog::entries(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto count = limit > 0 ? std::min(limit, entries_.size()) : entries_.size();
    return std::vector<TransferHistoryEntry>(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(count));
}

std::size_t HistoryLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

core::Result HistoryLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    if (store_) {
        return store_->clear();
    }
    return core::Result::ok();
}

void HistoryLog::set_limit(std::uint64_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    limit_ = limit;
    enforce_limit();
}

std::uint64_t HistoryLog::limit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return limit_;
}

TransferStats HistoryLog::stats(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    TransferStats stats;
    auto day_start = core::utils::TimeUtils::start_of_local_day(now);
    auto week_start = now - std::chrono::hours(24 * 7);
    auto month_start = now - std::chrono::hours(24 * 30);
    
    std::map<std::string, BreakdownItem> destinations;
    std::map<std::string, BreakdownItem> file_types;
    double speed_sum = 0.0;
    
    for (const auto& entry : entries_) {
        const auto& transfer = entry.transfer;
        speed_sum += transfer.average_speed;
        stats.peak_speed = std::max(stats.peak_speed, transfer.peak_speed);
        
        if (!entry.success) {
            stats.failed_count++;
            continue;
        }
        
        auto bytes = transfer.total_size;
        stats.all_time_transferred += bytes;
        if (entry.timestamp >= day_start) stats.today_transferred += bytes;
        if (entry.timestamp >= week_start) stats.week_transferred += bytes;
        if (entry.timestamp >= month_start) stats.month_transferred += bytes;
        
        if (transfer.direction == Direction::UPLOAD) stats.uploads_count++;
        if (transfer.direction == Direction::DOWNLOAD) stats.downloads_count++;
        
        auto destination = destination_name(transfer);
        auto& dest = destinations[destination];
        dest.name = destination;
        dest.count++;
        dest.bytes += bytes;
        
        auto category = file_category(transfer.file_name);
        auto& type = file_types[category];
        type.name = category;
        type.count++;
        type.bytes += bytes;
    }
    
    if (!entries_.empty()) {
        stats.average_speed = speed_sum / static_cast<double>(entries_.size());
    }
    
    stats.top_destinations = sorted_breakdown(destinations);
    if (stats.top_destinations.size() > TOP_DESTINATIONS) {
        stats.top_destinations.resize(TOP_DESTINATIONS);
    }
    stats.file_types = sorted_breakdown(file_types);
    
    return stats;
}

std::string HistoryLog::file_category(const std::string& file_name) {
    static const std::unordered_map<std::string, std::string> categories = {
        {"pdf", "document"}, {"doc", "document"}, {"docx", "document"}, {"txt", "document"},
        {"rtf", "document"}, {"odt", "document"},
        {"xls", "spreadsheet"}, {"xlsx", "spreadsheet"},
        {"ppt", "presentation"}, {"pptx", "presentation"},
        {"jpg", "image"}, {"jpeg", "image"}, {"png", "image"}, {"gif", "image"}, {"bmp", "image"},
        {"svg", "image"}, {"webp", "image"}, {"ico", "image"}, {"tiff", "image"},
        {"mp4", "video"}, {"avi", "video"}, {"mkv", "video"}, {"mov", "video"}, {"wmv", "video"},
        {"flv", "video"}, {"webm", "video"},
        {"mp3", "audio"}, {"wav", "audio"}, {"flac", "audio"}, {"ogg", "audio"}, {"m4a", "audio"},
        {"zip", "archive"}, {"rar", "archive"}, {"7z", "archive"}, {"tar", "archive"},
        {"gz", "archive"}, {"bz2", "archive"},
        {"js", "code"}, {"ts", "code"}, {"jsx", "code"}, {"tsx", "code"}, {"py", "code"},
        {"java", "code"}, {"cpp", "code"}, {"c", "code"}, {"h", "code"}, {"rs", "code"},
        {"go", "code"}, {"rb", "code"}, {"php", "code"}, {"html", "code"}, {"css", "code"},
        {"json", "code"}, {"xml", "code"}, {"yaml", "code"}, {"yml", "code"}
    };
    
    auto extension = core::utils::FileUtils::get_file_extension(file_name);
    if (extension.size() < 2) {
        return "other";
    }
    
    auto it = categories.find(core::utils::StringUtils::to_lower(extension.substr(1)));
    return it != categories.end() ? it->second : "other";
}

std::string HistoryLog::destination_name(const TransferRecord& transfer) {
    if (transfer.protocol == Protocol::P2P && transfer.device_id) {
        return *transfer.device_id;
    }
    if (transfer.site_id) {
        return *transfer.site_id;
    }
    return transfer.destination_path;
}

void HistoryLog::enforce_limit() {
    if (limit_ == 0) {
        return;
    }
    while (entries_.size() > limit_) {
        entries_.pop_back();
    }
    if (store_) {
        auto result = store_->trim(static_cast<std::size_t>(limit_));
        if (!result) {
            LOG_WARN("Failed to trim history store: {}", result.message);
        }
    }
}

std::string HistoryLog::generate_entry_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dis;
    
    std::ostringstream oss;
    oss << "hist_" << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
    return oss.str();
}

} // namespace ferry::transfer
