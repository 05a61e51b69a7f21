#pragma once

#include "chunk_plan.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <chrono>
#include <cstdint>

namespace ferry::transfer {

enum class Protocol {
    SFTP,
    FTP,
    FTPS,
    P2P,
    CLOUD,
    WEBRTC
};

enum class Direction {
    UPLOAD,
    DOWNLOAD,
    SYNC
};

enum class TransferStatus {
    PENDING,
    QUEUED,
    CONNECTING,
    TRANSFERRING,
    PAUSED,
    VERIFYING,
    COMPLETED,
    FAILED,
    CANCELLED
};

std::string_view to_string(Protocol protocol);
std::string_view to_string(Direction direction);
std::string_view to_string(TransferStatus status);

std::optional<Protocol> parse_protocol(std::string_view text);
std::optional<Direction> parse_direction(std::string_view text);
std::optional<TransferStatus> parse_status(std::string_view text);

// Records in these states hold one of the max_concurrent slots
bool is_active_status(TransferStatus status);
// completed, failed and cancelled; the latter two re-enter the queue only through retry
bool is_finished_status(TransferStatus status);
bool can_transition(TransferStatus from, TransferStatus to);

using TimePoint = std::chrono::system_clock::time_point;

// Caller-supplied description of a transfer to schedule
struct TransferSpec {
    Protocol protocol = Protocol::SFTP;
    Direction direction = Direction::DOWNLOAD;
    std::string source_path;
    std::string destination_path;
    std::string file_name;
    std::uint64_t total_size = 0;
    std::optional<std::string> site_id;
    std::optional<std::string> device_id;
    std::optional<std::string> content_hash;
    int priority = 0;
    std::optional<TimePoint> scheduled_at;
};

struct TransferRecord {
    std::string id;
    Protocol protocol = Protocol::SFTP;
    Direction direction = Direction::DOWNLOAD;
    TransferStatus status = TransferStatus::PENDING;
    
    std::string source_path;
    std::string destination_path;
    std::string file_name;
    
    std::uint64_t total_size = 0;
    std::uint64_t transferred_bytes = 0;
    
    double current_speed = 0.0;  // bytes per second
    double average_speed = 0.0;
    double peak_speed = 0.0;
    int progress = 0;            // 0-100
    double eta = 0.0;            // seconds, +inf while nothing is moving
    
    TimePoint created_at{};
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    std::optional<std::string> error;
    std::uint32_t retry_count = 0;
    
    std::optional<std::string> site_id;
    std::optional<std::string> device_id;
    std::optional<std::string> content_hash;
    bool verified = false;
    std::optional<ChunkPlan> chunks;
    
    int priority = 0;
    std::optional<TimePoint> scheduled_at;
    std::uint64_t sequence = 0; // creation order, breaks priority ties
    
    std::uint64_t remaining_bytes() const {
        return total_size > transferred_bytes ? total_size - transferred_bytes : 0;
    }
    
    // Recomputes progress from transferred_bytes/total_size
    void update_progress();
};

} // namespace ferry::transfer
