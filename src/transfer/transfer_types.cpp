#include "ferry/transfer/transfer_types.hpp"
#include <cmath>

namespace ferry::transfer {

std::string_view to_string(Protocol protocol) {
    switch (protocol) {
        case Protocol::SFTP: return "sftp";
        case Protocol::FTP: return "ftp";
        case Protocol::FTPS: return "ftps";
        case Protocol::P2P: return "p2p";
        case Protocol::CLOUD: return "cloud";
        case Protocol::WEBRTC: return "webrtc";
    }
    return "unknown";
}

std::string_view to_string(Direction direction) {
    switch (direction) {
        case Direction::UPLOAD: return "upload";
        case Direction::DOWNLOAD: return "download";
        case Direction::SYNC: return "sync";
    }
    return "unknown";
}

std::string_view to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::PENDING: return "pending";
        case TransferStatus::QUEUED: return "queued";
        case TransferStatus::CONNECTING: return "connecting";
        case TransferStatus::TRANSFERRING: return "transferring";
        case TransferStatus::PAUSED: return "paused";
        case TransferStatus::VERIFYING: return "verifying";
        case TransferStatus::COMPLETED: return "completed";
        case TransferStatus::FAILED: return "failed";
        case TransferStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::optional<Protocol> parse_protocol(std::string_view text) {
    for (auto protocol : {Protocol::SFTP, Protocol::FTP, Protocol::FTPS,
                          Protocol::P2P, Protocol::CLOUD, Protocol::WEBRTC}) {
        if (to_string(protocol) == text) {
            return protocol;
        }
    }
    return std::nullopt;
}

std::optional<Direction> parse_direction(std::string_view text) {
    for (auto direction : {Direction::UPLOAD, Direction::DOWNLOAD, Direction::SYNC}) {
        if (to_string(direction) == text) {
            return direction;
        }
    }
    return std::nullopt;
}

std::optional<TransferStatus> parse_status(std::string_view text) {
    for (auto status : {TransferStatus::PENDING, TransferStatus::QUEUED, TransferStatus::CONNECTING,
                        TransferStatus::TRANSFERRING, TransferStatus::PAUSED, TransferStatus::VERIFYING,
                        TransferStatus::COMPLETED, TransferStatus::FAILED, TransferStatus::CANCELLED}) {
        if (to_string(status) == text) {
            return status;
        }
    }
    return std::nullopt;
}

bool is_active_status(TransferStatus status) {
    switch (status) {
        case TransferStatus::CONNECTING:
        case TransferStatus::TRANSFERRING:
        case TransferStatus::VERIFYING:
            return true;
        case TransferStatus::PENDING:
        case TransferStatus::QUEUED:
        case TransferStatus::PAUSED:
        case TransferStatus::COMPLETED:
        case TransferStatus::FAILED:
        case TransferStatus::CANCELLED:
            return false;
    }
    return false;
}

bool is_finished_status(TransferStatus status) {
    switch (status) {
        case TransferStatus::COMPLETED:
        case TransferStatus::FAILED:
        case TransferStatus::CANCELLED:
            return true;
        case TransferStatus::PENDING:
        case TransferStatus::QUEUED:
        case TransferStatus::CONNECTING:
        case TransferStatus::TRANSFERRING:
        case TransferStatus::PAUSED:
        case TransferStatus::VERIFYING:
            return false;
    }
    return false;
}

bool can_transition(TransferStatus from, TransferStatus to) {
    if (to == TransferStatus::CANCELLED) {
        return !is_finished_status(from);
    }
    
    switch (from) {
        case TransferStatus::PENDING:
            return to == TransferStatus::QUEUED;
        case TransferStatus::QUEUED:
            return to == TransferStatus::CONNECTING;
        case TransferStatus::CONNECTING:
            return to == TransferStatus::TRANSFERRING || to == TransferStatus::FAILED;
        case TransferStatus::TRANSFERRING:
            return to == TransferStatus::PAUSED || to == TransferStatus::VERIFYING ||
                   to == TransferStatus::COMPLETED || to == TransferStatus::FAILED;
        case TransferStatus::PAUSED:
            return to == TransferStatus::QUEUED;
        case TransferStatus::VERIFYING:
            return to == TransferStatus::COMPLETED || to == TransferStatus::FAILED;
        case TransferStatus::COMPLETED:
            return false;
        case TransferStatus::FAILED:
        case TransferStatus::CANCELLED:
            return to == TransferStatus::QUEUED;
    }
    return false;
}

void TransferRecord::update_progress() {
    if (total_size == 0) {
        progress = status == TransferStatus::COMPLETED ? 100 : 0;
        return;
    }
    
    double ratio = static_cast<double>(transferred_bytes) / static_cast<double>(total_size);
    progress = static_cast<int>(std::lround(ratio * 100.0));
}

} // namespace ferry::transfer
