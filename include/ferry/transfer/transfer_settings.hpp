#pragma once

#include "transfer_types.hpp"
#include "ferry/core/result.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace ferry::core {
class Config;
}

namespace ferry::transfer {

enum class OverwriteMode {
    ALWAYS,
    NEVER,
    NEWER,
    ASK
};

std::string_view to_string(OverwriteMode mode);
std::optional<OverwriteMode> parse_overwrite_mode(std::string_view text);

// Process-wide transfer policy. Persisted as a flat key=value document.
struct TransferSettings {
    Protocol default_protocol = Protocol::SFTP;
    std::uint64_t bandwidth_limit = 0; // bytes/s, 0 = unlimited
    std::uint32_t max_concurrent = 3;
    bool enable_resume = true;
    std::uint64_t chunk_size = ChunkPlan::DEFAULT_CHUNK_SIZE;
    bool verify_transfers = true;
    bool auto_retry = true;
    std::uint32_t max_retries = 3;
    bool delete_after_transfer = false;
    bool preserve_timestamps = true;
    bool preserve_permissions = true;
    bool skip_existing = false;
    OverwriteMode overwrite_mode = OverwriteMode::NEWER;
    bool show_notifications = true;
    bool sound_on_complete = true;
    bool p2p_discovery_enabled = true;
    bool p2p_auto_accept_trusted = false;
    bool encryption_enabled = true;
    std::uint64_t history_limit = 0; // 0 = keep every entry
    
    core::Result validate() const;
    
    void store(core::Config& config) const;
    static TransferSettings from_config(const core::Config& config);
    
    // Strict single-key update used by the settings command
    core::Result apply(const std::string& key, const std::string& value);
    
    static const std::vector<std::string>& keys();
    
    bool operator==(const TransferSettings& other) const = default;
};

} // namespace ferry::transfer
