#include "ferry/transfer/transfer_settings.hpp"
#include "ferry/core/config.hpp"
#include "ferry/core/utils.hpp"
#include <algorithm>
#include <charconv>
#include <limits>

namespace ferry::transfer {

namespace {

constexpr const char* KEY_DEFAULT_PROTOCOL = "transfer.default_protocol";
constexpr const char* KEY_BANDWIDTH_LIMIT = "transfer.bandwidth_limit";
constexpr const char* KEY_MAX_CONCURRENT = "transfer.max_concurrent";
constexpr const char* KEY_ENABLE_RESUME = "transfer.enable_resume";
constexpr const char* KEY_CHUNK_SIZE = "transfer.chunk_size";
constexpr const char* KEY_VERIFY = "transfer.verify_transfers";
constexpr const char* KEY_AUTO_RETRY = "transfer.auto_retry";
constexpr const char* KEY_MAX_RETRIES = "transfer.max_retries";
constexpr const char* KEY_DELETE_AFTER = "transfer.delete_after_transfer";
constexpr const char* KEY_PRESERVE_TIMESTAMPS = "transfer.preserve_timestamps";
constexpr const char* KEY_PRESERVE_PERMISSIONS = "transfer.preserve_permissions";
constexpr const char* KEY_SKIP_EXISTING = "transfer.skip_existing";
constexpr const char* KEY_OVERWRITE_MODE = "transfer.overwrite_mode";
constexpr const char* KEY_ENCRYPTION = "transfer.encryption_enabled";
constexpr const char* KEY_HISTORY_LIMIT = "transfer.history_limit";
constexpr const char* KEY_SHOW_NOTIFICATIONS = "notify.show_notifications";
constexpr const char* KEY_SOUND_ON_COMPLETE = "notify.sound_on_complete";
constexpr const char* KEY_P2P_DISCOVERY = "p2p.discovery_enabled";
constexpr const char* KEY_P2P_AUTO_ACCEPT = "p2p.auto_accept_trusted";

std::optional<bool> parse_bool(const std::string& value) {
    auto lower = core::utils::StringUtils::to_lower(core::utils::StringUtils::trim(value));
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    return std::nullopt;
}

std::optional<std::uint64_t> parse_unsigned(const std::string& value) {
    auto text = core::utils::StringUtils::trim(value);
    std::uint64_t result = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return result;
}

const char* bool_text(bool value) {
    return value ? "true" : "false";
}

} // namespace

std::string_view to_string(OverwriteMode mode) {
    switch (mode) {
        case OverwriteMode::ALWAYS: return "always";
        case OverwriteMode::NEVER: return "never";
        case OverwriteMode::NEWER: return "newer";
        case OverwriteMode::ASK: return "ask";
    }
    return "newer";
}

std::optional<OverwriteMode> parse_overwrite_mode(std::string_view text) {
    for (auto mode : {OverwriteMode::ALWAYS, OverwriteMode::NEVER, OverwriteMode::NEWER, OverwriteMode::ASK}) {
        if (to_string(mode) == text) {
            return mode;
        }
    }
    return std::nullopt;
}

core::Result TransferSettings::validate() const {
    if (max_concurrent < 1) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "max_concurrent must be at least 1");
    }
    if (chunk_size == 0) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "chunk_size must be greater than zero");
    }
    return core::Result::ok();
}

void TransferSettings::store(core::Config& config) const {
    config.set(KEY_DEFAULT_PROTOCOL, std::string(to_string(default_protocol)));
    config.set(KEY_BANDWIDTH_LIMIT, std::to_string(bandwidth_limit));
    config.set(KEY_MAX_CONCURRENT, std::to_string(max_concurrent));
    config.set(KEY_ENABLE_RESUME, bool_text(enable_resume));
    config.set(KEY_CHUNK_SIZE, std::to_string(chunk_size));
    config.set(KEY_VERIFY, bool_text(verify_transfers));
    config.set(KEY_AUTO_RETRY, bool_text(auto_retry));
    config.set(KEY_MAX_RETRIES, std::to_string(max_retries));
    config.set(KEY_DELETE_AFTER, bool_text(delete_after_transfer));
    config.set(KEY_PRESERVE_TIMESTAMPS, bool_text(preserve_timestamps));
    config.set(KEY_PRESERVE_PERMISSIONS, bool_text(preserve_permissions));
    config.set(KEY_SKIP_EXISTING, bool_text(skip_existing));
    config.set(KEY_OVERWRITE_MODE, std::string(to_string(overwrite_mode)));
    config.set(KEY_ENCRYPTION, bool_text(encryption_enabled));
    config.set(KEY_HISTORY_LIMIT, std::to_string(history_limit));
    config.set(KEY_SHOW_NOTIFICATIONS, bool_text(show_notifications));
    config.set(KEY_SOUND_ON_COMPLETE, bool_text(sound_on_complete));
    config.set(KEY_P2P_DISCOVERY, bool_text(p2p_discovery_enabled));
    config.set(KEY_P2P_AUTO_ACCEPT, bool_text(p2p_auto_accept_trusted));
}

TransferSettings TransferSettings::from_config(const core::Config& config) {
    TransferSettings settings;
    
    // Unknown or malformed values keep their defaults
    for (const auto& key : keys()) {
        auto value = config.get(key);
        if (value) {
            settings.apply(key, *value);
        }
    }
    
    if (!settings.validate()) {
        TransferSettings defaults;
        if (settings.max_concurrent < 1) settings.max_concurrent = defaults.max_concurrent;
        if (settings.chunk_size == 0) settings.chunk_size = defaults.chunk_size;
    }
    
    return settings;
}

core::Result TransferSettings::apply(const std::string& key, const std::string& value) {
    auto invalid = [&key, &value]() {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT,
                            "Invalid value '" + value + "' for " + key);
    };
    
    auto set_flag = [&](bool& field) -> core::Result {
        auto parsed = parse_bool(value);
        if (!parsed) return invalid();
        field = *parsed;
        return core::Result::ok();
    };
    
    auto set_u64 = [&](std::uint64_t& field) -> core::Result {
        auto parsed = parse_unsigned(value);
        if (!parsed) return invalid();
        field = *parsed;
        return core::Result::ok();
    };
    
    auto set_u32 = [&](std::uint32_t& field) -> core::Result {
        auto parsed = parse_unsigned(value);
        if (!parsed || *parsed > std::numeric_limits<std::uint32_t>::max()) return invalid();
        field = static_cast<std::uint32_t>(*parsed);
        return core::Result::ok();
    };
    
    if (key == KEY_DEFAULT_PROTOCOL) {
        auto parsed = parse_protocol(core::utils::StringUtils::trim(value));
        if (!parsed) return invalid();
        default_protocol = *parsed;
        return core::Result::ok();
    }
    if (key == KEY_OVERWRITE_MODE) {
        auto parsed = parse_overwrite_mode(core::utils::StringUtils::trim(value));
        if (!parsed) return invalid();
        overwrite_mode = *parsed;
        return core::Result::ok();
    }
    if (key == KEY_BANDWIDTH_LIMIT) return set_u64(bandwidth_limit);
    if (key == KEY_CHUNK_SIZE) return set_u64(chunk_size);
    if (key == KEY_HISTORY_LIMIT) return set_u64(history_limit);
    if (key == KEY_MAX_CONCURRENT) return set_u32(max_concurrent);
    if (key == KEY_MAX_RETRIES) return set_u32(max_retries);
    if (key == KEY_ENABLE_RESUME) return set_flag(enable_resume);
    if (key == KEY_VERIFY) return set_flag(verify_transfers);
    if (key == KEY_AUTO_RETRY) return set_flag(auto_retry);
    if (key == KEY_DELETE_AFTER) return set_flag(delete_after_transfer);
    if (key == KEY_PRESERVE_TIMESTAMPS) return set_flag(preserve_timestamps);
    if (key == KEY_PRESERVE_PERMISSIONS) return set_flag(preserve_permissions);
    if (key == KEY_SKIP_EXISTING) return set_flag(skip_existing);
    if (key == KEY_ENCRYPTION) return set_flag(encryption_enabled);
    if (key == KEY_SHOW_NOTIFICATIONS) return set_flag(show_notifications);
    if (key == KEY_SOUND_ON_COMPLETE) return set_flag(sound_on_complete);
    if (key == KEY_P2P_DISCOVERY) return set_flag(p2p_discovery_enabled);
    if (key == KEY_P2P_AUTO_ACCEPT) return set_flag(p2p_auto_accept_trusted);
    
    return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Unknown setting: " + key);
}

const std::vector<std::string>& TransferSettings::keys() {
    static const std::vector<std::string> all_keys = {
        KEY_DEFAULT_PROTOCOL, KEY_BANDWIDTH_LIMIT, KEY_MAX_CONCURRENT, KEY_ENABLE_RESUME,
        KEY_CHUNK_SIZE, KEY_VERIFY, KEY_AUTO_RETRY, KEY_MAX_RETRIES, KEY_DELETE_AFTER,
        KEY_PRESERVE_TIMESTAMPS, KEY_PRESERVE_PERMISSIONS, KEY_SKIP_EXISTING,
        KEY_OVERWRITE_MODE, KEY_ENCRYPTION, KEY_HISTORY_LIMIT, KEY_SHOW_NOTIFICATIONS,
        KEY_SOUND_ON_COMPLETE, KEY_P2P_DISCOVERY, KEY_P2P_AUTO_ACCEPT
    };
    return all_keys;
}

} // namespace ferry::transfer
