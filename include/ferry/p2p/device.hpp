#pragma once

#include "ferry/transfer/transfer_types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::p2p {

using transfer::TimePoint;

enum class DeviceType {
    DESKTOP,
    LAPTOP,
    PHONE,
    TABLET,
    SERVER,
    UNKNOWN
};

std::string_view to_string(DeviceType type);
DeviceType parse_device_type(std::string_view text);

struct Device {
    std::string id;
    std::string name;
    DeviceType type = DeviceType::UNKNOWN;
    std::string address;
    std::uint16_t port = 0;
    bool online = false;
    TimePoint last_seen{};
    bool trusted = false;
    std::optional<std::string> os;
    std::optional<std::string> version;
};

struct FileManifestEntry {
    std::string name;
    std::uint64_t size = 0;
    std::optional<std::string> mime_type;
};

struct P2PTransferRequest {
    std::string id;
    Device from_device;
    std::string peer_device_id; // the other side: target for outgoing, sender for incoming
    std::vector<FileManifestEntry> files;
    std::uint64_t total_size = 0;
    TimePoint requested_at{};
    TimePoint expires_at{};
    std::optional<bool> accepted;
    bool incoming = false;
    
    bool is_expired(TimePoint now) const { return now >= expires_at; }
    bool is_resolved() const { return accepted.has_value(); }
    bool is_pending(TimePoint now) const { return !is_resolved() && !is_expired(now); }
};

} // namespace ferry::p2p
