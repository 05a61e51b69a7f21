#include "ferry/p2p/negotiator.hpp"
#include "ferry/core/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace ferry::p2p {

P2PNegotiator::P2PNegotiator(DeviceDirectory& directory, Device local_device, Clock clock)
    : directory_(directory)
    , local_device_(std::move(local_device))
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
{
}

core::Result P2PNegotiator::send_transfer_request(const std::string& device_id,
                                                  const std::vector<FileManifestEntry>& files,
                                                  P2PTransferRequest& out) {
    auto device = directory_.find_device(device_id);
    if (!device || !device->online) {
        LOG_WARN("Transfer request to unavailable device {}", device_id);
        return core::Result(core::ErrorCode::DEVICE_UNAVAILABLE, "Device not available: " + device_id);
    }
    if (files.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Transfer request has no files");
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    auto request = make_request(files, clock_());
    request.from_device = local_device_;
    request.from_device.trusted = true;
    request.peer_device_id = device_id;
    request.incoming = false;
    
    requests_[request.id] = request;
    LOG_INFO("Sent transfer request {} to {} ({} files, {} bytes)",
             request.id, device_id, request.files.size(), request.total_size);
    
    out = std::move(request);
    return core::Result::ok();
}

core::Result P2PNegotiator::receive_transfer_request(const std::string& from_device_id,
                                                     const std::vector<FileManifestEntry>& files,
                                                     P2PTransferRequest& out) {
    auto device = directory_.find_device(from_device_id);
    if (!device) {
        return core::Result(core::ErrorCode::DEVICE_UNAVAILABLE, "Unknown device: " + from_device_id);
    }
    if (files.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Transfer request has no files");
    }
    
    bool auto_accepted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto request = make_request(files, clock_());
        request.from_device = *device;
        request.from_device.trusted = trusted_devices_.count(from_device_id) > 0;
        request.peer_device_id = from_device_id;
        request.incoming = true;
        
        if (auto_accept_trusted_ && request.from_device.trusted) {
            request.accepted = true;
            auto_accepted = true;
        }
        
        requests_[request.id] = request;
        out = std::move(request);
    }
    
    LOG_INFO("Received transfer request {} from {} ({} files){}", out.id, from_device_id,
             out.files.size(), auto_accepted ? ", auto-accepted" : "");
    
    if (auto_accepted) {
        notify_accepted(out);
    }
    return core::Result::ok();
}

std::vector<P2PTransferRequest> P2PNegotiator::get_pending_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    
    std::vector<P2PTransferRequest> pending;
    for (const auto& [id, request] : requests_) {
        if (request.is_pending(now)) {
            pending.push_back(request);
        }
    }
    std::sort(pending.begin(), pending.end(), [](const auto& a, const auto& b) {
        return a.requested_at < b.requested_at;
    });
    return pending;
}

std::optional<P2PTransferRequest> P2PNegotiator::get_request(const std::string& request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        return std::nullopt;
    }
    return it->second;
}

core::Result P2PNegotiator::accept_request(const std::string& request_id) {
    return resolve(request_id, true);
}

core::Result P2PNegotiator::reject_request(const std::string& request_id) {
    return resolve(request_id, false);
}

std::size_t P2PNegotiator::prune_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock_();
    
    std::size_t removed = 0;
    for (auto it = requests_.begin(); it != requests_.end();) {
        if (it->second.is_expired(now)) {
            it = requests_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    
    if (removed > 0) {
        LOG_DEBUG("Pruned {} expired transfer requests", removed);
    }
    return removed;
}

void P2PNegotiator::trust_device(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    trusted_devices_.insert(device_id);
    LOG_INFO("Trusted device {}", device_id);
}

void P2PNegotiator::untrust_device(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    trusted_devices_.erase(device_id);
    LOG_INFO("Untrusted device {}", device_id);
}

bool P2PNegotiator::is_trusted(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trusted_devices_.count(device_id) > 0;
}

std::vector<Device> P2PNegotiator::get_devices() const {
    auto devices = directory_.list_devices();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& device : devices) {
            device.trusted = device.trusted || trusted_devices_.count(device.id) > 0;
        }
    }
    
    std::sort(devices.begin(), devices.end(), [](const Device& a, const Device& b) {
        if (a.online != b.online) return a.online;
        if (a.trusted != b.trusted) return a.trusted;
        return a.last_seen > b.last_seen;
    });
    return devices;
}

std::vector<Device> P2PNegotiator::get_online_devices() const {
    auto devices = get_devices();
    devices.erase(std::remove_if(devices.begin(), devices.end(),
                                 [](const Device& d) { return !d.online; }),
                  devices.end());
    return devices;
}

std::vector<Device> P2PNegotiator::get_trusted_devices() const {
    auto devices = get_devices();
    devices.erase(std::remove_if(devices.begin(), devices.end(),
                                 [](const Device& d) { return !d.trusted; }),
                  devices.end());
    return devices;
}

void P2PNegotiator::set_auto_accept_trusted(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_accept_trusted_ = enabled;
}

void P2PNegotiator::set_accept_handler(AcceptHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    accept_handler_ = std::move(handler);
}

core::Result P2PNegotiator::resolve(const std::string& request_id, bool accepted) {
    P2PTransferRequest resolved;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = requests_.find(request_id);
        if (it == requests_.end()) {
            return core::Result(core::ErrorCode::NOT_FOUND, "Transfer request not found: " + request_id);
        }
        
        auto& request = it->second;
        if (request.is_resolved()) {
            return core::Result::ok();
        }
        if (request.is_expired(clock_())) {
            return core::Result(core::ErrorCode::INVALID_TRANSITION, "Transfer request expired: " + request_id);
        }
        
        request.accepted = accepted;
        resolved = request;
    }
    
    LOG_INFO("Transfer request {} {}", request_id, accepted ? "accepted" : "rejected");
    if (accepted) {
        notify_accepted(resolved);
    }
    return core::Result::ok();
}

void P2PNegotiator::notify_accepted(const P2PTransferRequest& request) {
    AcceptHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = accept_handler_;
    }
    if (handler) {
        handler(request);
    }
}

P2PTransferRequest P2PNegotiator::make_request(const std::vector<FileManifestEntry>& files, TimePoint now) {
    P2PTransferRequest request;
    request.id = generate_request_id();
    request.files = files;
    for (const auto& file : files) {
        request.total_size += file.size;
    }
    request.requested_at = now;
    request.expires_at = now + REQUEST_TTL;
    return request;
}

std::string P2PNegotiator::generate_request_id() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::uint64_t> dis;
    
    std::ostringstream oss;
    oss << "request_" << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
    return oss.str();
}

} // namespace ferry::p2p
