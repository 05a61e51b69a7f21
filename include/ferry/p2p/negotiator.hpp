#pragma once

#include "device.hpp"
#include "device_directory.hpp"
#include "ferry/core/result.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ferry::p2p {

// Request/accept/reject handshake for device-to-device transfers.
// Expiry is evaluated against the clock at read time; nothing is evicted
// unless prune_expired() is called.
class P2PNegotiator {
public:
    using Clock = std::function<TimePoint()>;
    using AcceptHandler = std::function<void(const P2PTransferRequest&)>;
    
    static constexpr std::chrono::minutes REQUEST_TTL{5};
    
    P2PNegotiator(DeviceDirectory& directory, Device local_device, Clock clock = {});
    
    // Outgoing: target must be known and online
    core::Result send_transfer_request(const std::string& device_id,
                                       const std::vector<FileManifestEntry>& files,
                                       P2PTransferRequest& out);
    
    // Incoming from a known device; trusted senders may be auto-accepted
    core::Result receive_transfer_request(const std::string& from_device_id,
                                          const std::vector<FileManifestEntry>& files,
                                          P2PTransferRequest& out);
    
    std::vector<P2PTransferRequest> get_pending_requests() const;
    std::optional<P2PTransferRequest> get_request(const std::string& request_id) const;
    
    core::Result accept_request(const std::string& request_id);
    core::Result reject_request(const std::string& request_id);
    
    std::size_t prune_expired();
    
    // Trust
    void trust_device(const std::string& device_id);
    void untrust_device(const std::string& device_id);
    bool is_trusted(const std::string& device_id) const;
    
    // Online first, then trusted, then most recently seen
    std::vector<Device> get_devices() const;
    std::vector<Device> get_online_devices() const;
    std::vector<Device> get_trusted_devices() const;
    
    void set_auto_accept_trusted(bool enabled);
    void set_accept_handler(AcceptHandler handler);
    
    const Device& local_device() const { return local_device_; }
    
private:
    DeviceDirectory& directory_;
    Device local_device_;
    Clock clock_;
    
    std::map<std::string, P2PTransferRequest> requests_;
    std::set<std::string> trusted_devices_;
    bool auto_accept_trusted_ = false;
    AcceptHandler accept_handler_;
    mutable std::mutex mutex_;
    
    core::Result resolve(const std::string& request_id, bool accepted);
    void notify_accepted(const P2PTransferRequest& request);
    P2PTransferRequest make_request(const std::vector<FileManifestEntry>& files, TimePoint now);
    std::string generate_request_id();
};

} // namespace ferry::p2p
