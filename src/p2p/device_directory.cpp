#include "ferry/p2p/device_directory.hpp"

namespace ferry::p2p {

std::vector<Device> StaticDeviceDirectory::list_devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Device> devices;
    devices.reserve(devices_.size());
    for (const auto& [id, device] : devices_) {
        devices.push_back(device);
    }
    return devices;
}

std::optional<Device> StaticDeviceDirectory::find_device(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void StaticDeviceDirectory::upsert_device(const Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[device.id] = device;
}

bool StaticDeviceDirectory::set_online(const std::string& device_id, bool online, TimePoint seen_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        return false;
    }
    it->second.online = online;
    if (online) {
        it->second.last_seen = seen_at;
    }
    return true;
}

bool StaticDeviceDirectory::remove_device(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.erase(device_id) > 0;
}

} // namespace ferry::p2p
