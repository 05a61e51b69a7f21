#pragma once

#include "device.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace ferry::p2p {

// Source of device presence. Discovery transports implement this.
class DeviceDirectory {
public:
    virtual ~DeviceDirectory() = default;
    
    virtual std::vector<Device> list_devices() const = 0;
    virtual std::optional<Device> find_device(const std::string& device_id) const = 0;
};

class StaticDeviceDirectory : public DeviceDirectory {
public:
    std::vector<Device> list_devices() const override;
    std::optional<Device> find_device(const std::string& device_id) const override;
    
    void upsert_device(const Device& device);
    bool set_online(const std::string& device_id, bool online, TimePoint seen_at);
    bool remove_device(const std::string& device_id);
    
private:
    std::map<std::string, Device> devices_;
    mutable std::mutex mutex_;
};

} // namespace ferry::p2p
