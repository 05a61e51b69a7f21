#include "ferry/p2p/device.hpp"

namespace ferry::p2p {

std::string_view to_string(DeviceType type) {
    switch (type) {
        case DeviceType::DESKTOP: return "desktop";
        case DeviceType::LAPTOP: return "laptop";
        case DeviceType::PHONE: return "phone";
        case DeviceType::TABLET: return "tablet";
        case DeviceType::SERVER: return "server";
        case DeviceType::UNKNOWN: return "unknown";
    }
    return "unknown";
}

DeviceType parse_device_type(std::string_view text) {
    for (auto type : {DeviceType::DESKTOP, DeviceType::LAPTOP, DeviceType::PHONE,
                      DeviceType::TABLET, DeviceType::SERVER}) {
        if (to_string(type) == text) {
            return type;
        }
    }
    return DeviceType::UNKNOWN;
}

} // namespace ferry::p2p
