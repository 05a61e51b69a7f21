#include "ferry/transfer/transport_backend.hpp"
#include "ferry/core/logger.hpp"

namespace ferry::transfer {

void TransportRegistry::register_backend(Protocol protocol, std::shared_ptr<TransportBackend> backend) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!backend) {
        backends_.erase(protocol);
        return;
    }
    backends_[protocol] = std::move(backend);
    LOG_DEBUG("Registered transport backend for {}", to_string(protocol));
}

void TransportRegistry::unregister_backend(Protocol protocol) {
    std::lock_guard<std::mutex> lock(mutex_);
    backends_.erase(protocol);
}

std::shared_ptr<TransportBackend> TransportRegistry::find(Protocol protocol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backends_.find(protocol);
    if (it == backends_.end()) {
        return nullptr;
    }
    return it->second;
}

bool TransportRegistry::has_backend(Protocol protocol) const {
    return find(protocol) != nullptr;
}

} // namespace ferry::transfer
