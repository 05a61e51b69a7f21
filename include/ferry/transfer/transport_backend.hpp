#pragma once

#include "transfer_types.hpp"
#include "transfer_settings.hpp"
#include "ferry/core/result.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace ferry::transfer {

class TransferChannel;

struct TransportStart {
    TransferRecord record;
    std::uint64_t resume_offset = 0;
    TransferSettings settings;
};

// Moves bytes over one concrete protocol. start() must not block on the transfer
// itself; the backend reports ready/progress/failure through the channel.
class TransportBackend {
public:
    virtual ~TransportBackend() = default;
    
    virtual core::Result start(const TransportStart& request, std::shared_ptr<TransferChannel> channel) = 0;
    virtual void stop(const std::string& transfer_id) = 0;
};

class TransportRegistry {
public:
    void register_backend(Protocol protocol, std::shared_ptr<TransportBackend> backend);
    void unregister_backend(Protocol protocol);
    
    std::shared_ptr<TransportBackend> find(Protocol protocol) const;
    bool has_backend(Protocol protocol) const;
    
private:
    std::map<Protocol, std::shared_ptr<TransportBackend>> backends_;
    mutable std::mutex mutex_;
};

} // namespace ferry::transfer
