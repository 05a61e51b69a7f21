#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace ferry::transfer {

class TransferScheduler;
class BandwidthLimiter;

// Per-attempt event stream from a transport backend into the scheduler.
// Once cancelled (pause, cancel, remove, failure, completion or a newer
// attempt) every event is dropped.
class TransferChannel {
public:
    TransferChannel(TransferScheduler* scheduler, BandwidthLimiter* limiter,
                    std::string transfer_id, std::uint64_t generation);
    
    TransferChannel(const TransferChannel&) = delete;
    TransferChannel& operator=(const TransferChannel&) = delete;
    
    void ready();
    void progress(std::uint64_t bytes_transferred, double speed = 0.0);
    void fail(const std::string& message);
    void report_remote_hash(const std::string& hex_hash);
    void report_chunk_hash(std::uint32_t chunk_index, const std::string& hex_hash);
    
    // Bytes the backend may send now under the shared bandwidth ceiling
    std::uint64_t acquire_bandwidth(std::uint64_t bytes);
    
    bool cancelled() const { return cancelled_.load(); }
    const std::string& transfer_id() const { return transfer_id_; }
    std::uint64_t generation() const { return generation_; }
    
private:
    friend class TransferScheduler;
    
    void cancel();
    
    TransferScheduler* scheduler_;
    BandwidthLimiter* limiter_;
    std::string transfer_id_;
    std::uint64_t generation_;
    std::atomic<bool> cancelled_{false};
    
    // Recursive: a backend calling back synchronously may re-enter through cancel()
    std::recursive_mutex mutex_;
};

} // namespace ferry::transfer
