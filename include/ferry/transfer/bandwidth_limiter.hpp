#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <cstdint>

namespace ferry::transfer {

// Token bucket shared by every active transfer. A ceiling of 0 disables limiting.
class BandwidthLimiter {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    
    explicit BandwidthLimiter(uint64_t bytes_per_second = 0, Clock clock = {});
    
    // Configuration
    void set_max_bandwidth(uint64_t bytes_per_second);
    void set_bucket_capacity(uint64_t capacity);
    
    // Token bucket operations
    bool can_send(uint64_t bytes);
    void consume_tokens(uint64_t bytes);
    void refill_bucket();
    
    // Grants up to `bytes` immediately; callers send what was granted and ask again
    uint64_t acquire(uint64_t bytes);
    
    // Statistics
    bool is_unlimited() const;
    uint64_t get_max_bandwidth() const;
    uint64_t get_bucket_capacity() const;
    uint64_t get_available_tokens() const;
    
    // Smallest automatic capacity; above it the bucket holds one second of the ceiling
    static constexpr uint64_t DEFAULT_BUCKET_CAPACITY = 64 * 1024;
    static uint64_t capacity_for(uint64_t bytes_per_second);
    
private:
    uint64_t max_bandwidth_;
    uint64_t bucket_capacity_;
    bool fixed_capacity_ = false;
    uint64_t available_tokens_;
    Clock clock_;
    std::chrono::steady_clock::time_point last_refill_;
    uint64_t refill_remainder_ = 0; // byte-nanoseconds not yet worth a whole token
    
    mutable std::mutex mutex_;
    
    void update_tokens();
};

} // namespace ferry::transfer
