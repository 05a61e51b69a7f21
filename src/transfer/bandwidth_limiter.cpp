#include "ferry/transfer/bandwidth_limiter.hpp"
#include <algorithm>
#include <utility>

namespace ferry::transfer {

BandwidthLimiter::BandwidthLimiter(uint64_t bytes_per_second, Clock clock)
    : max_bandwidth_(bytes_per_second)
    , bucket_capacity_(capacity_for(bytes_per_second))
    , available_tokens_(bucket_capacity_)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
    , last_refill_(clock_())
{
}

void BandwidthLimiter::set_max_bandwidth(uint64_t bytes_per_second) {
    std::lock_guard<std::mutex> lock(mutex_);
    update_tokens();
    max_bandwidth_ = bytes_per_second;
    refill_remainder_ = 0;
    if (!fixed_capacity_) {
        bucket_capacity_ = capacity_for(bytes_per_second);
        available_tokens_ = std::min(available_tokens_, bucket_capacity_);
    }
}

void BandwidthLimiter::set_bucket_capacity(uint64_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    bucket_capacity_ = std::max<uint64_t>(capacity, 1);
    fixed_capacity_ = true;
    available_tokens_ = std::min(available_tokens_, bucket_capacity_);
}

bool BandwidthLimiter::can_send(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_bandwidth_ == 0) {
        return true;
    }
    update_tokens();
    return available_tokens_ >= bytes;
}

void BandwidthLimiter::consume_tokens(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_bandwidth_ == 0) {
        return;
    }
    available_tokens_ -= std::min(available_tokens_, bytes);
}

void BandwidthLimiter::refill_bucket() {
    std::lock_guard<std::mutex> lock(mutex_);
    update_tokens();
}

uint64_t BandwidthLimiter::acquire(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (max_bandwidth_ == 0) {
        return bytes;
    }
    
    update_tokens();
    uint64_t granted = std::min(available_tokens_, bytes);
    available_tokens_ -= granted;
    return granted;
}

bool BandwidthLimiter::is_unlimited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_bandwidth_ == 0;
}

uint64_t BandwidthLimiter::get_max_bandwidth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_bandwidth_;
}

uint64_t BandwidthLimiter::get_bucket_capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bucket_capacity_;
}

uint64_t BandwidthLimiter::get_available_tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_tokens_;
}

uint64_t BandwidthLimiter::capacity_for(uint64_t bytes_per_second) {
    return std::max(bytes_per_second, DEFAULT_BUCKET_CAPACITY);
}

void BandwidthLimiter::update_tokens() {
    constexpr uint64_t NANOS_PER_SECOND = 1'000'000'000;
    
    auto now = clock_();
    if (now <= last_refill_) {
        return;
    }
    auto elapsed = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(now - last_refill_).count());
    last_refill_ = now;
    
    if (max_bandwidth_ == 0) {
        refill_remainder_ = 0;
        return;
    }
    
    // Whole seconds beyond what fills the bucket add nothing
    uint64_t whole_seconds = elapsed / NANOS_PER_SECOND;
    uint64_t fill_seconds = bucket_capacity_ / max_bandwidth_ + 1;
    uint64_t tokens_to_add = std::min(whole_seconds, fill_seconds) * max_bandwidth_;
    
    // Sub-second part carries its remainder into the next refill
    uint64_t scaled = refill_remainder_ + max_bandwidth_ * (elapsed % NANOS_PER_SECOND);
    tokens_to_add += scaled / NANOS_PER_SECOND;
    refill_remainder_ = scaled % NANOS_PER_SECOND;
    
    available_tokens_ = std::min(available_tokens_ + tokens_to_add, bucket_capacity_);
    if (available_tokens_ == bucket_capacity_) {
        refill_remainder_ = 0;
    }
}

} // namespace ferry::transfer
