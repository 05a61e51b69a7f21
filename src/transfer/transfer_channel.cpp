#include "ferry/transfer/transfer_channel.hpp"
#include "ferry/transfer/transfer_scheduler.hpp"
#include "ferry/transfer/bandwidth_limiter.hpp"

namespace ferry::transfer {

TransferChannel::TransferChannel(TransferScheduler* scheduler, BandwidthLimiter* limiter,
                                 std::string transfer_id, std::uint64_t generation)
    : scheduler_(scheduler)
    , limiter_(limiter)
    , transfer_id_(std::move(transfer_id))
    , generation_(generation)
{
}

void TransferChannel::ready() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (cancelled_ || !scheduler_) return;
    scheduler_->on_ready(transfer_id_, generation_);
}

void TransferChannel::progress(std::uint64_t bytes_transferred, double speed) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (cancelled_ || !scheduler_) return;
    scheduler_->on_progress(transfer_id_, generation_, bytes_transferred, speed);
}

void TransferChannel::fail(const std::string& message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (cancelled_ || !scheduler_) return;
    scheduler_->on_failure(transfer_id_, generation_, message);
}

void TransferChannel::report_remote_hash(const std::string& hex_hash) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (cancelled_ || !scheduler_) return;
    scheduler_->on_remote_hash(transfer_id_, generation_, hex_hash);
}

void TransferChannel::report_chunk_hash(std::uint32_t chunk_index, const std::string& hex_hash) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (cancelled_ || !scheduler_) return;
    scheduler_->on_chunk_hash(transfer_id_, generation_, chunk_index, hex_hash);
}

std::uint64_t TransferChannel::acquire_bandwidth(std::uint64_t bytes) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (cancelled_) return 0;
    if (!limiter_) return bytes;
    return limiter_->acquire(bytes);
}

void TransferChannel::cancel() {
    cancelled_ = true;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    scheduler_ = nullptr;
    limiter_ = nullptr;
}

} // namespace ferry::transfer
