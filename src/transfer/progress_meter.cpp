#include "ferry/transfer/progress_meter.hpp"
#include <algorithm>
#include <limits>

namespace ferry::transfer {

void ProgressMeter::start(TimePoint now) {
    if (!running_since_) {
        running_since_ = now;
    }
}

void ProgressMeter::stop(TimePoint now) {
    if (running_since_) {
        if (now > *running_since_) {
            active_ += now - *running_since_;
        }
        running_since_.reset();
    }
    window_.clear();
    current_speed_ = 0.0;
}

void ProgressMeter::record(TimePoint now, std::uint64_t delta, double reported_speed) {
    bytes_moved_ += delta;
    
    if (delta > 0) {
        window_.emplace_back(now, delta);
    }
    trim_window(now);
    
    if (reported_speed > 0.0) {
        current_speed_ = reported_speed;
    } else {
        std::uint64_t recent_bytes = 0;
        for (const auto& [timestamp, bytes] : window_) {
            recent_bytes += bytes;
        }
        current_speed_ = static_cast<double>(recent_bytes) /
                         std::chrono::duration<double>(SPEED_WINDOW).count();
    }
    
    auto elapsed = std::chrono::duration<double>(active_time(now)).count();
    if (elapsed > 0.0) {
        average_speed_ = static_cast<double>(bytes_moved_) / elapsed;
    } else {
        average_speed_ = current_speed_;
    }
    
    peak_speed_ = std::max(peak_speed_, current_speed_);
}

double ProgressMeter::eta(std::uint64_t remaining_bytes) const {
    if (remaining_bytes == 0) {
        return 0.0;
    }
    if (current_speed_ <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return static_cast<double>(remaining_bytes) / current_speed_;
}

std::chrono::milliseconds ProgressMeter::active_time(TimePoint now) const {
    auto total = active_;
    if (running_since_ && now > *running_since_) {
        total += now - *running_since_;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(total);
}

void ProgressMeter::trim_window(TimePoint now) {
    auto cutoff = now - SPEED_WINDOW;
    while (!window_.empty() && window_.front().first < cutoff) {
        window_.pop_front();
    }
}

} // namespace ferry::transfer
