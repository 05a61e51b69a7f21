#pragma once

#include "transfer_types.hpp"
#include <deque>
#include <optional>
#include <cstdint>

namespace ferry::transfer {

// Folds progress ticks for one record into current/average/peak speed and ETA.
// Not synchronized; the scheduler calls it under its own lock.
class ProgressMeter {
public:
    ProgressMeter() = default;
    
    void start(TimePoint now);
    void stop(TimePoint now);
    bool running() const { return running_since_.has_value(); }
    
    // delta is the number of new bytes since the previous tick.
    // A reported speed of 0 falls back to the sliding window.
    void record(TimePoint now, std::uint64_t delta, double reported_speed);
    
    double current_speed() const { return current_speed_; }
    double average_speed() const { return average_speed_; }
    double peak_speed() const { return peak_speed_; }
    double eta(std::uint64_t remaining_bytes) const;
    
    std::uint64_t bytes_moved() const { return bytes_moved_; }
    std::chrono::milliseconds active_time(TimePoint now) const;
    
private:
    std::deque<std::pair<TimePoint, std::uint64_t>> window_;
    std::uint64_t bytes_moved_ = 0;
    TimePoint::duration active_{};
    std::optional<TimePoint> running_since_;
    
    double current_speed_ = 0.0;
    double average_speed_ = 0.0;
    double peak_speed_ = 0.0;
    
    void trim_window(TimePoint now);
    
    static constexpr std::chrono::seconds SPEED_WINDOW{1};
};

} // namespace ferry::transfer
