#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace ferry::transfer {

class TransferScheduler;

// Wakes the scheduler when the earliest deferred transfer becomes due.
// Polls at least every max_wait so records enqueued later are not missed.
class ScheduleTimer {
public:
    explicit ScheduleTimer(TransferScheduler& scheduler,
                           std::chrono::milliseconds max_wait = std::chrono::seconds(1));
    ~ScheduleTimer();
    
    ScheduleTimer(const ScheduleTimer&) = delete;
    ScheduleTimer& operator=(const ScheduleTimer&) = delete;
    
    bool start();
    void stop();
    bool is_running() const { return running_; }
    
    // Re-arms against the current earliest scheduled time
    void wake();
    
    std::uint64_t poll_count() const { return poll_count_; }
    
private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    
    TransferScheduler& scheduler_;
    std::chrono::milliseconds max_wait_;
    
    boost::asio::io_context io_context_;
    boost::asio::steady_timer timer_;
    std::unique_ptr<WorkGuard> work_guard_;
    std::thread io_thread_;
    std::atomic<bool> running_;
    std::atomic<std::uint64_t> poll_count_;
    
    void arm();
};

} // namespace ferry::transfer
