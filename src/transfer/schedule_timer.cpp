#include "ferry/transfer/schedule_timer.hpp"
#include "ferry/transfer/transfer_scheduler.hpp"
#include "ferry/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>

namespace ferry::transfer {

ScheduleTimer::ScheduleTimer(TransferScheduler& scheduler, std::chrono::milliseconds max_wait)
    : scheduler_(scheduler)
    , max_wait_(std::max(max_wait, std::chrono::milliseconds(1)))
    , io_context_()
    , timer_(io_context_)
    , running_(false)
    , poll_count_(0) {
}

ScheduleTimer::~ScheduleTimer() {
    stop();
}

bool ScheduleTimer::start() {
    if (running_) {
        LOG_WARN("Schedule timer already running");
        return false;
    }
    
    running_ = true;
    io_context_.restart();
    work_guard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(io_context_));
    boost::asio::post(io_context_, [this]() { arm(); });
    
    io_thread_ = std::thread([this]() {
        LOG_DEBUG("Schedule timer thread started");
        while (running_) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                LOG_ERROR("Schedule timer error: {}", e.what());
                if (!running_) break;
                io_context_.restart();
            }
        }
        LOG_DEBUG("Schedule timer thread stopped");
    });
    
    return true;
}

void ScheduleTimer::stop() {
    if (!running_) {
        return;
    }
    
    running_ = false;
    work_guard_.reset();
    io_context_.stop();
    
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

void ScheduleTimer::wake() {
    if (!running_) {
        return;
    }
    boost::asio::post(io_context_, [this]() {
        timer_.cancel();
        arm();
    });
}

void ScheduleTimer::arm() {
    if (!running_) {
        return;
    }
    
    auto wait = max_wait_;
    if (auto next = scheduler_.next_scheduled_time()) {
        auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
            *next - std::chrono::system_clock::now());
        wait = std::clamp(until, std::chrono::milliseconds(0), max_wait_);
    }
    
    timer_.expires_after(wait);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !running_) {
            return;
        }
        
        scheduler_.poll();
        poll_count_++;
        arm();
    });
}

} // namespace ferry::transfer
