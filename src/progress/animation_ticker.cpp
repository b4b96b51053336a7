#include "pintui/progress/animation_ticker.hpp"
#include "pintui/common/logger.hpp"
#include <exception>

namespace pintui {
namespace progress {

AnimationTicker::AnimationTicker(std::chrono::milliseconds interval, TickCallback on_tick)
    : interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1)),
      on_tick_(std::move(on_tick)) {}

AnimationTicker::~AnimationTicker() {
    stop();
}

bool AnimationTicker::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started_ || !on_tick_) {
            return false;
        }
        started_ = true;
        stop_requested_ = false;
    }
    
    running_ = true;
    thread_ = std::thread(&AnimationTicker::run, this);
    return true;
}

void AnimationTicker::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

void AnimationTicker::run() {
    size_t tick = 0;
    std::unique_lock<std::mutex> lock(mutex_);
    
    while (!stop_requested_) {
        lock.unlock();
        
        try {
            on_tick_(tick++);
        } catch (const std::exception& e) {
            common::Logger::instance().error("[Ticker] Tick failed, stopping | error={}", e.what());
            running_ = false;
            return;
        }
        ticks_.fetch_add(1);
        
        lock.lock();
        cv_.wait_for(lock, interval_, [this] { return stop_requested_; });
    }
    
    running_ = false;
}

}}
