#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace pintui {
namespace progress {

// Calls on_tick on a background thread: once immediately after start(),
// then once per interval until stop(). stop() joins the thread, so when it
// returns no callback is running and none will run again.
class AnimationTicker {
public:
    using TickCallback = std::function<void(size_t tick)>;
    
    AnimationTicker(std::chrono::milliseconds interval, TickCallback on_tick);
    ~AnimationTicker();
    
    AnimationTicker(const AnimationTicker&) = delete;
    AnimationTicker& operator=(const AnimationTicker&) = delete;
    
    // A ticker runs at most once; starting it again after stop() fails.
    bool start();
    void stop();
    
    bool isRunning() const { return running_.load(); }
    size_t tickCount() const { return ticks_.load(); }
    std::chrono::milliseconds interval() const { return interval_; }

private:
    void run();
    
    std::chrono::milliseconds interval_;
    TickCallback on_tick_;
    
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool started_ = false;
    
    std::atomic<bool> running_{false};
    std::atomic<size_t> ticks_{0};
};

}}
