#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

// Cooperative shutdown flag. HTTP calls watch flag() through the curl
// progress callback; sleeps poll it in short slices.
class StopSignal {
public:
    void request_stop() noexcept { stop_.store(true); }
    bool stop_requested() const noexcept { return stop_.load(); }
    const std::atomic<bool>* flag() const noexcept { return &stop_; }

    // Returns false when stop was requested before `d` elapsed.
    bool wait_for(std::chrono::milliseconds d) const {
        auto deadline = std::chrono::steady_clock::now() + d;
        while (!stop_requested()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return true;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(100)));
        }
        return false;
    }

private:
    std::atomic<bool> stop_{false};
};
