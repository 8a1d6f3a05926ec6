#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Cooperative cancellation shared by the sampler loop and the frame-rate worker.
class StopSignal {
public:
    void Request();
    bool Requested() const;

    // Sleeps for up to duration; returns true when stop was requested.
    bool WaitFor(std::chrono::milliseconds duration);

private:
    std::atomic<bool> requested_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
