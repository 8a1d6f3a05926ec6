#include "StopSignal.hpp"

void StopSignal::Request() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requested_ = true;
    }
    cv_.notify_all();
}

bool StopSignal::Requested() const {
    return requested_;
}

bool StopSignal::WaitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return requested_.load(); });
}
