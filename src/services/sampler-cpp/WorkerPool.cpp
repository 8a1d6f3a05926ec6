#include "WorkerPool.hpp"

#include <algorithm>

WorkerPool::WorkerPool(size_t workers) {
    const size_t count = std::max<size_t>(1, workers);
    threads_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        threads_.emplace_back(&WorkerPool::Run, this);
    }
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

void WorkerPool::Shutdown() {
    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && threads_.empty()) {
            return;
        }
        stopping_ = true;
        dropped.swap(queue_);
    }
    cv_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

size_t WorkerPool::Size() const {
    return threads_.size();
}

void WorkerPool::Run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
    }
}
