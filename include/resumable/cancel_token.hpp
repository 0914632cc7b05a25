#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace resumable {

class CancelToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool isCancelled() const noexcept { return cancelled_.load(); }

    // Sleeps for the given duration; returns true early if cancelled meanwhile.
    bool waitFor(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

} // namespace resumable
