#pragma once

#include <raslink/common.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace raslink {

    /// Cooperative cancellation shared between a caller and a running connect
    class CancelToken {
      private:
        std::atomic<bool> cancelled_;
        mutable std::mutex mutex_;
        mutable std::condition_variable cv_;

      public:
        CancelToken() : cancelled_(false) {}

        CancelToken(const CancelToken &) = delete;
        CancelToken &operator=(const CancelToken &) = delete;

        void cancel() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cancelled_ = true;
            }
            cv_.notify_all();
        }

        bool is_cancelled() const { return cancelled_; }

        /// Sleep up to timeout_ms; returns true as soon as the token is cancelled
        bool wait_for(dp::u32 timeout_ms) const {
            std::unique_lock<std::mutex> lock(mutex_);
            return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return cancelled_.load(); });
        }
    };

} // namespace raslink
