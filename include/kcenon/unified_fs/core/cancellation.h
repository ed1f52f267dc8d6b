/**
 * @file cancellation.h
 * @brief Cooperative cancellation flag shared between a request and its workers
 */

#ifndef KCENON_UNIFIED_FS_CORE_CANCELLATION_H
#define KCENON_UNIFIED_FS_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace kcenon::unified_fs {

/**
 * @brief Copyable handle to a shared cancellation flag
 *
 * Copies observe the same flag. Work polls is_cancelled() at safe points;
 * nothing is interrupted forcibly.
 */
class cancellation_token {
public:
    cancellation_token() : state_(std::make_shared<state>()) {}

    void cancel() noexcept {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->cancelled.store(true);
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return state_->cancelled.load();
    }

    /**
     * @brief Sleep that wakes up early on cancellation
     * @return true if the full duration elapsed, false if cancelled
     */
    template <typename Rep, typename Period>
    auto sleep_for(std::chrono::duration<Rep, Period> duration) const -> bool {
        std::unique_lock<std::mutex> lock(state_->mutex);
        return !state_->cv.wait_for(lock, duration,
                                    [this] { return state_->cancelled.load(); });
    }

private:
    struct state {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<state> state_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_CORE_CANCELLATION_H
