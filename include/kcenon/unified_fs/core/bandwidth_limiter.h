/**
 * @file bandwidth_limiter.h
 * @brief Token bucket shared by all transfers of one core instance
 */

#ifndef KCENON_UNIFIED_FS_CORE_BANDWIDTH_LIMITER_H
#define KCENON_UNIFIED_FS_CORE_BANDWIDTH_LIMITER_H

#include <kcenon/unified_fs/core/cancellation.h>

#include <chrono>
#include <cstddef>
#include <mutex>

namespace kcenon::unified_fs {

/**
 * @brief Token bucket bandwidth limiter
 *
 * The bucket holds one second worth of bytes, so short bursts pass at full
 * speed while the average rate converges to the limit. A limit of 0 means
 * unlimited.
 *
 * @code
 * bandwidth_limiter limiter(10 * 1024 * 1024);  // 10 MiB/s
 * limiter.acquire(chunk.size(), token);
 * @endcode
 */
class bandwidth_limiter {
public:
    explicit bandwidth_limiter(std::size_t bytes_per_second = 0);

    bandwidth_limiter(const bandwidth_limiter&) = delete;
    auto operator=(const bandwidth_limiter&) -> bandwidth_limiter& = delete;

    /**
     * @brief Take @p bytes from the bucket, waiting for refill if needed
     * @param bytes Number of bytes about to be transferred
     * @param token Wait is abandoned when this token is cancelled
     * @return false if the wait was abandoned
     */
    auto acquire(std::size_t bytes, const cancellation_token& token) -> bool;

    /**
     * @brief Take @p bytes only if available right now
     */
    [[nodiscard]] auto try_acquire(std::size_t bytes) -> bool;

    /**
     * @brief Change the rate; takes effect for the next acquire
     */
    auto set_limit(std::size_t bytes_per_second) -> void;

    [[nodiscard]] auto get_limit() const -> std::size_t;

    [[nodiscard]] auto is_enabled() const -> bool;

    [[nodiscard]] auto available_tokens() -> std::size_t;

private:
    auto refill_locked() -> void;

    mutable std::mutex mutex_;
    std::size_t bytes_per_second_;
    double tokens_;
    std::chrono::steady_clock::time_point last_refill_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_CORE_BANDWIDTH_LIMITER_H
