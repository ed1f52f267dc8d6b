/**
 * @file bandwidth_limiter.cpp
 * @brief Token bucket bandwidth limiter
 */

#include <kcenon/unified_fs/core/bandwidth_limiter.h>

#include <algorithm>

namespace kcenon::unified_fs {

namespace {

// Upper bound of a single wait so that limit changes are picked up quickly
constexpr auto max_wait_slice = std::chrono::milliseconds(100);

}  // namespace

bandwidth_limiter::bandwidth_limiter(std::size_t bytes_per_second)
    : bytes_per_second_(bytes_per_second)
    , tokens_(static_cast<double>(bytes_per_second))
    , last_refill_(std::chrono::steady_clock::now()) {}

auto bandwidth_limiter::acquire(std::size_t bytes, const cancellation_token& token) -> bool {
    while (true) {
        std::chrono::microseconds wait{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (bytes_per_second_ == 0 || bytes == 0) {
                return true;
            }
            refill_locked();

            // A request larger than the bucket is granted once the bucket is
            // full and drives the balance negative.
            double needed = std::min(static_cast<double>(bytes),
                                     static_cast<double>(bytes_per_second_));
            if (tokens_ >= needed) {
                tokens_ -= static_cast<double>(bytes);
                return true;
            }
            double seconds = (needed - tokens_) / static_cast<double>(bytes_per_second_);
            wait = std::chrono::microseconds(static_cast<int64_t>(seconds * 1'000'000.0) + 1);
        }

        auto slice = std::min<std::chrono::microseconds>(wait, max_wait_slice);
        if (!token.sleep_for(slice)) {
            return false;
        }
    }
}

auto bandwidth_limiter::try_acquire(std::size_t bytes) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bytes_per_second_ == 0 || bytes == 0) {
        return true;
    }
    refill_locked();
    if (tokens_ >= static_cast<double>(bytes)) {
        tokens_ -= static_cast<double>(bytes);
        return true;
    }
    return false;
}

auto bandwidth_limiter::set_limit(std::size_t bytes_per_second) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    bytes_per_second_ = bytes_per_second;
    tokens_ = static_cast<double>(bytes_per_second);
    last_refill_ = std::chrono::steady_clock::now();
}

auto bandwidth_limiter::get_limit() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_per_second_;
}

auto bandwidth_limiter::is_enabled() const -> bool {
    return get_limit() > 0;
}

auto bandwidth_limiter::available_tokens() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    refill_locked();
    return static_cast<std::size_t>(std::max(0.0, tokens_));
}

auto bandwidth_limiter::refill_locked() -> void {
    auto now = std::chrono::steady_clock::now();
    std::chrono::duration<double> elapsed = now - last_refill_;
    last_refill_ = now;
    tokens_ = std::min(tokens_ + elapsed.count() * static_cast<double>(bytes_per_second_),
                       static_cast<double>(bytes_per_second_));
}

}  // namespace kcenon::unified_fs
