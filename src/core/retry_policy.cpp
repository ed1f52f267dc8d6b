/**
 * @file retry_policy.cpp
 * @brief Implementation of retry_policy
 */

#include <kcenon/unified_fs/core/retry_policy.h>

#include <algorithm>
#include <cmath>

namespace kcenon::unified_fs {

auto retry_policy::next_delay(uint32_t failed_attempts, error_code code) const
    -> std::optional<std::chrono::milliseconds> {
    if (!is_retryable(code) || failed_attempts == 0 || failed_attempts > max_retries) {
        return std::nullopt;
    }

    double factor = std::pow(std::max(backoff_multiplier, 1.0),
                             static_cast<double>(failed_attempts - 1));
    double delay_ms = static_cast<double>(initial_delay.count()) * factor;
    double cap_ms = static_cast<double>(std::max(max_delay, initial_delay).count());

    return std::chrono::milliseconds(static_cast<int64_t>(std::min(delay_ms, cap_ms)));
}

}  // namespace kcenon::unified_fs
