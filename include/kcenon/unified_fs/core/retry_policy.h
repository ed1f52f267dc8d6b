/**
 * @file retry_policy.h
 * @brief Bounded exponential backoff shared by connection and transfer code
 */

#ifndef KCENON_UNIFIED_FS_CORE_RETRY_POLICY_H
#define KCENON_UNIFIED_FS_CORE_RETRY_POLICY_H

#include <kcenon/unified_fs/core/types.h>

#include <chrono>
#include <cstdint>
#include <optional>

namespace kcenon::unified_fs {

/**
 * @brief Retry-with-backoff policy
 *
 * A pure function of (failed attempts, error class): callers own the loop
 * and the waiting. Only retryable errors (see is_retryable) are retried.
 *
 * With the defaults an operation is tried once and then retried after
 * 1 s, 2 s and 4 s.
 */
struct retry_policy {
    uint32_t max_retries = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double backoff_multiplier = 2.0;

    /**
     * @brief Delay before the next attempt
     * @param failed_attempts Number of attempts that have failed so far (>= 1)
     * @param code Error of the last failed attempt
     * @return Delay to wait, or nullopt when the caller must give up
     */
    [[nodiscard]] auto next_delay(uint32_t failed_attempts, error_code code) const
        -> std::optional<std::chrono::milliseconds>;

    /**
     * @brief Policy that never retries
     */
    [[nodiscard]] static auto none() -> retry_policy {
        retry_policy policy;
        policy.max_retries = 0;
        return policy;
    }
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_CORE_RETRY_POLICY_H
