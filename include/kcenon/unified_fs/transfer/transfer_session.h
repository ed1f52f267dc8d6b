/**
 * @file transfer_session.h
 * @brief Mutable state of one copy or move request
 */

#ifndef KCENON_UNIFIED_FS_TRANSFER_TRANSFER_SESSION_H
#define KCENON_UNIFIED_FS_TRANSFER_TRANSFER_SESSION_H

#include <kcenon/unified_fs/core/cancellation.h>
#include <kcenon/unified_fs/core/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace kcenon::unified_fs {

/**
 * @brief Transfer session state
 *
 * pending -> running -> (completed | cancelled | failed)
 *
 * running may be re-entered when an item is retried.
 */
enum class session_state {
    pending,
    running,
    completed,
    cancelled,
    failed
};

[[nodiscard]] constexpr auto to_string(session_state state) noexcept -> const char* {
    switch (state) {
        case session_state::pending: return "pending";
        case session_state::running: return "running";
        case session_state::completed: return "completed";
        case session_state::cancelled: return "cancelled";
        case session_state::failed: return "failed";
        default: return "unknown";
    }
}

[[nodiscard]] constexpr auto is_terminal_state(session_state state) noexcept -> bool {
    return state == session_state::completed || state == session_state::cancelled ||
           state == session_state::failed;
}

[[nodiscard]] constexpr auto is_valid_transition(session_state from, session_state to) noexcept
    -> bool {
    switch (from) {
        case session_state::pending:
            return to == session_state::running || to == session_state::cancelled;
        case session_state::running:
            return to == session_state::running || is_terminal_state(to);
        default:
            return false;
    }
}

/**
 * @brief Per-request bookkeeping owned by the transfer engine
 *
 * Thread-safe: items of one request may run on several workers.
 */
class transfer_session {
public:
    transfer_session(request_id request, cancellation_token token);

    [[nodiscard]] auto request() const -> request_id { return request_; }
    [[nodiscard]] auto token() const -> const cancellation_token& { return token_; }
    [[nodiscard]] auto cancelled() const -> bool { return token_.is_cancelled(); }

    [[nodiscard]] auto state() const -> session_state;

    /**
     * @brief Move to @p next
     * @return invalid_argument when the transition is not allowed
     */
    auto transition(session_state next) -> result<void>;

    auto set_batch_total(uint64_t bytes) -> void { batch_total_.store(bytes); }
    [[nodiscard]] auto batch_total() const -> uint64_t { return batch_total_.load(); }

    /**
     * @return Batch bytes after adding @p bytes
     */
    auto add_bytes(uint64_t bytes) -> uint64_t { return bytes_so_far_.fetch_add(bytes) + bytes; }

    /**
     * @brief Undo bytes counted for an attempt that is being retried
     */
    auto remove_bytes(uint64_t bytes) -> void { bytes_so_far_.fetch_sub(bytes); }

    [[nodiscard]] auto bytes_so_far() const -> uint64_t { return bytes_so_far_.load(); }

    auto set_current_item(std::size_t index) -> void { current_item_.store(index); }
    [[nodiscard]] auto current_item() const -> std::size_t { return current_item_.load(); }

    /**
     * @return Number of retries of @p item including this one
     */
    auto record_retry(std::size_t item) -> uint32_t;
    [[nodiscard]] auto retries(std::size_t item) const -> uint32_t;

    [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds;

private:
    request_id request_;
    cancellation_token token_;
    std::chrono::steady_clock::time_point started_;

    mutable std::mutex mutex_;
    session_state state_ = session_state::pending;
    std::unordered_map<std::size_t, uint32_t> retries_;

    std::atomic<uint64_t> batch_total_{0};
    std::atomic<uint64_t> bytes_so_far_{0};
    std::atomic<std::size_t> current_item_{0};
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_TRANSFER_TRANSFER_SESSION_H
