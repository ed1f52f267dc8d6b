/**
 * @file transfer_session.cpp
 * @brief Implementation of transfer_session
 */

#include <kcenon/unified_fs/transfer/transfer_session.h>

#include <string>

namespace kcenon::unified_fs {

transfer_session::transfer_session(request_id request, cancellation_token token)
    : request_(request), token_(std::move(token)), started_(std::chrono::steady_clock::now()) {}

auto transfer_session::state() const -> session_state {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto transfer_session::transition(session_state next) -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_valid_transition(state_, next)) {
        return unexpected{error{error_code::invalid_argument,
                                std::string("invalid transfer state change ") +
                                    to_string(state_) + " -> " + to_string(next)}};
    }
    state_ = next;
    return {};
}

auto transfer_session::record_retry(std::size_t item) -> uint32_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++retries_[item];
}

auto transfer_session::retries(std::size_t item) const -> uint32_t {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = retries_.find(item);
    return it == retries_.end() ? 0 : it->second;
}

auto transfer_session::elapsed() const -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
}

}  // namespace kcenon::unified_fs
