/**
 * @file remote_connection.cpp
 * @brief Implementation of remote_connection
 */

#include <kcenon/unified_fs/session/remote_connection.h>
#include <kcenon/unified_fs/core/logging.h>

namespace kcenon::unified_fs {

remote_connection::remote_connection(provider_handle handle) : handle_(std::move(handle)) {}

remote_connection::~remote_connection() {
    release();
}

auto remote_connection::try_keepalive(std::chrono::milliseconds lock_wait)
    -> std::optional<result<void>> {
    std::unique_lock<std::timed_mutex> lock(io_mutex_, std::defer_lock);
    if (!lock.try_lock_for(lock_wait)) {
        return std::nullopt;
    }
    if (!session_) {
        return result<void>{unexpected{error{error_code::connectivity_error,
                                             "no session for " + handle_.label()}}};
    }
    return session_->keepalive();
}

auto remote_connection::install(std::unique_ptr<sftp::sftp_session> session) -> uint64_t {
    std::lock_guard<std::timed_mutex> lock(io_mutex_);
    if (session_) {
        {
            std::lock_guard<std::mutex> guard(interrupt_mutex_);
            interruptible_ = nullptr;
        }
        session_->close();
    }
    session_ = std::move(session);
    multiplexed_.store(session_->multiplexed());
    {
        std::lock_guard<std::mutex> guard(interrupt_mutex_);
        interruptible_ = session_.get();
    }
    return generation_.fetch_add(1) + 1;
}

auto remote_connection::release() -> void {
    state_.store(connection_state::disconnected);
    {
        std::lock_guard<std::mutex> guard(interrupt_mutex_);
        if (interruptible_) {
            interruptible_->interrupt();
        }
    }

    std::lock_guard<std::timed_mutex> lock(io_mutex_);
    {
        std::lock_guard<std::mutex> guard(interrupt_mutex_);
        interruptible_ = nullptr;
    }
    if (session_) {
        session_->close();
        session_.reset();
        UFS_LOG_DEBUG(log_category::session, "Released session " + handle_.label());
    }
}

auto remote_connection::set_failure_handler(failure_handler handler) -> void {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_failure_ = std::move(handler);
}

auto remote_connection::report_failure(const error& err, uint64_t generation) -> void {
    failure_handler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = on_failure_;
    }
    if (handler) {
        handler(err, generation);
    }
}

}  // namespace kcenon::unified_fs
