/**
 * @file remote_connection.h
 * @brief The single live session behind one remote provider handle
 */

#ifndef KCENON_UNIFIED_FS_SESSION_REMOTE_CONNECTION_H
#define KCENON_UNIFIED_FS_SESSION_REMOTE_CONNECTION_H

#include <kcenon/unified_fs/session/connection_types.h>
#include <kcenon/unified_fs/sftp/sftp_session.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>

namespace kcenon::unified_fs {

/**
 * @brief Serializes protocol exchanges on one session
 *
 * Every call into the sftp_session happens inside execute() while holding
 * the I/O mutex, so at most one request is in flight per session. The
 * connection manager is the only writer of the state and the session
 * pointer.
 *
 * Each installed session gets a new generation number. Resources opened
 * on an earlier session (file and directory handles) are bound to their
 * generation and fail with connectivity_error after a reconnect.
 */
class remote_connection {
public:
    /// Receives the error and the generation of the session that failed
    using failure_handler = std::function<void(const error&, uint64_t)>;

    explicit remote_connection(provider_handle handle);
    ~remote_connection();

    remote_connection(const remote_connection&) = delete;
    remote_connection& operator=(const remote_connection&) = delete;

    [[nodiscard]] auto handle() const -> const provider_handle& { return handle_; }

    [[nodiscard]] auto state() const -> connection_state { return state_.load(); }

    [[nodiscard]] auto generation() const -> uint64_t { return generation_.load(); }

    [[nodiscard]] auto multiplexed() const -> bool { return multiplexed_.load(); }

    /**
     * @brief Run one protocol exchange on the current session
     *
     * Fails with connectivity_error without calling @p fn when the session
     * is not ready. A connectivity_error returned by @p fn is reported to
     * the failure handler after the I/O mutex has been released.
     */
    template <typename Fn>
    auto execute(Fn&& fn) -> std::invoke_result_t<Fn, sftp::sftp_session&> {
        return execute_bound(0, std::forward<Fn>(fn));
    }

    /**
     * @brief execute() for resources tied to session generation @p expected
     *
     * An @p expected of 0 accepts any generation.
     */
    template <typename Fn>
    auto execute_bound(uint64_t expected, Fn&& fn)
        -> std::invoke_result_t<Fn, sftp::sftp_session&> {
        using result_type = std::invoke_result_t<Fn, sftp::sftp_session&>;

        std::unique_lock<std::timed_mutex> lock(io_mutex_);
        if (!session_ || state_.load() != connection_state::ready) {
            return result_type{unexpected{error{
                error_code::connectivity_error,
                "session " + handle_.label() + " is " + to_string(state_.load())}}};
        }
        if (expected != 0 && expected != generation_.load()) {
            return result_type{unexpected{error{
                error_code::connectivity_error,
                "remote handle was opened before the session to " + handle_.label() +
                    " was re-established"}}};
        }

        auto current = generation_.load();
        auto outcome = fn(*session_);
        lock.unlock();

        if (!outcome && outcome.error().code == error_code::connectivity_error) {
            report_failure(outcome.error(), current);
        }
        return outcome;
    }

    /**
     * @brief Probe the session without queueing behind a long exchange
     * @return nullopt when the session is busy (busy counts as alive)
     */
    [[nodiscard]] auto try_keepalive(std::chrono::milliseconds lock_wait)
        -> std::optional<result<void>>;

    /**
     * @brief Install a freshly opened session and bump the generation
     */
    auto install(std::unique_ptr<sftp::sftp_session> session) -> uint64_t;

    /**
     * @brief Tear down the current session
     *
     * Interrupts blocking I/O first, then closes the session once the
     * in-flight exchange (if any) has returned.
     */
    auto release() -> void;

    /**
     * @brief Run @p fn under the I/O mutex regardless of the session state
     *
     * Used to release handles that belong to this connection.
     */
    template <typename Fn>
    auto with_io_lock(Fn&& fn) -> void {
        std::lock_guard<std::timed_mutex> lock(io_mutex_);
        fn();
    }

    auto set_state(connection_state state) -> void { state_.store(state); }

    auto set_failure_handler(failure_handler handler) -> void;

private:
    auto report_failure(const error& err, uint64_t generation) -> void;

    provider_handle handle_;
    std::atomic<connection_state> state_{connection_state::disconnected};
    std::atomic<uint64_t> generation_{0};
    std::atomic<bool> multiplexed_{false};

    std::timed_mutex io_mutex_;
    std::unique_ptr<sftp::sftp_session> session_;

    // Raw pointer to the session for interrupt() without the I/O mutex
    std::mutex interrupt_mutex_;
    sftp::sftp_session* interruptible_ = nullptr;

    std::mutex handler_mutex_;
    failure_handler on_failure_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_SESSION_REMOTE_CONNECTION_H
