/**
 * @file connection_manager.h
 * @brief Owns the lifecycle of remote sessions
 */

#ifndef KCENON_UNIFIED_FS_SESSION_CONNECTION_MANAGER_H
#define KCENON_UNIFIED_FS_SESSION_CONNECTION_MANAGER_H

#include <kcenon/unified_fs/core/provider_handle.h>
#include <kcenon/unified_fs/core/types.h>
#include <kcenon/unified_fs/session/connection_types.h>
#include <kcenon/unified_fs/sftp/sftp_session.h>

#include <memory>
#include <optional>
#include <vector>

namespace kcenon::unified_fs {

class event_bus;
class provider_registry;

/**
 * @brief Connects, monitors and tears down remote sessions
 *
 * Each successful connect() registers a remote provider under a fresh
 * handle. A heartbeat thread probes ready sessions; a lost session turns
 * degraded, gets one reconnect attempt and becomes ready again or
 * disconnected. Every state change is published as a connectivity_event.
 *
 * Credentials are resolved through the credential_store at connect time
 * and are never logged or kept.
 */
class connection_manager {
public:
    /**
     * @param factory Opens SFTP sessions; null when SFTP support is not built
     * @param credentials Resolves credential references
     * @param registry Receives the remote providers
     * @param events Receives connectivity events; may be null
     */
    connection_manager(std::shared_ptr<sftp::session_factory> factory,
                       std::shared_ptr<sftp::credential_store> credentials,
                       provider_registry& registry,
                       event_bus* events,
                       connection_config config = {});
    ~connection_manager();

    connection_manager(const connection_manager&) = delete;
    connection_manager& operator=(const connection_manager&) = delete;

    /**
     * @brief Open a session to @p endpoint
     *
     * Connectivity failures are retried per the retry policy. An
     * authentication failure is returned at once. The initial path must
     * exist, otherwise the session is torn down and not_found returned.
     */
    [[nodiscard]] auto connect(const remote_endpoint& endpoint) -> result<provider_handle>;

    /**
     * @brief Close the session and unregister its provider
     *
     * Requests still using the handle fail with connectivity_error.
     */
    auto disconnect(const provider_handle& handle) -> result<void>;

    [[nodiscard]] auto state(const provider_handle& handle) const -> connection_state;

    /**
     * @brief Replace the session behind @p handle with a new one
     */
    auto reconnect(const provider_handle& handle) -> result<void>;

    /**
     * @brief Run one heartbeat probe now instead of waiting for the timer
     */
    auto heartbeat_now(const provider_handle& handle) -> void;

    /**
     * @brief Reconnect sessions saved by a previous run
     *
     * Each saved session is connected independently. When its last path
     * no longer exists the outcome falls back to the initial path.
     */
    [[nodiscard]] auto restore_sessions(const std::vector<saved_session>& sessions)
        -> std::vector<restore_outcome>;

    [[nodiscard]] auto active_handles() const -> std::vector<provider_handle>;

    /**
     * @brief Disconnect everything and stop the heartbeat thread
     */
    auto shutdown() -> void;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_SESSION_CONNECTION_MANAGER_H
