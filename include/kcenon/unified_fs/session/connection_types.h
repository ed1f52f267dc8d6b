/**
 * @file connection_types.h
 * @brief Connection states and configuration of remote sessions
 */

#ifndef KCENON_UNIFIED_FS_SESSION_CONNECTION_TYPES_H
#define KCENON_UNIFIED_FS_SESSION_CONNECTION_TYPES_H

#include <kcenon/unified_fs/core/provider_handle.h>
#include <kcenon/unified_fs/core/retry_policy.h>
#include <kcenon/unified_fs/core/types.h>

#include <chrono>
#include <optional>
#include <string>

namespace kcenon::unified_fs {

/**
 * @brief Lifecycle of one remote session
 *
 * disconnected -> connecting -> authenticated -> ready -> (degraded | disconnected)
 */
enum class connection_state {
    disconnected,
    connecting,
    authenticated,
    ready,
    degraded
};

[[nodiscard]] constexpr auto to_string(connection_state state) -> const char* {
    switch (state) {
        case connection_state::disconnected:
            return "disconnected";
        case connection_state::connecting:
            return "connecting";
        case connection_state::authenticated:
            return "authenticated";
        case connection_state::ready:
            return "ready";
        case connection_state::degraded:
            return "degraded";
        default:
            return "unknown";
    }
}

/**
 * @brief Settings of connection_manager
 */
struct connection_config {
    /// Applied to connectivity failures while connecting; never to auth failures
    retry_policy retry;

    std::chrono::milliseconds connect_timeout{10000};

    /// Interval between keep-alive probes; zero disables the heartbeat thread
    std::chrono::milliseconds heartbeat_interval{30000};

    /// Bound on one keep-alive round trip
    std::chrono::milliseconds heartbeat_timeout{10000};

    /// Concurrency granted to sessions that declare multiplexing
    std::size_t multiplexed_concurrency = 4;
};

/**
 * @brief Last used connection, persisted by the embedding application
 */
struct saved_session {
    remote_endpoint endpoint;

    /// Directory the remote panel showed last; empty means the initial path
    std::string last_path;
};

/**
 * @brief Outcome of restoring one saved session
 */
struct restore_outcome {
    saved_session session;
    std::optional<provider_handle> handle;
    std::optional<error> failure;
    std::string path;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_SESSION_CONNECTION_TYPES_H
