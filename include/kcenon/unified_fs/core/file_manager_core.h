/**
 * @file file_manager_core.h
 * @brief Entry point of the unified filesystem core
 */

#ifndef KCENON_UNIFIED_FS_CORE_FILE_MANAGER_CORE_H
#define KCENON_UNIFIED_FS_CORE_FILE_MANAGER_CORE_H

#include <kcenon/unified_fs/core/provider_handle.h>
#include <kcenon/unified_fs/core/retry_policy.h>
#include <kcenon/unified_fs/core/types.h>
#include <kcenon/unified_fs/events/event_bus.h>
#include <kcenon/unified_fs/lister/directory_lister.h>
#include <kcenon/unified_fs/queue/operation_queue.h>
#include <kcenon/unified_fs/queue/operation_request.h>
#include <kcenon/unified_fs/session/connection_types.h>
#include <kcenon/unified_fs/sftp/sftp_session.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::unified_fs {

namespace adapters {
class task_pool_interface;
}

/**
 * @brief Settings of file_manager_core
 */
struct core_config {
    std::size_t worker_count = 4;

    /// Bytes per read/write round of a transfer (4 KiB to 1 MiB)
    std::size_t chunk_size = 64 * 1024;

    std::size_t max_parallel_items = 1;

    /// Shared by connection setup and transfer items
    retry_policy retry;

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds heartbeat_timeout{10000};

    /// Bytes per second across all transfers; 0 means unlimited
    std::size_t bandwidth_limit = 0;

    /// Requests allowed on the local provider at once; 0 means worker count
    std::size_t local_concurrency = 0;

    /// Requests allowed on a session that declares multiplexing
    std::size_t multiplexed_concurrency = 4;
};

/**
 * @brief Provider-agnostic filesystem core for a dual-pane file manager
 *
 * Owns the local provider, remote sessions, the worker pool, the transfer
 * engine and the event bus. The presentation layer submits requests and
 * subscribes to events; nothing here blocks on request completion except
 * wait().
 *
 * @code
 * auto core_result = file_manager_core::builder()
 *     .with_worker_count(4)
 *     .with_credential_store(credentials)
 *     .build();
 *
 * if (core_result.has_value()) {
 *     auto& core = core_result.value();
 *     auto remote = core.connect(endpoint);
 *     auto request = operation_request::builder(operation_kind::copy)
 *         .add_source(file_manager_core::local_handle(), "/home/me/a")
 *         .with_destination(remote.value(), "/srv")
 *         .with_recursive(true)
 *         .build();
 *     core.submit(request.value());
 * }
 * @endcode
 */
class file_manager_core {
public:
    /**
     * @brief Builder for file_manager_core
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the number of worker threads (default: 4)
         */
        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Set the transfer chunk size
         * @param size Chunk size in bytes (default: 64KB)
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        auto with_max_parallel_items(std::size_t count) -> builder&;

        auto with_retry_policy(const retry_policy& policy) -> builder&;

        auto with_connect_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Configure keep-alive probing of remote sessions
         * @param interval Time between probes; zero disables probing
         * @param timeout Bound on one probe
         */
        auto with_heartbeat(std::chrono::milliseconds interval,
                            std::chrono::milliseconds timeout) -> builder&;

        auto with_bandwidth_limit(std::size_t bytes_per_second) -> builder&;

        auto with_local_concurrency(std::size_t count) -> builder&;

        auto with_multiplexed_concurrency(std::size_t count) -> builder&;

        /**
         * @brief Replace the SFTP session factory
         *
         * Defaults to libssh2 when built with SFTP support.
         */
        auto with_session_factory(std::shared_ptr<sftp::session_factory> factory) -> builder&;

        auto with_credential_store(std::shared_ptr<sftp::credential_store> store) -> builder&;

        /**
         * @brief Run requests on @p pool instead of a pool created from the
         *        worker count
         */
        auto with_task_pool(std::shared_ptr<adapters::task_pool_interface> pool) -> builder&;

        /**
         * @brief Build the core
         * @return invalid_argument when a setting is out of range
         */
        [[nodiscard]] auto build() -> result<file_manager_core>;

    private:
        core_config config_;
        std::shared_ptr<sftp::session_factory> factory_;
        bool factory_set_ = false;
        std::shared_ptr<sftp::credential_store> credentials_;
        std::shared_ptr<adapters::task_pool_interface> pool_;
    };

    file_manager_core(const file_manager_core&) = delete;
    auto operator=(const file_manager_core&) -> file_manager_core& = delete;
    file_manager_core(file_manager_core&&) noexcept;
    auto operator=(file_manager_core&&) noexcept -> file_manager_core&;

    /**
     * @brief Cancels outstanding requests and closes every session
     */
    ~file_manager_core();

    [[nodiscard]] static auto local_handle() -> provider_handle { return provider_handle::local(); }

    // Connections
    [[nodiscard]] auto connect(const remote_endpoint& endpoint) -> result<provider_handle>;
    auto disconnect(const provider_handle& handle) -> result<void>;
    auto reconnect(const provider_handle& handle) -> result<void>;
    [[nodiscard]] auto connection_state(const provider_handle& handle) const
        -> unified_fs::connection_state;
    [[nodiscard]] auto restore_sessions(const std::vector<saved_session>& sessions)
        -> std::vector<restore_outcome>;
    [[nodiscard]] auto active_connections() const -> std::vector<provider_handle>;

    // Browsing
    /**
     * @brief Incremental listing for a panel
     */
    [[nodiscard]] auto list(const provider_handle& provider,
                            const std::string& path,
                            std::optional<std::size_t> page_size = std::nullopt)
        -> result<entry_sequence>;

    // Requests
    auto submit(const operation_request& request) -> request_id;
    auto cancel(request_id id) -> bool;
    [[nodiscard]] auto status(request_id id) const -> std::optional<request_status>;
    [[nodiscard]] auto wait(request_id id, std::chrono::milliseconds timeout)
        -> std::optional<operation_result>;
    auto clear_completed() -> std::size_t;

    // Events
    [[nodiscard]] auto subscribe(event_bus::handler fn) -> event_bus::subscription_id;
    auto unsubscribe(event_bus::subscription_id id) -> bool;

    /**
     * @brief Wait until every event published so far was delivered
     */
    auto flush_events(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000})
        -> bool;

    auto set_bandwidth_limit(std::size_t bytes_per_second) -> void;

    [[nodiscard]] auto config() const -> const core_config&;

private:
    struct impl;

    explicit file_manager_core(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_CORE_FILE_MANAGER_CORE_H
