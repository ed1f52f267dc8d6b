/**
 * @file file_manager_core.cpp
 * @brief Implementation of file_manager_core
 */

#include <kcenon/unified_fs/core/file_manager_core.h>
#include <kcenon/unified_fs/adapters/thread_pool_adapter.h>
#include <kcenon/unified_fs/config/feature_flags.h>
#include <kcenon/unified_fs/core/logging.h>
#include <kcenon/unified_fs/provider/local_provider.h>
#include <kcenon/unified_fs/provider/provider_registry.h>
#include <kcenon/unified_fs/queue/operation_executor.h>
#include <kcenon/unified_fs/session/connection_manager.h>
#include <kcenon/unified_fs/transfer/transfer_engine.h>

#if UNIFIED_FS_HAS_SFTP
#include <kcenon/unified_fs/sftp/libssh2_session.h>
#endif

namespace kcenon::unified_fs {

namespace {

constexpr std::size_t min_chunk_size = 4 * 1024;
constexpr std::size_t max_chunk_size = 1024 * 1024;

auto default_session_factory() -> std::shared_ptr<sftp::session_factory> {
#if UNIFIED_FS_HAS_SFTP
    return std::make_shared<sftp::libssh2_session_factory>();
#else
    return nullptr;
#endif
}

}  // namespace

struct file_manager_core::impl {
    core_config config;
    event_bus events;
    provider_registry registry;
    connection_manager connections;
    transfer_engine engine;
    operation_executor executor;
    directory_lister lister;
    std::shared_ptr<adapters::task_pool_interface> pool;
    operation_queue queue;

    impl(core_config cfg,
         std::shared_ptr<sftp::session_factory> factory,
         std::shared_ptr<sftp::credential_store> credentials,
         std::shared_ptr<adapters::task_pool_interface> workers)
        : config(cfg),
          registry(std::make_shared<local_provider>(cfg.local_concurrency)),
          connections(std::move(factory), std::move(credentials), registry, &events,
                      make_connection_config(cfg)),
          engine(registry, events, make_engine_config(cfg)),
          executor(registry, events, engine),
          lister(registry),
          pool(std::move(workers)),
          queue(registry, events, executor, pool, queue_config{cfg.local_concurrency}) {}

    ~impl() {
        queue.shutdown();
        connections.shutdown();
        events.stop();
    }

    static auto make_connection_config(const core_config& cfg) -> connection_config {
        connection_config out;
        out.retry = cfg.retry;
        out.connect_timeout = cfg.connect_timeout;
        out.heartbeat_interval = cfg.heartbeat_interval;
        out.heartbeat_timeout = cfg.heartbeat_timeout;
        out.multiplexed_concurrency = cfg.multiplexed_concurrency;
        return out;
    }

    static auto make_engine_config(const core_config& cfg) -> engine_config {
        engine_config out;
        out.chunk_size = cfg.chunk_size;
        out.retry = cfg.retry;
        out.max_parallel_items = cfg.max_parallel_items;
        out.bandwidth_limit = cfg.bandwidth_limit;
        return out;
    }
};

// ============================================================================
// builder
// ============================================================================

file_manager_core::builder::builder() = default;

auto file_manager_core::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto file_manager_core::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto file_manager_core::builder::with_max_parallel_items(std::size_t count) -> builder& {
    config_.max_parallel_items = count;
    return *this;
}

auto file_manager_core::builder::with_retry_policy(const retry_policy& policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto file_manager_core::builder::with_connect_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.connect_timeout = timeout;
    return *this;
}

auto file_manager_core::builder::with_heartbeat(std::chrono::milliseconds interval,
                                                std::chrono::milliseconds timeout) -> builder& {
    config_.heartbeat_interval = interval;
    config_.heartbeat_timeout = timeout;
    return *this;
}

auto file_manager_core::builder::with_bandwidth_limit(std::size_t bytes_per_second) -> builder& {
    config_.bandwidth_limit = bytes_per_second;
    return *this;
}

auto file_manager_core::builder::with_local_concurrency(std::size_t count) -> builder& {
    config_.local_concurrency = count;
    return *this;
}

auto file_manager_core::builder::with_multiplexed_concurrency(std::size_t count) -> builder& {
    config_.multiplexed_concurrency = count;
    return *this;
}

auto file_manager_core::builder::with_session_factory(
    std::shared_ptr<sftp::session_factory> factory) -> builder& {
    factory_ = std::move(factory);
    factory_set_ = true;
    return *this;
}

auto file_manager_core::builder::with_credential_store(
    std::shared_ptr<sftp::credential_store> store) -> builder& {
    credentials_ = std::move(store);
    return *this;
}

auto file_manager_core::builder::with_task_pool(
    std::shared_ptr<adapters::task_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto file_manager_core::builder::build() -> result<file_manager_core> {
    if (config_.chunk_size < min_chunk_size || config_.chunk_size > max_chunk_size) {
        return unexpected{error{error_code::invalid_argument,
                                "Chunk size must be between 4KB and 1MB"}};
    }
    if (config_.worker_count == 0) {
        return unexpected{error{error_code::invalid_argument,
                                "Worker count must be greater than zero"}};
    }
    if (config_.max_parallel_items == 0) {
        return unexpected{error{error_code::invalid_argument,
                                "Parallel item count must be greater than zero"}};
    }
    if (config_.multiplexed_concurrency == 0) {
        return unexpected{error{error_code::invalid_argument,
                                "Multiplexed concurrency must be greater than zero"}};
    }
    if (config_.connect_timeout.count() <= 0 || config_.heartbeat_timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_argument, "Timeouts must be positive"}};
    }
    if (config_.heartbeat_interval.count() < 0) {
        return unexpected{error{error_code::invalid_argument,
                                "Heartbeat interval must not be negative"}};
    }
    if (config_.retry.backoff_multiplier < 1.0 || config_.retry.initial_delay.count() < 0) {
        return unexpected{error{error_code::invalid_argument, "Invalid retry policy"}};
    }

    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    auto factory = factory_set_ ? factory_ : default_session_factory();
    auto credentials = credentials_ ? credentials_
                                    : std::make_shared<sftp::static_credential_store>();
    auto pool = pool_ ? pool_
                      : adapters::task_pool_factory::create(config_.worker_count,
                                                            "unified_fs_workers");

    UFS_LOG_INFO(log_category::queue,
                 "Starting file manager core with " + std::to_string(pool->worker_count()) +
                     " workers, chunk size " + std::to_string(config_.chunk_size));

    return file_manager_core{std::make_unique<impl>(config_, std::move(factory),
                                                    std::move(credentials), std::move(pool))};
}

// ============================================================================
// file_manager_core
// ============================================================================

file_manager_core::file_manager_core(std::unique_ptr<impl> state) : impl_(std::move(state)) {}

file_manager_core::file_manager_core(file_manager_core&&) noexcept = default;
auto file_manager_core::operator=(file_manager_core&&) noexcept -> file_manager_core& = default;
file_manager_core::~file_manager_core() = default;

auto file_manager_core::connect(const remote_endpoint& endpoint) -> result<provider_handle> {
    return impl_->connections.connect(endpoint);
}

auto file_manager_core::disconnect(const provider_handle& handle) -> result<void> {
    return impl_->connections.disconnect(handle);
}

auto file_manager_core::reconnect(const provider_handle& handle) -> result<void> {
    return impl_->connections.reconnect(handle);
}

auto file_manager_core::connection_state(const provider_handle& handle) const
    -> unified_fs::connection_state {
    if (handle.is_local()) {
        return unified_fs::connection_state::ready;
    }
    return impl_->connections.state(handle);
}

auto file_manager_core::restore_sessions(const std::vector<saved_session>& sessions)
    -> std::vector<restore_outcome> {
    return impl_->connections.restore_sessions(sessions);
}

auto file_manager_core::active_connections() const -> std::vector<provider_handle> {
    return impl_->connections.active_handles();
}

auto file_manager_core::list(const provider_handle& provider,
                             const std::string& path,
                             std::optional<std::size_t> page_size) -> result<entry_sequence> {
    return impl_->lister.list(provider, path, page_size);
}

auto file_manager_core::submit(const operation_request& request) -> request_id {
    return impl_->queue.submit(request);
}

auto file_manager_core::cancel(request_id id) -> bool {
    return impl_->queue.cancel(id);
}

auto file_manager_core::status(request_id id) const -> std::optional<request_status> {
    return impl_->queue.status(id);
}

auto file_manager_core::wait(request_id id, std::chrono::milliseconds timeout)
    -> std::optional<operation_result> {
    return impl_->queue.wait(id, timeout);
}

auto file_manager_core::clear_completed() -> std::size_t {
    return impl_->queue.clear_completed();
}

auto file_manager_core::subscribe(event_bus::handler fn) -> event_bus::subscription_id {
    return impl_->events.subscribe(std::move(fn));
}

auto file_manager_core::unsubscribe(event_bus::subscription_id id) -> bool {
    return impl_->events.unsubscribe(id);
}

auto file_manager_core::flush_events(std::chrono::milliseconds timeout) -> bool {
    return impl_->events.flush(timeout);
}

auto file_manager_core::set_bandwidth_limit(std::size_t bytes_per_second) -> void {
    impl_->engine.set_bandwidth_limit(bytes_per_second);
}

auto file_manager_core::config() const -> const core_config& {
    return impl_->config;
}

}  // namespace kcenon::unified_fs
