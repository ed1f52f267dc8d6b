/**
 * @file connection_manager.cpp
 * @brief Implementation of connection_manager
 */

#include <kcenon/unified_fs/session/connection_manager.h>
#include <kcenon/unified_fs/core/logging.h>
#include <kcenon/unified_fs/core/path_identity.h>
#include <kcenon/unified_fs/events/event_bus.h>
#include <kcenon/unified_fs/provider/provider_registry.h>
#include <kcenon/unified_fs/provider/remote_provider.h>
#include <kcenon/unified_fs/session/remote_connection.h>

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace kcenon::unified_fs {

namespace {

auto log_context_for(const remote_endpoint& endpoint) -> operation_log_context {
    operation_log_context ctx;
    ctx.remote_host = endpoint.host + ":" + std::to_string(endpoint.port);
    ctx.provider = "remote";
    return ctx;
}

}  // namespace

struct connection_manager::impl {
    struct entry {
        remote_endpoint endpoint;
        std::shared_ptr<remote_connection> connection;
        std::shared_ptr<std::mutex> recovery_mutex = std::make_shared<std::mutex>();
    };

    std::shared_ptr<sftp::session_factory> factory;
    std::shared_ptr<sftp::credential_store> credentials;
    provider_registry& registry;
    event_bus* events;
    connection_config config;

    mutable std::mutex mutex;
    std::map<uint64_t, entry> connections;
    std::atomic<uint64_t> next_id{1};

    std::mutex stop_mutex;
    std::condition_variable stop_cv;
    bool stopping = false;
    std::thread monitor;

    impl(std::shared_ptr<sftp::session_factory> f,
         std::shared_ptr<sftp::credential_store> c,
         provider_registry& r,
         event_bus* e,
         connection_config cfg)
        : factory(std::move(f))
        , credentials(std::move(c))
        , registry(r)
        , events(e)
        , config(std::move(cfg)) {}

    auto publish(const provider_handle& handle,
                 connection_state state,
                 std::optional<error> reason = std::nullopt) -> void {
        if (events) {
            events->publish(connectivity_event{handle, state, std::move(reason)});
        }
    }

    auto find(uint64_t id) const -> std::optional<entry> {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = connections.find(id);
        if (it == connections.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @return false when shutdown interrupted the wait
     */
    auto wait_or_stop(std::chrono::milliseconds delay) -> bool {
        std::unique_lock<std::mutex> lock(stop_mutex);
        return !stop_cv.wait_for(lock, delay, [this] { return stopping; });
    }

    auto open_once(const remote_endpoint& endpoint, const sftp::credential& secret)
        -> result<std::unique_ptr<sftp::sftp_session>> {
        sftp::session_options options;
        options.connect_timeout = config.connect_timeout;
        options.io_timeout = config.heartbeat_timeout;
        return factory->open(endpoint, secret, options);
    }

    auto resolve(const remote_endpoint& endpoint) -> result<sftp::credential> {
        if (!credentials) {
            return unexpected{error{error_code::authentication_error,
                                    "no credential store configured"}};
        }
        auto secret = credentials->resolve(endpoint.credential);
        if (!secret) {
            return unexpected{error{error_code::authentication_error, secret.error().message,
                                    secret.error().cause}};
        }
        return secret;
    }

    /**
     * @brief Open a session, retrying connectivity failures per policy
     */
    auto open_with_retry(const remote_endpoint& endpoint)
        -> result<std::unique_ptr<sftp::sftp_session>> {
        if (!factory) {
            return unexpected{error{error_code::connectivity_error, "SFTP support not built"}};
        }
        auto secret = resolve(endpoint);
        if (!secret) {
            return unexpected{secret.error()};
        }

        auto ctx = log_context_for(endpoint);
        uint32_t failures = 0;
        while (true) {
            auto session = open_once(endpoint, secret.value());
            if (session) {
                return session;
            }

            ++failures;
            auto delay = config.retry.next_delay(failures, session.error().code);
            if (!delay) {
                return unexpected{session.error()};
            }

            ctx.attempt = failures;
            ctx.error_message = session.error().describe();
            UFS_LOG_WARN_CTX(log_category::session,
                             "Connect attempt failed, retrying in " +
                                 std::to_string(delay->count()) + "ms",
                             ctx);
            if (!wait_or_stop(*delay)) {
                return unexpected{error{error_code::cancelled, "connection manager shut down"}};
            }
        }
    }

    auto check_initial_path(sftp::sftp_session& session, const std::string& path)
        -> result<void> {
        auto attrs = session.lstat(path);
        if (!attrs) {
            if (attrs.error().code == error_code::not_found) {
                return unexpected{error{error_code::not_found,
                                        "initial path does not exist: " + path}};
            }
            return unexpected{attrs.error()};
        }
        if (attrs.value().kind != entry_kind::directory) {
            return unexpected{error{error_code::not_a_directory,
                                    "initial path is not a directory: " + path}};
        }
        return {};
    }

    /**
     * @brief Handle transport loss reported by a session of @p generation
     *
     * Only the first report per generation acts: the connection turns
     * degraded, one reconnect is attempted, and the connection ends
     * ready or disconnected.
     */
    auto recover(uint64_t id, const error& cause, uint64_t generation) -> void {
        auto found = find(id);
        if (!found) {
            return;
        }
        auto& conn = *found->connection;

        std::unique_lock<std::mutex> guard(*found->recovery_mutex, std::try_to_lock);
        if (!guard.owns_lock()) {
            return;
        }
        if (conn.state() != connection_state::ready || conn.generation() != generation) {
            return;
        }

        auto ctx = log_context_for(found->endpoint);
        ctx.error_message = cause.describe();
        UFS_LOG_WARN_CTX(log_category::session, "Session " + conn.handle().label() + " degraded",
                         ctx);
        conn.set_state(connection_state::degraded);
        publish(conn.handle(), connection_state::degraded, cause);

        auto secret = resolve(found->endpoint);
        if (secret) {
            auto session = open_once(found->endpoint, secret.value());
            if (session) {
                conn.install(std::move(session.value()));
                conn.set_state(connection_state::ready);
                UFS_LOG_INFO_CTX(log_category::session,
                                 "Session " + conn.handle().label() + " re-established", ctx);
                publish(conn.handle(), connection_state::ready);
                return;
            }
            ctx.error_message = session.error().describe();
        } else {
            ctx.error_message = secret.error().describe();
        }

        conn.release();
        UFS_LOG_ERROR_CTX(log_category::session,
                          "Session " + conn.handle().label() + " lost", ctx);
        publish(conn.handle(), connection_state::disconnected, cause);
    }

    auto probe(const entry& target) -> void {
        auto& conn = *target.connection;
        if (conn.state() != connection_state::ready) {
            return;
        }
        auto generation = conn.generation();
        auto alive = conn.try_keepalive(config.heartbeat_timeout);
        if (!alive) {
            // Busy with a long exchange, which proves the session is alive
            return;
        }
        if (alive->has_value()) {
            return;
        }
        if (alive->error().code != error_code::connectivity_error) {
            UFS_LOG_DEBUG(log_category::session,
                          "Keep-alive on " + conn.handle().label() + " answered with " +
                              alive->error().describe());
            return;
        }
        recover(conn.handle().id(), alive->error(), generation);
    }

    auto snapshot() const -> std::vector<entry> {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<entry> out;
        out.reserve(connections.size());
        for (const auto& [id, e] : connections) {
            out.push_back(e);
        }
        return out;
    }

    auto run_heartbeat() -> void {
        while (true) {
            {
                std::unique_lock<std::mutex> lock(stop_mutex);
                if (stop_cv.wait_for(lock, config.heartbeat_interval, [this] { return stopping; })) {
                    return;
                }
            }
            for (const auto& target : snapshot()) {
                probe(target);
            }
        }
    }
};

connection_manager::connection_manager(std::shared_ptr<sftp::session_factory> factory,
                                       std::shared_ptr<sftp::credential_store> credentials,
                                       provider_registry& registry,
                                       event_bus* events,
                                       connection_config config)
    : impl_(std::make_unique<impl>(std::move(factory), std::move(credentials), registry, events,
                                   std::move(config))) {
    if (impl_->config.heartbeat_interval.count() > 0) {
        impl_->monitor = std::thread([this] { impl_->run_heartbeat(); });
    }
}

connection_manager::~connection_manager() {
    shutdown();
}

auto connection_manager::connect(const remote_endpoint& endpoint) -> result<provider_handle> {
    provider_handle handle(impl_->next_id.fetch_add(1), endpoint);
    auto connection = std::make_shared<remote_connection>(handle);
    auto initial = path_identity::normalize(provider_kind::remote, endpoint.initial_path);
    auto ctx = log_context_for(endpoint);
    ctx.path = initial;

    connection->set_state(connection_state::connecting);
    impl_->publish(handle, connection_state::connecting);
    UFS_LOG_INFO_CTX(log_category::session, "Connecting " + handle.label(), ctx);

    auto fail = [&](const error& err) -> result<provider_handle> {
        connection->set_state(connection_state::disconnected);
        ctx.error_message = err.describe();
        UFS_LOG_ERROR_CTX(log_category::session, "Connect failed for " + handle.label(), ctx);
        impl_->publish(handle, connection_state::disconnected, err);
        return unexpected{err};
    };

    auto session = impl_->open_with_retry(endpoint);
    if (!session) {
        return fail(session.error());
    }

    connection->set_state(connection_state::authenticated);
    impl_->publish(handle, connection_state::authenticated);

    auto checked = impl_->check_initial_path(*session.value(), initial);
    if (!checked) {
        session.value()->close();
        return fail(checked.error());
    }

    connection->install(std::move(session.value()));
    auto id = handle.id();
    auto* owner = impl_.get();
    connection->set_failure_handler([owner, id](const error& err, uint64_t generation) {
        owner->recover(id, err, generation);
    });

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->connections.emplace(id, impl::entry{endpoint, connection});
    }
    impl_->registry.add(
        std::make_shared<remote_provider>(connection, impl_->config.multiplexed_concurrency));

    connection->set_state(connection_state::ready);
    impl_->publish(handle, connection_state::ready);
    UFS_LOG_INFO_CTX(log_category::session, "Connected " + handle.label(), ctx);
    return handle;
}

auto connection_manager::disconnect(const provider_handle& handle) -> result<void> {
    std::optional<impl::entry> removed;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->connections.find(handle.id());
        if (it != impl_->connections.end()) {
            removed = std::move(it->second);
            impl_->connections.erase(it);
        }
    }
    if (!removed) {
        return unexpected{error{error_code::invalid_argument,
                                "unknown provider handle: " + handle.label()}};
    }

    removed->connection->set_failure_handler(nullptr);
    removed->connection->release();
    impl_->registry.remove(handle);
    UFS_LOG_INFO(log_category::session, "Disconnected " + handle.label());
    impl_->publish(handle, connection_state::disconnected);
    return {};
}

auto connection_manager::state(const provider_handle& handle) const -> connection_state {
    auto found = impl_->find(handle.id());
    return found ? found->connection->state() : connection_state::disconnected;
}

auto connection_manager::reconnect(const provider_handle& handle) -> result<void> {
    auto found = impl_->find(handle.id());
    if (!found) {
        return unexpected{error{error_code::invalid_argument,
                                "unknown provider handle: " + handle.label()}};
    }
    std::lock_guard<std::mutex> guard(*found->recovery_mutex);
    auto& conn = *found->connection;

    conn.set_state(connection_state::connecting);
    impl_->publish(handle, connection_state::connecting);

    auto session = impl_->open_with_retry(found->endpoint);
    if (!session) {
        conn.release();
        impl_->publish(handle, connection_state::disconnected, session.error());
        return unexpected{session.error()};
    }

    conn.install(std::move(session.value()));
    conn.set_state(connection_state::ready);
    UFS_LOG_INFO(log_category::session, "Reconnected " + handle.label());
    impl_->publish(handle, connection_state::ready);
    return {};
}

auto connection_manager::heartbeat_now(const provider_handle& handle) -> void {
    auto found = impl_->find(handle.id());
    if (found) {
        impl_->probe(*found);
    }
}

auto connection_manager::restore_sessions(const std::vector<saved_session>& sessions)
    -> std::vector<restore_outcome> {
    std::vector<restore_outcome> outcomes;
    outcomes.reserve(sessions.size());

    for (const auto& saved : sessions) {
        restore_outcome outcome;
        outcome.session = saved;

        auto handle = connect(saved.endpoint);
        if (!handle) {
            outcome.failure = handle.error();
            outcomes.push_back(std::move(outcome));
            continue;
        }
        outcome.handle = handle.value();
        outcome.path = path_identity::normalize(provider_kind::remote, saved.endpoint.initial_path);

        if (!saved.last_path.empty()) {
            auto provider = impl_->registry.find(handle.value());
            if (provider) {
                auto last = provider.value()->stat(saved.last_path);
                if (last && last.value().is_directory()) {
                    outcome.path = last.value().path();
                } else {
                    UFS_LOG_INFO(log_category::session,
                                 "Last path of " + handle.value().label() +
                                     " is gone, using the initial path");
                }
            }
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

auto connection_manager::active_handles() const -> std::vector<provider_handle> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<provider_handle> handles;
    handles.reserve(impl_->connections.size());
    for (const auto& [id, e] : impl_->connections) {
        handles.push_back(e.connection->handle());
    }
    return handles;
}

auto connection_manager::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(impl_->stop_mutex);
        impl_->stopping = true;
    }
    impl_->stop_cv.notify_all();
    if (impl_->monitor.joinable()) {
        impl_->monitor.join();
    }

    for (const auto& handle : active_handles()) {
        auto closed = disconnect(handle);
        if (!closed) {
            UFS_LOG_DEBUG(log_category::session, closed.error().describe());
        }
    }
}

}  // namespace kcenon::unified_fs
