/**
 * @file operation_queue.cpp
 * @brief Implementation of operation_queue
 */

#include <kcenon/unified_fs/queue/operation_queue.h>
#include <kcenon/unified_fs/adapters/thread_pool_adapter.h>
#include <kcenon/unified_fs/core/cancellation.h>
#include <kcenon/unified_fs/core/logging.h>
#include <kcenon/unified_fs/events/event_bus.h>
#include <kcenon/unified_fs/provider/provider_registry.h>
#include <kcenon/unified_fs/queue/operation_executor.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <limits>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace kcenon::unified_fs {

namespace {

constexpr auto unlimited = std::numeric_limits<std::size_t>::max();

auto cancelled_result(const operation_request& request, const std::string& reason)
    -> operation_result {
    operation_result out;
    out.id = request.id();
    out.kind = request.kind();
    out.status = operation_status::cancelled;
    for (const auto& source : request.sources()) {
        item_result item;
        item.source = source.path;
        if (request.destination()) {
            item.destination = request.destination()->path;
        }
        item.outcome = item_outcome::cancelled;
        item.reason = error{error_code::cancelled, reason};
        out.items.push_back(std::move(item));
    }
    return out;
}

auto crashed_result(const operation_request& request, const std::string& what)
    -> operation_result {
    operation_result out;
    out.id = request.id();
    out.kind = request.kind();
    out.status = operation_status::failed;
    for (const auto& source : request.sources()) {
        item_result item;
        item.source = source.path;
        item.outcome = item_outcome::failed;
        item.reason = error{error_code::unknown_failure, "request aborted", what};
        out.items.push_back(std::move(item));
    }
    return out;
}

}  // namespace

struct operation_queue::impl {
    struct record {
        operation_request request;
        cancellation_token token;
        request_state state = request_state::queued;
        std::optional<operation_result> result;
    };

    provider_registry& registry;
    event_bus& events;
    operation_executor& executor;
    std::shared_ptr<adapters::task_pool_interface> pool;
    queue_config config;

    mutable std::mutex mutex;
    std::condition_variable changed;
    std::unordered_map<request_id, record> records;
    std::deque<request_id> pending;
    std::unordered_map<uint64_t, std::size_t> slots_in_use;
    std::size_t running = 0;
    bool stopping = false;

    /// Completion of every task handed to the pool
    std::vector<std::future<void>> tasks;
    std::atomic<uint64_t> next_id{1};

    impl(provider_registry& reg,
         event_bus& bus,
         operation_executor& exec,
         std::shared_ptr<adapters::task_pool_interface> workers,
         queue_config cfg)
        : registry(reg),
          events(bus),
          executor(exec),
          pool(std::move(workers)),
          config(cfg) {}

    auto capacity(const provider_handle& handle) const -> std::size_t {
        auto provider = registry.find(handle);
        if (!provider) {
            // Let the request start and fail fast on the missing provider
            return unlimited;
        }
        if (handle.is_local()) {
            if (config.local_concurrency > 0) {
                return config.local_concurrency;
            }
            return pool ? std::max<std::size_t>(pool->worker_count(), 1) : 1;
        }
        return std::max<std::size_t>(provider.value()->capabilities().max_concurrency, 1);
    }

    auto slots_free(const operation_request& request) const -> bool {
        for (const auto& handle : request.providers()) {
            auto it = slots_in_use.find(handle.id());
            auto used = it == slots_in_use.end() ? 0 : it->second;
            if (used >= capacity(handle)) {
                return false;
            }
        }
        return true;
    }

    auto take_slots(const operation_request& request) -> void {
        for (const auto& handle : request.providers()) {
            ++slots_in_use[handle.id()];
        }
    }

    auto release_slots(const operation_request& request) -> void {
        for (const auto& handle : request.providers()) {
            auto it = slots_in_use.find(handle.id());
            if (it == slots_in_use.end()) {
                continue;
            }
            if (--it->second == 0) {
                slots_in_use.erase(it);
            }
        }
    }

    /**
     * @brief Start every queued request whose providers have free slots
     *
     * Must be called without the lock held.
     */
    auto schedule() -> void {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping) {
            return;
        }
        std::erase_if(tasks, [](const std::future<void>& task) {
            return task.wait_for(std::chrono::seconds{0}) == std::future_status::ready;
        });
        for (auto it = pending.begin(); it != pending.end();) {
            auto& rec = records.at(*it);
            if (!slots_free(rec.request)) {
                ++it;
                continue;
            }
            take_slots(rec.request);
            rec.state = request_state::running;
            ++running;
            auto id = *it;
            tasks.push_back(pool->submit([this, id] { run(id); }));
            it = pending.erase(it);
        }
    }

    /**
     * @brief Block until no pool task refers to this queue
     */
    auto join_tasks() -> void {
        while (true) {
            std::vector<std::future<void>> draining;
            {
                std::lock_guard<std::mutex> lock(mutex);
                draining.swap(tasks);
            }
            if (draining.empty()) {
                return;
            }
            for (auto& task : draining) {
                task.wait();
            }
        }
    }

    auto run(request_id id) -> void {
        std::optional<operation_request> request;
        cancellation_token token;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto& rec = records.at(id);
            request = rec.request;
            token = rec.token;
        }

        operation_result outcome;
        if (token.is_cancelled()) {
            outcome = cancelled_result(*request, "request cancelled before start");
        } else {
            UFS_LOG_DEBUG(log_category::queue,
                          "Starting " + id.to_string() + " (" + to_string(request->kind()) + ")");
            try {
                outcome = executor.execute(*request, token);
            } catch (const std::exception& e) {
                UFS_LOG_ERROR(log_category::queue,
                              "Request " + id.to_string() + " threw: " + e.what());
                outcome = crashed_result(*request, e.what());
            }
        }
        outcome.id = id;

        {
            std::lock_guard<std::mutex> lock(mutex);
            auto& rec = records.at(id);
            rec.state = request_state::terminal;
            rec.result = outcome;
        }
        events.publish(result_event{std::move(outcome)});

        // The worker counts as running until it no longer touches the bus
        {
            std::lock_guard<std::mutex> lock(mutex);
            release_slots(*request);
            --running;
        }
        changed.notify_all();
        schedule();
    }

    /**
     * @brief Finalize a request that never reached a worker
     *
     * Caller holds the lock and publishes the returned result after
     * releasing it.
     */
    auto finalize_queued(record& rec, const std::string& reason) -> operation_result {
        rec.token.cancel();
        rec.state = request_state::terminal;
        rec.result = cancelled_result(rec.request, reason);
        return *rec.result;
    }
};

operation_queue::operation_queue(provider_registry& registry,
                                 event_bus& events,
                                 operation_executor& executor,
                                 std::shared_ptr<adapters::task_pool_interface> pool,
                                 queue_config config)
    : impl_(std::make_shared<impl>(registry, events, executor, std::move(pool), config)) {}

operation_queue::~operation_queue() {
    shutdown();
    impl_->join_tasks();
}

auto operation_queue::submit(const operation_request& request) -> request_id {
    request_id id{impl_->next_id.fetch_add(1)};
    auto stamped = request.with_id(id);

    std::optional<operation_result> rejected;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto [it, inserted] = impl_->records.emplace(id, impl::record{stamped, {}, {}, {}});
        if (impl_->stopping) {
            rejected = impl_->finalize_queued(it->second, "queue is shut down");
        } else {
            impl_->pending.push_back(id);
        }
    }

    operation_log_context ctx;
    ctx.request_id = id.to_string();
    ctx.path = request.sources().empty() ? std::string{} : request.sources().front().path;
    UFS_LOG_DEBUG_CTX(log_category::queue,
                      std::string("Queued ") + to_string(request.kind()), ctx);

    if (rejected) {
        impl_->events.publish(result_event{std::move(*rejected)});
        impl_->changed.notify_all();
        return id;
    }
    impl_->schedule();
    return id;
}

auto operation_queue::cancel(request_id id) -> bool {
    std::optional<operation_result> finalized;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto it = impl_->records.find(id);
        if (it == impl_->records.end()) {
            return false;
        }
        auto& rec = it->second;
        switch (rec.state) {
            case request_state::terminal:
                return false;
            case request_state::running:
                rec.token.cancel();
                UFS_LOG_INFO(log_category::queue, "Cancelling running " + id.to_string());
                return true;
            case request_state::queued:
            default:
                std::erase(impl_->pending, id);
                finalized = impl_->finalize_queued(rec, "request cancelled");
                break;
        }
    }

    UFS_LOG_INFO(log_category::queue, "Cancelled queued " + id.to_string());
    impl_->events.publish(result_event{std::move(*finalized)});
    impl_->changed.notify_all();
    return true;
}

auto operation_queue::status(request_id id) const -> std::optional<request_status> {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->records.find(id);
    if (it == impl_->records.end()) {
        return std::nullopt;
    }
    request_status snapshot;
    snapshot.state = it->second.state;
    snapshot.result = it->second.result;
    return snapshot;
}

auto operation_queue::wait(request_id id, std::chrono::milliseconds timeout)
    -> std::optional<operation_result> {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    auto terminal = [&] {
        auto it = impl_->records.find(id);
        return it == impl_->records.end() || it->second.state == request_state::terminal;
    };
    if (!impl_->changed.wait_for(lock, timeout, terminal)) {
        return std::nullopt;
    }
    auto it = impl_->records.find(id);
    if (it == impl_->records.end()) {
        return std::nullopt;
    }
    return it->second.result;
}

auto operation_queue::clear_completed() -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return std::erase_if(impl_->records, [](const auto& entry) {
        return entry.second.state == request_state::terminal;
    });
}

auto operation_queue::queued_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->pending.size();
}

auto operation_queue::running_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->running;
}

auto operation_queue::shutdown() -> void {
    std::vector<operation_result> finalized;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) {
            return;
        }
        impl_->stopping = true;
        for (auto id : impl_->pending) {
            finalized.push_back(impl_->finalize_queued(impl_->records.at(id), "queue is shut down"));
        }
        impl_->pending.clear();
        for (auto& [id, rec] : impl_->records) {
            if (rec.state == request_state::running) {
                rec.token.cancel();
            }
        }
    }

    for (auto& result : finalized) {
        impl_->events.publish(result_event{std::move(result)});
    }
    impl_->changed.notify_all();

    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->changed.wait(lock, [this] { return impl_->running == 0; });
    UFS_LOG_INFO(log_category::queue, "Operation queue stopped");
}

}  // namespace kcenon::unified_fs
