/**
 * @file operation_queue.h
 * @brief Asynchronous execution of operation requests on a bounded pool
 */

#ifndef KCENON_UNIFIED_FS_QUEUE_OPERATION_QUEUE_H
#define KCENON_UNIFIED_FS_QUEUE_OPERATION_QUEUE_H

#include <kcenon/unified_fs/core/operation_types.h>
#include <kcenon/unified_fs/queue/operation_request.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>

namespace kcenon::unified_fs {

namespace adapters {
class task_pool_interface;
}

class event_bus;
class operation_executor;
class provider_registry;

enum class request_state {
    queued,
    running,
    terminal
};

[[nodiscard]] constexpr auto to_string(request_state state) -> const char* {
    switch (state) {
        case request_state::queued:
            return "queued";
        case request_state::running:
            return "running";
        case request_state::terminal:
            return "terminal";
        default:
            return "unknown";
    }
}

/**
 * @brief Snapshot returned by operation_queue::status()
 */
struct request_status {
    request_state state = request_state::queued;
    /// Set once the request is terminal
    std::optional<operation_result> result;
};

struct queue_config {
    /// Requests allowed on the local provider at once; 0 means worker count
    std::size_t local_concurrency = 0;
};

/**
 * @brief Schedules requests onto the worker pool
 *
 * A request holds one slot on every provider it touches for as long as it
 * runs. Remote providers grant as many slots as their capabilities allow
 * (one for a protocol-serialized session). Requests whose providers are
 * saturated stay queued while later requests for free providers start.
 *
 * Every submitted request produces exactly one result_event, also when it
 * is cancelled while queued or when the queue shuts down.
 *
 * @code
 * auto id = queue.submit(request);
 * auto done = queue.wait(id, std::chrono::seconds{30});
 * @endcode
 */
class operation_queue {
public:
    operation_queue(provider_registry& registry,
                    event_bus& events,
                    operation_executor& executor,
                    std::shared_ptr<adapters::task_pool_interface> pool,
                    queue_config config = {});

    /**
     * @brief Cancels outstanding requests and waits for running ones
     */
    ~operation_queue();

    operation_queue(const operation_queue&) = delete;
    operation_queue& operator=(const operation_queue&) = delete;

    /**
     * @brief Enqueue a request; never blocks on its execution
     * @return Id assigned to the request
     */
    auto submit(const operation_request& request) -> request_id;

    /**
     * @brief Cancel a request
     *
     * A queued request is finalized as cancelled right away, a running one
     * stops at its next safe point. Terminal requests are left alone.
     *
     * @return false when the id is unknown or already terminal
     */
    auto cancel(request_id id) -> bool;

    [[nodiscard]] auto status(request_id id) const -> std::optional<request_status>;

    /**
     * @brief Block until the request is terminal
     * @return The result, or nullopt on timeout or unknown id
     */
    [[nodiscard]] auto wait(request_id id, std::chrono::milliseconds timeout)
        -> std::optional<operation_result>;

    /**
     * @brief Forget the results of terminal requests
     * @return Number of results dropped
     */
    auto clear_completed() -> std::size_t;

    [[nodiscard]] auto queued_count() const -> std::size_t;
    [[nodiscard]] auto running_count() const -> std::size_t;

    /**
     * @brief Stop accepting work, cancel everything and wait for workers
     *
     * Requests submitted afterwards are finalized as cancelled.
     */
    auto shutdown() -> void;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_QUEUE_OPERATION_QUEUE_H
