/**
 * @file event_bus.h
 * @brief Ordered delivery of engine events to subscribers
 */

#ifndef KCENON_UNIFIED_FS_EVENTS_EVENT_BUS_H
#define KCENON_UNIFIED_FS_EVENTS_EVENT_BUS_H

#include <kcenon/unified_fs/events/event_types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace kcenon::unified_fs {

/**
 * @brief Multi-subscriber event channel
 *
 * Workers publish without blocking; a single dispatcher thread delivers
 * events to every subscriber in publication order. Handlers therefore
 * never run on a worker thread and never run concurrently with each
 * other. A handler that throws is logged and does not stop delivery.
 *
 * @code
 * event_bus bus;
 * auto id = bus.subscribe([](const event& e) {
 *     if (auto* done = std::get_if<result_event>(&e)) {
 *         show(done->result);
 *     }
 * });
 * @endcode
 */
class event_bus {
public:
    using subscription_id = uint64_t;
    using handler = std::function<void(const event&)>;

    event_bus();
    ~event_bus();

    event_bus(const event_bus&) = delete;
    event_bus& operator=(const event_bus&) = delete;

    [[nodiscard]] auto subscribe(handler fn) -> subscription_id;

    /**
     * @return false when @p id was not subscribed
     *
     * Events already being delivered may still reach the handler.
     */
    auto unsubscribe(subscription_id id) -> bool;

    auto publish(event e) -> void;

    [[nodiscard]] auto subscriber_count() const -> std::size_t;

    /**
     * @brief Wait until every event published before this call was delivered
     * @return false on timeout
     */
    auto flush(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) -> bool;

    /**
     * @brief Deliver the remaining events and stop the dispatcher
     *
     * Events published afterwards are dropped.
     */
    auto stop() -> void;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_EVENTS_EVENT_BUS_H
