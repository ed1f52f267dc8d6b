/**
 * @file event_types.h
 * @brief Events published to the UI thread
 */

#ifndef KCENON_UNIFIED_FS_EVENTS_EVENT_TYPES_H
#define KCENON_UNIFIED_FS_EVENTS_EVENT_TYPES_H

#include <kcenon/unified_fs/core/entry_metadata.h>
#include <kcenon/unified_fs/core/operation_types.h>
#include <kcenon/unified_fs/core/provider_handle.h>
#include <kcenon/unified_fs/core/types.h>
#include <kcenon/unified_fs/session/connection_types.h>

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace kcenon::unified_fs {

/**
 * @brief Bytes moved so far for one item and its batch
 *
 * Published after each chunk. Zero-byte files publish once with both
 * counters at 0.
 */
struct progress_event {
    request_id request;
    std::string item_path;
    uint64_t bytes_so_far = 0;
    uint64_t bytes_total = 0;
    uint64_t batch_bytes_so_far = 0;
    uint64_t batch_bytes_total = 0;
    std::size_t item_index = 0;
    std::size_t item_count = 0;
};

/**
 * @brief Terminal result of a request; published exactly once per request
 */
struct result_event {
    operation_result result;
};

/**
 * @brief Connection state change of a remote provider handle
 */
struct connectivity_event {
    provider_handle handle;
    connection_state state = connection_state::disconnected;
    std::optional<error> reason;
};

/**
 * @brief Single-use reply slot shared by a prompt and the waiting worker
 */
class decision_channel {
public:
    decision_channel() : future_(promise_.get_future()) {}

    /**
     * @return false when the prompt was already answered
     */
    auto answer(conflict_decision decision) -> bool {
        if (answered_.exchange(true)) {
            return false;
        }
        promise_.set_value(decision);
        return true;
    }

    [[nodiscard]] auto answered() const -> bool { return answered_.load(); }

    /**
     * @brief Block until answered
     */
    [[nodiscard]] auto wait() -> conflict_decision { return future_.get(); }

    /**
     * @brief Wait at most @p timeout
     */
    template <typename Rep, typename Period>
    [[nodiscard]] auto wait_for(std::chrono::duration<Rep, Period> timeout)
        -> std::optional<conflict_decision> {
        if (future_.wait_for(timeout) != std::future_status::ready) {
            return std::nullopt;
        }
        return future_.get();
    }

private:
    std::promise<conflict_decision> promise_;
    std::future<conflict_decision> future_;
    std::atomic<bool> answered_{false};
};

/**
 * @brief Collision that needs a user decision under the prompt policy
 *
 * The item stays parked until respond() is called. Only the first call
 * counts.
 */
struct decision_request_event {
    request_id request;
    std::string source_path;
    std::string destination_path;
    std::optional<entry_metadata> existing;
    std::shared_ptr<decision_channel> channel;

    auto respond(conflict_decision decision) const -> bool {
        return channel && channel->answer(decision);
    }
};

using event = std::variant<progress_event, result_event, connectivity_event, decision_request_event>;

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_EVENTS_EVENT_TYPES_H
