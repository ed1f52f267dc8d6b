/**
 * @file operation_types.h
 * @brief Operation kinds, options and per-item outcomes
 */

#ifndef KCENON_UNIFIED_FS_CORE_OPERATION_TYPES_H
#define KCENON_UNIFIED_FS_CORE_OPERATION_TYPES_H

#include <kcenon/unified_fs/core/entry_metadata.h>
#include <kcenon/unified_fs/core/types.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::unified_fs {

enum class operation_kind {
    list,
    copy,
    move,
    remove,
    rename,
    mkdir
};

[[nodiscard]] constexpr auto to_string(operation_kind kind) -> const char* {
    switch (kind) {
        case operation_kind::list:
            return "list";
        case operation_kind::copy:
            return "copy";
        case operation_kind::move:
            return "move";
        case operation_kind::remove:
            return "remove";
        case operation_kind::rename:
            return "rename";
        case operation_kind::mkdir:
            return "mkdir";
        default:
            return "unknown";
    }
}

/**
 * @brief What to do when the destination name already exists
 */
enum class overwrite_policy {
    skip,                ///< Keep the existing entry, item is skipped
    overwrite,           ///< Replace the existing entry
    rename_with_suffix,  ///< Write to "name (n).ext" instead
    prompt               ///< Ask the presentation layer through the event bus
};

[[nodiscard]] constexpr auto to_string(overwrite_policy policy) -> const char* {
    switch (policy) {
        case overwrite_policy::skip:
            return "skip";
        case overwrite_policy::overwrite:
            return "overwrite";
        case overwrite_policy::rename_with_suffix:
            return "rename_with_suffix";
        case overwrite_policy::prompt:
            return "prompt";
        default:
            return "unknown";
    }
}

/**
 * @brief Answer to a conflict decision request
 */
enum class conflict_action {
    skip,
    overwrite,
    rename,
    cancel
};

struct conflict_decision {
    conflict_action action = conflict_action::skip;

    /// Apply the same action to every later collision of the request
    bool apply_to_all = false;
};

enum class item_outcome {
    succeeded,
    skipped,
    failed,
    cancelled
};

[[nodiscard]] constexpr auto to_string(item_outcome outcome) -> const char* {
    switch (outcome) {
        case item_outcome::succeeded:
            return "succeeded";
        case item_outcome::skipped:
            return "skipped";
        case item_outcome::failed:
            return "failed";
        case item_outcome::cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

/**
 * @brief Outcome of one resolved item of a batch
 */
struct item_result {
    std::string source;
    std::string destination;
    item_outcome outcome = item_outcome::succeeded;
    std::optional<error> reason;
    uint64_t bytes = 0;
};

/**
 * @brief Terminal status of a request
 *
 * A batch in which some items failed is still completed unless it was
 * aborted or nothing succeeded; item_result lists the failures.
 */
enum class operation_status {
    completed,
    cancelled,
    failed
};

[[nodiscard]] constexpr auto to_string(operation_status status) -> const char* {
    switch (status) {
        case operation_status::completed:
            return "completed";
        case operation_status::cancelled:
            return "cancelled";
        case operation_status::failed:
            return "failed";
        default:
            return "unknown";
    }
}

/**
 * @brief Final result of one request, produced exactly once
 */
struct operation_result {
    request_id id;
    operation_kind kind = operation_kind::copy;
    operation_status status = operation_status::completed;
    std::vector<item_result> items;
    uint64_t bytes_transferred = 0;
    std::chrono::milliseconds wall_time{0};

    /// Entries of a list request, in provider order
    std::vector<entry_metadata> entries;

    [[nodiscard]] auto count(item_outcome outcome) const -> std::size_t {
        return static_cast<std::size_t>(std::count_if(
            items.begin(), items.end(),
            [outcome](const item_result& item) { return item.outcome == outcome; }));
    }

    [[nodiscard]] auto all_succeeded() const -> bool {
        return count(item_outcome::succeeded) == items.size();
    }
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_CORE_OPERATION_TYPES_H
