/**
 * @file conflict_resolver.h
 * @brief Applies the overwrite policy to destination name collisions
 */

#ifndef KCENON_UNIFIED_FS_TRANSFER_CONFLICT_RESOLVER_H
#define KCENON_UNIFIED_FS_TRANSFER_CONFLICT_RESOLVER_H

#include <kcenon/unified_fs/core/entry_metadata.h>
#include <kcenon/unified_fs/core/operation_types.h>
#include <kcenon/unified_fs/core/types.h>
#include <kcenon/unified_fs/events/event_types.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kcenon::unified_fs {

class event_bus;
class filesystem_provider;

/**
 * @brief Per-request collision handling
 *
 * Policies other than prompt decide immediately. Under prompt, the first
 * answer given with apply_to_all becomes sticky and decides every later
 * collision of the same request without asking again.
 */
class conflict_resolver {
public:
    conflict_resolver(request_id request, overwrite_policy policy, event_bus* events);

    /**
     * @brief Decision that needs no user input, if any
     */
    [[nodiscard]] auto decide_without_prompt() const -> std::optional<conflict_action>;

    /**
     * @brief Publish a decision request for one collision
     * @return The reply channel, or nullptr when nobody can answer
     */
    [[nodiscard]] auto ask(const std::string& source_path,
                           const std::string& destination_path,
                           const entry_metadata& existing) -> std::shared_ptr<decision_channel>;

    /**
     * @brief Remember an answer; apply_to_all answers become sticky
     */
    auto record(const conflict_decision& decision) -> void;

    /**
     * @brief First free "name (n).ext" next to @p destination
     */
    [[nodiscard]] static auto free_name(filesystem_provider& provider,
                                        const std::string& destination) -> result<std::string>;

    [[nodiscard]] auto policy() const -> overwrite_policy { return policy_; }

private:
    request_id request_;
    overwrite_policy policy_;
    event_bus* events_;

    mutable std::mutex mutex_;
    std::optional<conflict_action> sticky_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_TRANSFER_CONFLICT_RESOLVER_H
