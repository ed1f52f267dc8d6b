/**
 * @file operation_executor.h
 * @brief Runs one request of any kind against the providers
 */

#ifndef KCENON_UNIFIED_FS_QUEUE_OPERATION_EXECUTOR_H
#define KCENON_UNIFIED_FS_QUEUE_OPERATION_EXECUTOR_H

#include <kcenon/unified_fs/core/cancellation.h>
#include <kcenon/unified_fs/core/operation_types.h>
#include <kcenon/unified_fs/queue/operation_request.h>

namespace kcenon::unified_fs {

class event_bus;
class filesystem_provider;
class provider_registry;
class transfer_engine;

/**
 * @brief Dispatches requests by kind
 *
 * Copy and move go to the transfer engine. List, remove, rename and mkdir
 * run directly on the provider; they are not retried automatically.
 */
class operation_executor {
public:
    operation_executor(provider_registry& registry, event_bus& events, transfer_engine& engine);
    virtual ~operation_executor() = default;

    [[nodiscard]] virtual auto execute(const operation_request& request,
                                       const cancellation_token& token) -> operation_result;

private:
    auto run_list(const operation_request& request, operation_result& out) -> void;
    auto run_remove(const operation_request& request,
                    const cancellation_token& token,
                    operation_result& out) -> void;
    auto run_rename(const operation_request& request,
                    const cancellation_token& token,
                    operation_result& out) -> void;
    auto run_mkdir(const operation_request& request, operation_result& out) -> void;

    auto remove_tree(filesystem_provider& provider,
                     const std::string& path,
                     const cancellation_token& token) -> result<void>;

    provider_registry& registry_;
    event_bus& events_;
    transfer_engine& engine_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_QUEUE_OPERATION_EXECUTOR_H
