/**
 * @file transfer_engine.h
 * @brief Copy and move between any two providers
 */

#ifndef KCENON_UNIFIED_FS_TRANSFER_TRANSFER_ENGINE_H
#define KCENON_UNIFIED_FS_TRANSFER_TRANSFER_ENGINE_H

#include <kcenon/unified_fs/core/cancellation.h>
#include <kcenon/unified_fs/core/operation_types.h>
#include <kcenon/unified_fs/core/retry_policy.h>
#include <kcenon/unified_fs/queue/operation_request.h>

#include <cstddef>
#include <memory>

namespace kcenon::unified_fs {

class event_bus;
class provider_registry;

struct engine_config {
    /// Bytes per read/write round; 4 KiB to 1 MiB
    std::size_t chunk_size = 64 * 1024;

    /// Applied per item to connectivity failures
    retry_policy retry;

    /// Items of one request processed at once when both providers allow it
    std::size_t max_parallel_items = 1;

    /// Bytes per second shared by all transfers; 0 means unlimited
    std::size_t bandwidth_limit = 0;
};

/**
 * @brief Executes copy and move requests
 *
 * Sources are expanded depth-first into files. Each file is streamed in
 * chunks into a hidden temporary sibling of its destination
 * (".<name>.ufs-part"), committed, then renamed onto the final name, so
 * an interrupted or failed item never leaves a partial file under the
 * final name and never destroys the file it was meant to replace.
 *
 * Items that fail with connectivity_error are retried per the retry
 * policy. Other failures are final for the item; the batch continues
 * unless abort_on_error is set.
 *
 * A move deletes each source file only after its destination was
 * committed. Moves within one provider try a plain rename first.
 */
class transfer_engine {
public:
    transfer_engine(provider_registry& registry, event_bus& events, engine_config config = {});
    ~transfer_engine();

    transfer_engine(const transfer_engine&) = delete;
    transfer_engine& operator=(const transfer_engine&) = delete;

    /**
     * @brief Run a copy or move request to completion
     *
     * Blocks the calling worker. Progress and decision requests are
     * published on the event bus; the result is returned, not published.
     */
    [[nodiscard]] auto execute(const operation_request& request, const cancellation_token& token)
        -> operation_result;

    auto set_bandwidth_limit(std::size_t bytes_per_second) -> void;

    [[nodiscard]] auto config() const -> const engine_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::unified_fs

#endif  // KCENON_UNIFIED_FS_TRANSFER_TRANSFER_ENGINE_H
